#include "harvest/fetch/payload.hpp"

#include <algorithm>
#include <fstream>
#include <string_view>
#include <system_error>

namespace harvest::fetch {
namespace fs = std::filesystem;

PayloadSignature::PayloadSignature(std::string magic) : magic_(std::move(magic)) {}

bool PayloadSignature::matches(const std::vector<std::uint8_t>& body) const noexcept {
    if (magic_.empty() || body.size() < magic_.size()) {
        return false;
    }
    return std::equal(magic_.begin(), magic_.end(), body.begin(),
                      [](char expected, std::uint8_t actual) {
                          return static_cast<unsigned char>(expected) == actual;
                      });
}

bool PayloadSignature::matches_file(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return false;
    }

    std::vector<std::uint8_t> head(magic_.size());
    input.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(input.gcount()));
    return matches(head);
}

bool contains_gate_marker(const std::vector<std::uint8_t>& body,
                          const std::vector<std::string>& markers) {
    const std::string_view text(reinterpret_cast<const char*>(body.data()), body.size());
    for (const auto& marker : markers) {
        if (!marker.empty() && text.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

} // namespace harvest::fetch
