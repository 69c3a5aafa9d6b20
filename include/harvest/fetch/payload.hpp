#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace harvest::fetch {

/**
 * @brief Magic-byte check for the expected payload type (e.g. "%PDF")
 *
 * Used both on freshly fetched bodies and on files already on disk, where a
 * match means the earlier download completed and can be skipped.
 */
class PayloadSignature {
public:
    explicit PayloadSignature(std::string magic);

    [[nodiscard]] bool matches(const std::vector<std::uint8_t>& body) const noexcept;

    /**
     * @brief True when @p path is a readable regular file starting with the magic bytes
     */
    [[nodiscard]] bool matches_file(const std::filesystem::path& path) const;

    [[nodiscard]] const std::string& magic() const noexcept { return magic_; }

private:
    std::string magic_;
};

/**
 * @brief Detect a re-presented verification gate inside a non-payload body
 */
bool contains_gate_marker(const std::vector<std::uint8_t>& body,
                          const std::vector<std::string>& markers);

} // namespace harvest::fetch
