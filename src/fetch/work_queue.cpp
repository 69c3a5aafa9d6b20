#include "harvest/fetch/work_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace harvest::fetch {
namespace {

std::string trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(text.rbegin(), text.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

} // namespace

bool has_extension(const std::string& filename, const std::string& extension) {
    if (extension.size() > filename.size()) {
        return false;
    }
    return std::equal(extension.rbegin(), extension.rend(), filename.rbegin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::optional<std::string> filename_from_url(const std::string& url) {
    std::string path = url;
    if (const auto cut = path.find_first_of("?#"); cut != std::string::npos) {
        path.erase(cut);
    }

    const auto scheme = path.find("://");
    const auto path_start = path.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path_start == std::string::npos) {
        return std::nullopt;
    }

    const auto slash = path.find_last_of('/');
    std::string name = path.substr(slash + 1);
    if (name.empty() || name == "." || name == ".." || name.find('\\') != std::string::npos) {
        return std::nullopt;
    }
    return name;
}

std::vector<WorkItem> parse_work_queue(std::istream& input, const std::string& extension) {
    std::vector<WorkItem> items;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        const std::string url = trim(line);
        if (url.empty() || url.rfind("http", 0) != 0) {
            continue;
        }

        auto filename = filename_from_url(url);
        if (!filename) {
            spdlog::warn("URL list line {}: cannot derive a filename from {}", line_number, url);
            continue;
        }
        if (!extension.empty() && !has_extension(*filename, extension)) {
            continue;
        }
        items.push_back(WorkItem{std::move(*filename), url});
    }
    return items;
}

Result<std::vector<WorkItem>> load_work_queue(const std::filesystem::path& url_list,
                                              const std::string& extension) {
    std::ifstream input(url_list);
    if (!input) {
        return Err<std::vector<WorkItem>>(ErrorCode::IoError,
                                          "failed to open URL list: " + url_list.string());
    }

    auto items = parse_work_queue(input, extension);
    if (input.bad()) {
        return Err<std::vector<WorkItem>>(ErrorCode::IoError,
                                          "failed reading URL list: " + url_list.string());
    }
    spdlog::info("Loaded {} work items from {}", items.size(), url_list.string());
    return Ok(std::move(items));
}

} // namespace harvest::fetch
