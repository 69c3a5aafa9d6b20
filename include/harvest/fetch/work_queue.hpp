#pragma once

#include "harvest/core/result.hpp"
#include "harvest/fetch/types.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace harvest::fetch {

/**
 * @brief Case-insensitive suffix match, e.g. "Report.PDF" has ".pdf"
 */
bool has_extension(const std::string& filename, const std::string& extension);

/**
 * @brief Derive the on-disk filename from a URL's last path segment
 *
 * Query string and fragment are ignored. Returns nullopt for URLs whose last
 * segment is empty, "." or "..".
 */
std::optional<std::string> filename_from_url(const std::string& url);

/**
 * @brief Parse a URL list, one URL per line
 *
 * Lines that are blank or do not start with "http" are ignored, as are URLs
 * whose filename does not end with @p extension (case-insensitive; an empty
 * extension accepts everything). Order is preserved so indices stay stable
 * across runs.
 */
std::vector<WorkItem> parse_work_queue(std::istream& input, const std::string& extension);

Result<std::vector<WorkItem>> load_work_queue(const std::filesystem::path& url_list,
                                              const std::string& extension);

} // namespace harvest::fetch
