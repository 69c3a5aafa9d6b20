#pragma once

#include "harvest/core/result.hpp"
#include "harvest/session/session.hpp"

#include <filesystem>

namespace harvest::session {

/**
 * @brief Load a cookies.txt export through libcurl's cookie engine
 *
 * Accepts whatever libcurl accepts: Netscape cookie-file lines (including
 * "#HttpOnly_" entries) and "Set-Cookie:" header lines. Cookies that have
 * already expired are dropped. A file with no usable cookie yields an empty
 * list; a missing or unreadable file is an IoError.
 */
Result<CookieList> read_cookie_file(const std::filesystem::path& cookie_file);

} // namespace harvest::session
