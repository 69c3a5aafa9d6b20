#include "harvest/session/cookie_file.hpp"

#include "harvest/network/curl_support.hpp"

#include <fstream>

namespace harvest::session {
namespace fs = std::filesystem;

Result<CookieList> read_cookie_file(const fs::path& cookie_file) {
    // libcurl silently ignores files it cannot open
    if (!std::ifstream(cookie_file)) {
        return Err<CookieList>(ErrorCode::IoError, "failed to open cookie file: " + cookie_file.string());
    }

    auto handle = network::make_curl_easy();
    if (handle.is_error()) {
        return Err<CookieList>(handle.error());
    }
    CURL* curl = handle.value().get();

    const std::string path = cookie_file.string();
    CURLcode reload = curl_easy_setopt(curl, CURLOPT_COOKIEFILE, path.c_str());
    if (reload == CURLE_OK) {
        reload = curl_easy_setopt(curl, CURLOPT_COOKIELIST, "RELOAD");
    }
    if (reload != CURLE_OK) {
        return Err<CookieList>(ErrorCode::ParseError,
                               std::string("cannot load cookies: ") + curl_easy_strerror(reload));
    }

    curl_slist* raw = nullptr;
    const CURLcode info = curl_easy_getinfo(curl, CURLINFO_COOKIELIST, &raw);
    if (info != CURLE_OK) {
        return Err<CookieList>(ErrorCode::ParseError,
                               std::string("cannot list cookies: ") + curl_easy_strerror(info));
    }
    network::CurlSlist cookies(raw);
    return Ok(network::to_strings(cookies.get()));
}

} // namespace harvest::session
