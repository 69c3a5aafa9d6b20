#include "harvest/network/curl_support.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace harvest::network {

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
            return;
        }
        spdlog::debug("Initialized {}", curl_version());
    });
}

Result<CurlEasy> make_curl_easy() {
    ensure_curl_initialized();
    CurlEasy handle(curl_easy_init());
    if (!handle) {
        return Err<CurlEasy>(ErrorCode::NetworkError, "curl_easy_init failed");
    }
    return Ok(std::move(handle));
}

std::vector<std::string> to_strings(const curl_slist* list) {
    std::vector<std::string> out;
    for (const curl_slist* node = list; node != nullptr; node = node->next) {
        out.emplace_back(node->data);
    }
    return out;
}

} // namespace harvest::network
