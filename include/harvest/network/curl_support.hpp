#pragma once

#include "harvest/core/result.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>
#include <vector>

namespace harvest::network {

/**
 * @brief Process-wide curl_global_init, performed once before the first handle
 */
void ensure_curl_initialized();

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

Result<CurlEasy> make_curl_easy();

/**
 * @brief Copy a libcurl string list into owned strings
 */
std::vector<std::string> to_strings(const curl_slist* list);

} // namespace harvest::network
