#pragma once

#include "harvest/core/cancellation.hpp"
#include "harvest/core/result.hpp"
#include "harvest/session/session.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace harvest::network {

/**
 * @brief Fully received response of a GET request
 */
struct FetchResponse {
    int status = 0;
    std::vector<std::uint8_t> body;
    std::string content_type;
    std::string final_url;   ///< URL after redirects

    [[nodiscard]] bool is_success() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking GET used by the transfer loop
 *
 * Implementations must observe @p cancel while waiting on the network and
 * report it as ErrorCode::Cancelled. Any other failure to obtain a response
 * (DNS, connect, TLS, timeout, oversized body, redirect loop) is an error
 * result; HTTP status codes, including 4xx/5xx, are successful results.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<FetchResponse> get(const std::string& url,
                                      const session::CookieList& cookies,
                                      const CancellationToken& cancel) = 0;
};

} // namespace harvest::network
