#pragma once

#include "harvest/network/http_client.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace harvest::network {

/**
 * @brief HTTP(S) client on the libcurl easy interface
 *
 * Every request gets a fresh easy handle, so nothing carries over from one
 * fetch to the next: a stale connection can never be mistaken for a session
 * problem.
 *
 * Cookies: the session's cookie lines are fed to the handle's cookie engine,
 * which decides per hop which of them to send. Cookies set by the server
 * during a redirect chain apply to the rest of that chain only.
 *
 * Cancellation: the transfer-info callback polls the token and aborts the
 * transfer, reported as ErrorCode::Cancelled. libcurl invokes it at least
 * once a second while a transfer is idle.
 */
class CurlHttpClient : public HttpClient {
public:
    struct Options {
        std::string user_agent = "harvest/1.0";
        std::chrono::seconds timeout{120};
        std::chrono::seconds connect_timeout{30};
        std::uint64_t max_body_bytes = 512ULL * 1024 * 1024;
        std::size_t max_redirects = 5;
    };

    explicit CurlHttpClient(Options options);

    Result<FetchResponse> get(const std::string& url,
                              const session::CookieList& cookies,
                              const CancellationToken& cancel) override;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

} // namespace harvest::network
