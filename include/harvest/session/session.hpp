#pragma once

#include "harvest/core/cancellation.hpp"
#include "harvest/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace harvest::session {

/**
 * @brief Cookies in Netscape cookie-file line format, as libcurl reports them
 *
 * The HTTP client hands each line back to libcurl's cookie engine, which
 * applies the domain, path, secure and expiry rules.
 */
using CookieList = std::vector<std::string>;

/**
 * @brief Authenticated credentials handed to one transfer attempt
 *
 * Never mutated after acquisition. When an expiry signal is observed the
 * controller keeps an invalidated copy and asks the provider for a new one.
 */
struct SessionState {
    CookieList cookies;
    bool valid = false;
    std::uint64_t generation = 0;   ///< 1 for the first session of a run, +1 per re-acquisition
    std::chrono::system_clock::time_point acquired_at{};

    [[nodiscard]] SessionState invalidated() const {
        SessionState copy = *this;
        copy.valid = false;
        return copy;
    }
};

/**
 * @brief Source of fresh authenticated sessions
 *
 * Implemented by whatever performs the interactive verification step. Must
 * tolerate being called repeatedly within one run.
 */
class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    virtual Result<SessionState> acquire_session(std::chrono::seconds timeout,
                                                 const CancellationToken& cancel) = 0;
};

} // namespace harvest::session
