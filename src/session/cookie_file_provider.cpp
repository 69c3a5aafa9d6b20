#include "harvest/session/cookie_file_provider.hpp"

#include "harvest/session/cookie_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <system_error>

namespace harvest::session {
namespace fs = std::filesystem;

CookieFileSessionProvider::CookieFileSessionProvider(fs::path cookie_file, std::string refresh_command)
    : cookie_file_(std::move(cookie_file)), refresh_command_(std::move(refresh_command)) {}

Result<SessionState> CookieFileSessionProvider::acquire_session(std::chrono::seconds timeout,
                                                                const CancellationToken& cancel) {
    using clock = std::chrono::steady_clock;

    if (last_loaded_) {
        run_refresh_command();
        spdlog::info("Waiting up to {}s for refreshed cookies in {}", timeout.count(), cookie_file_.string());
    }

    const auto deadline = clock::now() + timeout;
    std::string last_problem = "cookie file not found: " + cookie_file_.string();

    while (true) {
        if (cancel.is_cancelled()) {
            return Err<SessionState>(ErrorCode::Cancelled, "session acquisition cancelled");
        }

        if (const auto stamp = current_stamp()) {
            auto cookies = read_cookie_file(cookie_file_);
            if (cookies.is_error()) {
                last_problem = cookies.error().message;
            } else if (cookies.value().empty()) {
                last_problem = "cookie file holds no cookies";
            } else if (last_loaded_ && *stamp == *last_loaded_ && cookies.value() == last_cookies_) {
                last_problem = "cookie file has not been refreshed since the last session";
            } else {
                return Ok(adopt(*stamp, std::move(cookies.value())));
            }
            spdlog::debug("Cookie file not usable yet: {}", last_problem);
        }

        const auto now = clock::now();
        if (now >= deadline) {
            return Err<SessionState>(ErrorCode::SessionUnavailable, last_problem);
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!cancel.sleep_for(std::min(remaining, std::chrono::milliseconds(kPollInterval)))) {
            return Err<SessionState>(ErrorCode::Cancelled, "session acquisition cancelled");
        }
    }
}

SessionState CookieFileSessionProvider::adopt(fs::file_time_type stamp, CookieList cookies) {
    last_loaded_ = stamp;
    last_cookies_ = cookies;

    SessionState state;
    state.cookies = std::move(cookies);
    state.valid = true;
    state.generation = ++generation_;
    state.acquired_at = std::chrono::system_clock::now();

    spdlog::info("Loaded session #{} with {} cookies from {}",
                 state.generation, state.cookies.size(), cookie_file_.string());
    return state;
}

void CookieFileSessionProvider::run_refresh_command() const {
    if (refresh_command_.empty()) {
        return;
    }
    spdlog::info("Running session refresh command: {}", refresh_command_);
    const int status = std::system(refresh_command_.c_str());
    if (status != 0) {
        spdlog::warn("Session refresh command exited with status {}", status);
    }
}

std::optional<fs::file_time_type> CookieFileSessionProvider::current_stamp() const {
    std::error_code ec;
    const auto stamp = fs::last_write_time(cookie_file_, ec);
    if (ec) {
        return std::nullopt;
    }
    return stamp;
}

} // namespace harvest::session
