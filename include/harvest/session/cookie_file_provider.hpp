#pragma once

#include "harvest/session/session.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace harvest::session {

/**
 * @brief Session provider backed by a cookies.txt file renewed out of process
 *
 * The browser-driven verification step exports its cookies to a file. The
 * first acquisition takes the file as it is; every later acquisition runs the
 * optional refresh command and then waits for the file to be rewritten before
 * handing out a new session. A rewrite is a changed modification time or a
 * changed cookie list, so a refresh landing within the same timestamp tick
 * is still picked up.
 */
class CookieFileSessionProvider : public SessionProvider {
public:
    static constexpr std::chrono::milliseconds kPollInterval{500};

    explicit CookieFileSessionProvider(std::filesystem::path cookie_file,
                                       std::string refresh_command = {});

    Result<SessionState> acquire_session(std::chrono::seconds timeout,
                                         const CancellationToken& cancel) override;

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

private:
    SessionState adopt(std::filesystem::file_time_type stamp, CookieList cookies);
    void run_refresh_command() const;
    std::optional<std::filesystem::file_time_type> current_stamp() const;

    std::filesystem::path cookie_file_;
    std::string refresh_command_;
    std::optional<std::filesystem::file_time_type> last_loaded_;
    CookieList last_cookies_;
    std::uint64_t generation_ = 0;
};

} // namespace harvest::session
