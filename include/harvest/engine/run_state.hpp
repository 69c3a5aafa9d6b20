#pragma once

#include "harvest/core/result.hpp"

#include <chrono>

namespace harvest::engine {

enum class RunState {
    LoadingQueue,
    AwaitingSession,
    Transferring,
    SessionRecovery,
    ArchivingFinalRemainder,
    Aborted,
    Completed
};

enum class AbortReason {
    None,
    SessionFailureCap,
    Cancelled,
    QueueUnavailable,
    StorageUnavailable,
    InvalidConfiguration
};

const char* to_string(RunState state) noexcept;
const char* to_string(AbortReason reason) noexcept;

/**
 * @brief Lifecycle of one run, guarded by an explicit transition table
 *
 * Aborted and Completed are terminal. Any non-terminal state may abort.
 */
class RunStateMachine {
public:
    RunStateMachine();

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] bool is_terminal() const noexcept;
    [[nodiscard]] bool can_transition(RunState target) const noexcept;

    Result<void> transition_to(RunState next_state);

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    RunState state_;
    std::chrono::steady_clock::time_point last_transition_;
};

} // namespace harvest::engine
