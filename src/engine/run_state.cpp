#include "harvest/engine/run_state.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace harvest::engine {
namespace {

bool is_allowed(RunState current, RunState target) {
    static const std::unordered_map<RunState, std::vector<RunState>> transitions {
        {RunState::LoadingQueue, {RunState::AwaitingSession, RunState::ArchivingFinalRemainder, RunState::Completed}},
        {RunState::AwaitingSession, {RunState::Transferring, RunState::SessionRecovery}},
        {RunState::Transferring, {RunState::SessionRecovery, RunState::ArchivingFinalRemainder, RunState::Completed}},
        {RunState::SessionRecovery, {RunState::AwaitingSession}},
        {RunState::ArchivingFinalRemainder, {RunState::Completed}},
    };

    if (target == RunState::Aborted) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(RunState state) noexcept {
    switch (state) {
        case RunState::LoadingQueue: return "LoadingQueue";
        case RunState::AwaitingSession: return "AwaitingSession";
        case RunState::Transferring: return "Transferring";
        case RunState::SessionRecovery: return "SessionRecovery";
        case RunState::ArchivingFinalRemainder: return "ArchivingFinalRemainder";
        case RunState::Aborted: return "Aborted";
        case RunState::Completed: return "Completed";
    }
    return "Unknown";
}

const char* to_string(AbortReason reason) noexcept {
    switch (reason) {
        case AbortReason::None: return "none";
        case AbortReason::SessionFailureCap: return "session failure cap reached";
        case AbortReason::Cancelled: return "cancelled";
        case AbortReason::QueueUnavailable: return "work queue unavailable";
        case AbortReason::StorageUnavailable: return "download or archive directory unusable";
        case AbortReason::InvalidConfiguration: return "invalid configuration";
    }
    return "unknown";
}

RunStateMachine::RunStateMachine()
    : state_(RunState::LoadingQueue)
    , last_transition_(std::chrono::steady_clock::now()) {}

bool RunStateMachine::is_terminal() const noexcept {
    return state_ == RunState::Aborted || state_ == RunState::Completed;
}

bool RunStateMachine::can_transition(RunState target) const noexcept {
    if (is_terminal()) {
        return false;
    }
    return is_allowed(state_, target);
}

Result<void> RunStateMachine::transition_to(RunState next_state) {
    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("illegal run state transition ") + to_string(state_) +
                         " -> " + to_string(next_state));
    }
    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    return Ok();
}

} // namespace harvest::engine
