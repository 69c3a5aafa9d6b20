#pragma once

/**
 * @file recovery_controller.hpp
 * @brief Top-level run loop: session acquisition, attempts and recovery
 *
 * LIFECYCLE:
 *
 *   LoadingQueue -> AwaitingSession -> Transferring -> ArchivingFinalRemainder -> Completed
 *                        ^                 |
 *                        |                 v
 *                        +-------- SessionRecovery --> Aborted (failure cap)
 *
 * Any non-terminal state may abort on cancellation.
 *
 * EPISODE ACCOUNTING:
 * Every attempt ending in a session-expiry signal, and every failed session
 * acquisition, is one episode. An attempt that downloaded at least one payload
 * first resets the count. Items skipped or settled with an error are not
 * progress, so a session that only ever serves gate pages still accumulates
 * episodes towards RecoveryPolicy::max_session_failures.
 *
 * A configuration that fails HarvestConfig::validate() aborts the run before
 * the checkpoint or any directory is touched.
 */

#include "harvest/archive/archive_writer.hpp"
#include "harvest/core/cancellation.hpp"
#include "harvest/core/config.hpp"
#include "harvest/engine/run_state.hpp"
#include "harvest/events/event_bus.hpp"
#include "harvest/fetch/types.hpp"
#include "harvest/network/http_client.hpp"
#include "harvest/session/session.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace harvest::engine {

struct RunReport {
    RunState final_state = RunState::LoadingQueue;
    AbortReason abort_reason = AbortReason::None;
    fetch::TransferProgress progress;
    std::size_t queue_size = 0;
    std::size_t archives_sealed = 0;
    std::size_t session_failures = 0;    ///< Consecutive episodes when the run ended
    std::size_t sessions_acquired = 0;
    std::string message;

    [[nodiscard]] bool completed() const noexcept { return final_state == RunState::Completed; }
};

class RecoveryController {
public:
    RecoveryController(HarvestConfig config,
                       session::SessionProvider& sessions,
                       network::HttpClient& client,
                       archive::ArchiveWriter& writer,
                       events::EventBus& bus);

    /**
     * @brief Load the work queue from the configured URL list and run it
     */
    RunReport run(const CancellationToken& cancel);

    /**
     * @brief Run an already materialised work queue
     */
    RunReport run(const std::vector<fetch::WorkItem>& queue, const CancellationToken& cancel);

    [[nodiscard]] const HarvestConfig& config() const noexcept { return config_; }

private:
    RunReport abort_before_start(AbortReason reason, std::string message, std::size_t queue_size);

    HarvestConfig config_;
    session::SessionProvider& sessions_;
    network::HttpClient& client_;
    archive::ArchiveWriter& writer_;
    events::EventBus& bus_;
};

} // namespace harvest::engine
