#pragma once

#include "harvest/archive/archive_batcher.hpp"
#include "harvest/core/cancellation.hpp"
#include "harvest/core/config.hpp"
#include "harvest/events/event_bus.hpp"
#include "harvest/fetch/payload.hpp"
#include "harvest/fetch/types.hpp"
#include "harvest/network/http_client.hpp"
#include "harvest/session/session.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace harvest::engine {

enum class AttemptStatus {
    Completed,        ///< Cursor reached the end of the queue
    SessionExpired,   ///< Stopped on an expiry signal; the triggering item was not advanced past
    Cancelled
};

const char* to_string(AttemptStatus status) noexcept;

struct AttemptResult {
    AttemptStatus status = AttemptStatus::Completed;
    fetch::TransferProgress progress;   ///< Snapshot at the end of the attempt
    std::size_t items_settled = 0;      ///< Items the cursor moved past during this attempt
    std::size_t items_downloaded = 0;   ///< Payloads fetched and stored during this attempt
    std::string expiry_reason;          ///< Set for SessionExpired
};

/**
 * @brief Invoked with the live progress whenever it should be made durable
 */
using CheckpointFn = std::function<void(const fetch::TransferProgress&)>;

/**
 * @brief Processes the work queue sequentially under one session
 *
 * One call to run_attempt() is one attempt. It starts at
 * progress.last_processed_index and ends when the queue is exhausted, a
 * session-expiry signal is seen, or cancellation is requested. The
 * content-mismatch streak lives inside run_attempt() and starts at zero on
 * every attempt.
 *
 * @p progress and @p pending are owned by the caller and updated in place,
 * so they are current whichever way the attempt ends.
 */
class TransferWorker {
public:
    TransferWorker(const std::vector<fetch::WorkItem>& queue,
                   const std::filesystem::path& download_dir,
                   TransferPolicy policy,
                   network::HttpClient& client,
                   archive::ArchiveBatcher& batcher,
                   events::EventBus& bus);

    AttemptResult run_attempt(const session::SessionState& session,
                              fetch::TransferProgress& progress,
                              archive::PendingArchiveSet& pending,
                              const CancellationToken& cancel,
                              const CheckpointFn& checkpoint);

    /**
     * @brief Write @p body to @p destination through a ".part" file and a rename
     */
    static Result<void> store_payload(const std::filesystem::path& destination,
                                      const std::vector<std::uint8_t>& body);

private:
    const std::vector<fetch::WorkItem>& queue_;
    std::filesystem::path download_dir_;
    TransferPolicy policy_;
    fetch::PayloadSignature signature_;
    network::HttpClient& client_;
    archive::ArchiveBatcher& batcher_;
    events::EventBus& bus_;
};

} // namespace harvest::engine
