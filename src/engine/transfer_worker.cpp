#include "harvest/engine/transfer_worker.hpp"

#include "harvest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

namespace harvest::engine {
namespace fs = std::filesystem;
using fetch::ItemOutcome;

const char* to_string(AttemptStatus status) noexcept {
    switch (status) {
        case AttemptStatus::Completed: return "completed";
        case AttemptStatus::SessionExpired: return "session expired";
        case AttemptStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

TransferWorker::TransferWorker(const std::vector<fetch::WorkItem>& queue,
                               const fs::path& download_dir,
                               TransferPolicy policy,
                               network::HttpClient& client,
                               archive::ArchiveBatcher& batcher,
                               events::EventBus& bus)
    : queue_(queue)
    , download_dir_(fs::absolute(download_dir))
    , policy_(std::move(policy))
    , signature_(policy_.magic_bytes)
    , client_(client)
    , batcher_(batcher)
    , bus_(bus) {}

Result<void> TransferWorker::store_payload(const fs::path& destination, const std::vector<std::uint8_t>& body) {
    fs::path temp = destination;
    temp += ".part";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::IoError, "cannot open " + temp.string());
        }
        output.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
        output.flush();
        if (!output) {
            output.close();
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(ErrorCode::IoError, "cannot write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, destination, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err<void>(ErrorCode::IoError, "cannot move download into place: " + ec.message());
    }
    return Ok();
}

AttemptResult TransferWorker::run_attempt(const session::SessionState& session,
                                          fetch::TransferProgress& progress,
                                          archive::PendingArchiveSet& pending,
                                          const CancellationToken& cancel,
                                          const CheckpointFn& checkpoint) {
    const auto attempt_started = std::chrono::steady_clock::now();
    const std::size_t total = queue_.size();
    std::size_t streak = 0;
    std::size_t settled = 0;
    std::size_t downloaded = 0;

    auto finish = [&](AttemptStatus status, std::string reason = {}) {
        return AttemptResult{status, progress, settled, downloaded, std::move(reason)};
    };

    spdlog::debug("Attempt with session #{} starting at item {}/{}",
                  session.generation, progress.last_processed_index + 1, total);

    for (std::size_t index = progress.last_processed_index; index < total; ++index) {
        if (cancel.is_cancelled()) {
            return finish(AttemptStatus::Cancelled);
        }

        const auto& item = queue_[index];
        const fs::path destination = download_dir_ / item.filename;

        events::ItemProcessedEvent event;
        event.index = index;
        event.queue_size = total;
        event.filename = item.filename;

        const bool skipped = signature_.matches_file(destination);
        bool expired = false;
        std::string expiry_reason;

        if (skipped) {
            event.outcome = ItemOutcome::Skipped;
        } else {
            auto fetched = client_.get(item.source_url, session.cookies, cancel);
            if (fetched.is_error()) {
                if (fetched.error().code == ErrorCode::Cancelled) {
                    return finish(AttemptStatus::Cancelled);
                }
                ++progress.error_count;
                event.outcome = ItemOutcome::TransportError;
                event.detail = describe(fetched.error());
            } else {
                const auto& response = fetched.value();
                event.http_status = response.status;

                if (response.is_success() && signature_.matches(response.body)) {
                    auto stored = store_payload(destination, response.body);
                    if (stored.is_error()) {
                        ++progress.error_count;
                        event.outcome = ItemOutcome::WriteFailed;
                        event.detail = stored.error().message;
                    } else {
                        pending.push_back(destination);
                        ++progress.success_count;
                        ++downloaded;
                        streak = 0;
                        event.outcome = ItemOutcome::Downloaded;
                        event.bytes = response.body.size();
                    }
                } else if (response.is_success()) {
                    ++progress.error_count;
                    ++streak;
                    event.outcome = ItemOutcome::ContentMismatch;
                    if (fetch::contains_gate_marker(response.body, policy_.gate_markers)) {
                        expired = true;
                        expiry_reason = "verification page returned for " + item.filename;
                    } else if (streak >= policy_.error_streak_threshold) {
                        expired = true;
                        expiry_reason = std::to_string(streak) + " consecutive non-payload responses";
                    }
                } else if (response.status == 404) {
                    ++progress.error_count;
                    event.outcome = ItemOutcome::NotFound;
                } else if (response.status == 401 || response.status == 403) {
                    ++progress.error_count;
                    event.outcome = ItemOutcome::AuthRejected;
                    expired = true;
                    expiry_reason = "HTTP " + std::to_string(response.status) + " for " + item.filename;
                } else {
                    ++progress.error_count;
                    event.outcome = ItemOutcome::HttpError;
                }
            }
        }

        progress.last_update = std::chrono::system_clock::now();
        if (expired) {
            bus_.emit(event);
            return finish(AttemptStatus::SessionExpired, std::move(expiry_reason));
        }

        progress.last_processed_index = index + 1;
        ++settled;
        bus_.emit(event);

        if (pending.size() >= policy_.batch_threshold) {
            auto sealed = batcher_.seal(pending, cancel);
            if (sealed.is_error()) {
                spdlog::error("Archive seal failed, continuing with {} files pending: {}",
                              pending.size(), describe(sealed.error()));
            } else if (checkpoint) {
                checkpoint(progress);
            }
        }

        if (policy_.checkpoint_interval > 0 && settled % policy_.checkpoint_interval == 0) {
            if (checkpoint) {
                checkpoint(progress);
            }
            const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - attempt_started);
            const double rate = elapsed.count() > 0.0 ? static_cast<double>(settled) / elapsed.count() : 0.0;
            const std::size_t remaining = total - progress.last_processed_index;
            const auto eta = std::chrono::seconds(
                rate > 0.0 ? static_cast<std::chrono::seconds::rep>(static_cast<double>(remaining) / rate) : 0);
            bus_.emit(events::ProgressReportEvent{progress.last_processed_index, total,
                                                  progress.success_count, progress.error_count, rate, eta});
        }

        if (!skipped && !cancel.sleep_for(policy_.inter_item_delay)) {
            return finish(AttemptStatus::Cancelled);
        }
    }

    return finish(AttemptStatus::Completed);
}

} // namespace harvest::engine
