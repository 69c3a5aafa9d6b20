#include "harvest/engine/recovery_controller.hpp"

#include "harvest/archive/archive_batcher.hpp"
#include "harvest/engine/transfer_worker.hpp"
#include "harvest/events/events.hpp"
#include "harvest/fetch/payload.hpp"
#include "harvest/fetch/work_queue.hpp"
#include "harvest/store/progress_store.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <system_error>
#include <utility>

namespace harvest::engine {
namespace fs = std::filesystem;

namespace {

/**
 * Owns the state machine of one run and mirrors every transition on the bus.
 */
class RunTracker {
public:
    RunTracker(events::EventBus& bus, RunReport& report) : bus_(bus), report_(report) {}

    RunState state() const noexcept { return machine_.state(); }

    void move_to(RunState next) {
        const RunState previous = machine_.state();
        auto moved = machine_.transition_to(next);
        if (moved.is_error()) {
            spdlog::error("{}", moved.error().message);
            return;
        }
        bus_.emit(events::RunStateChangedEvent{previous, next});
    }

    void abort(AbortReason reason, std::string message) {
        report_.abort_reason = reason;
        report_.message = std::move(message);
        move_to(RunState::Aborted);
    }

private:
    RunStateMachine machine_;
    events::EventBus& bus_;
    RunReport& report_;
};

void save_checkpoint(const store::ProgressStore& store, const fetch::TransferProgress& progress) {
    auto saved = store.save(progress);
    if (saved.is_error()) {
        spdlog::error("Failed to save progress: {}", describe(saved.error()));
    }
}

} // namespace

RecoveryController::RecoveryController(HarvestConfig config,
                                       session::SessionProvider& sessions,
                                       network::HttpClient& client,
                                       archive::ArchiveWriter& writer,
                                       events::EventBus& bus)
    : config_(std::move(config))
    , sessions_(sessions)
    , client_(client)
    , writer_(writer)
    , bus_(bus) {}

RunReport RecoveryController::abort_before_start(AbortReason reason, std::string message,
                                                 std::size_t queue_size) {
    RunReport report;
    report.queue_size = queue_size;
    RunTracker tracker(bus_, report);
    tracker.abort(reason, std::move(message));
    report.final_state = tracker.state();
    spdlog::error("Run aborted before transfer ({}): {}", to_string(reason), report.message);
    bus_.emit(events::RunFinishedEvent{report.final_state, report.abort_reason, report.progress,
                                       queue_size, 0, config_.resolved_archive_dir()});
    return report;
}

RunReport RecoveryController::run(const CancellationToken& cancel) {
    if (auto valid = config_.validate(); valid.is_error()) {
        return abort_before_start(AbortReason::InvalidConfiguration, describe(valid.error()), 0);
    }
    auto queue = fetch::load_work_queue(config_.url_list, config_.file_extension);
    if (queue.is_error()) {
        return abort_before_start(AbortReason::QueueUnavailable, describe(queue.error()), 0);
    }
    return run(queue.value(), cancel);
}

RunReport RecoveryController::run(const std::vector<fetch::WorkItem>& queue, const CancellationToken& cancel) {
    if (auto valid = config_.validate(); valid.is_error()) {
        return abort_before_start(AbortReason::InvalidConfiguration, describe(valid.error()), queue.size());
    }

    RunReport report;
    report.queue_size = queue.size();
    RunTracker tracker(bus_, report);

    const store::ProgressStore store(config_.resolved_checkpoint_file());
    fetch::TransferProgress progress;
    bool progress_loaded = false;

    const fs::path download_dir = config_.download_dir;
    archive::ArchiveBatcher batcher(config_.resolved_archive_dir(), config_.archive_prefix, writer_, bus_);
    archive::PendingArchiveSet pending;

    // ── LoadingQueue ──────────────────────────────────────
    spdlog::debug("Work queue holds {} items", queue.size());
    std::error_code ec;
    fs::create_directories(download_dir, ec);
    if (ec) {
        tracker.abort(AbortReason::StorageUnavailable,
                      "cannot create download directory " + download_dir.string() + ": " + ec.message());
    } else {
        progress = store.load();
        progress_loaded = true;
        if (progress.last_processed_index > queue.size()) {
            spdlog::warn("Checkpoint index {} exceeds the queue size {}, clamping",
                         progress.last_processed_index, queue.size());
            progress.last_processed_index = queue.size();
        }

        auto initialized = batcher.initialize();
        auto rebuilt = archive::rebuild_pending(download_dir, config_.file_extension,
                                                fetch::PayloadSignature(config_.transfer.magic_bytes));
        if (initialized.is_error()) {
            tracker.abort(AbortReason::StorageUnavailable, describe(initialized.error()));
        } else if (rebuilt.is_error()) {
            tracker.abort(AbortReason::StorageUnavailable, describe(rebuilt.error()));
        } else {
            pending = std::move(rebuilt.value());
            spdlog::info("Resuming at item {}/{} with {} files awaiting archival",
                         progress.last_processed_index + 1, queue.size(), pending.size());
            if (progress.last_processed_index < queue.size()) {
                tracker.move_to(RunState::AwaitingSession);
            } else if (!pending.empty()) {
                tracker.move_to(RunState::ArchivingFinalRemainder);
            } else {
                tracker.move_to(RunState::Completed);
            }
        }
    }

    TransferWorker worker(queue, download_dir, config_.transfer, client_, batcher, bus_);
    const CheckpointFn checkpoint = [&store](const fetch::TransferProgress& current) {
        save_checkpoint(store, current);
    };

    std::optional<session::SessionState> session;
    std::size_t failures = 0;
    bool first_attempt = true;

    while (tracker.state() != RunState::Completed && tracker.state() != RunState::Aborted) {
        switch (tracker.state()) {
            case RunState::AwaitingSession: {
                auto acquired = sessions_.acquire_session(config_.recovery.session_timeout, cancel);
                if (acquired.is_ok()) {
                    session = std::move(acquired.value());
                    ++report.sessions_acquired;
                    bus_.emit(events::SessionAcquiredEvent{session->generation, session->cookies.size()});
                    tracker.move_to(RunState::Transferring);
                } else if (acquired.error().code == ErrorCode::Cancelled || cancel.is_cancelled()) {
                    tracker.abort(AbortReason::Cancelled, "cancelled while waiting for a session");
                } else {
                    ++failures;
                    spdlog::error("Session acquisition failed ({}/{}): {}",
                                  failures, config_.recovery.max_session_failures, describe(acquired.error()));
                    tracker.move_to(RunState::SessionRecovery);
                }
                break;
            }

            case RunState::Transferring: {
                if (first_attempt && pending.size() >= config_.transfer.batch_threshold) {
                    auto sealed = batcher.seal(pending, cancel);
                    if (sealed.is_error()) {
                        spdlog::error("Archive seal failed: {}", describe(sealed.error()));
                    } else {
                        save_checkpoint(store, progress);
                    }
                }
                first_attempt = false;

                const auto attempt = worker.run_attempt(*session, progress, pending, cancel, checkpoint);
                switch (attempt.status) {
                    case AttemptStatus::Completed:
                        failures = 0;
                        tracker.move_to(pending.empty() ? RunState::Completed : RunState::ArchivingFinalRemainder);
                        break;

                    case AttemptStatus::SessionExpired:
                        if (attempt.items_downloaded > 0) {
                            failures = 0;
                        }
                        ++failures;
                        save_checkpoint(store, progress);
                        session = session->invalidated();
                        bus_.emit(events::SessionExpiredEvent{session->generation, progress.last_processed_index,
                                                              attempt.expiry_reason, failures,
                                                              config_.recovery.max_session_failures});
                        tracker.move_to(RunState::SessionRecovery);
                        break;

                    case AttemptStatus::Cancelled:
                        tracker.abort(AbortReason::Cancelled, "cancelled during transfer");
                        break;
                }
                break;
            }

            case RunState::SessionRecovery:
                if (failures >= config_.recovery.max_session_failures) {
                    tracker.abort(AbortReason::SessionFailureCap,
                                  std::to_string(failures) + " consecutive session failures without progress");
                } else if (!cancel.sleep_for(config_.recovery.recovery_pause)) {
                    tracker.abort(AbortReason::Cancelled, "cancelled during session recovery");
                } else {
                    tracker.move_to(RunState::AwaitingSession);
                }
                break;

            case RunState::ArchivingFinalRemainder: {
                auto sealed = batcher.seal(pending, cancel);
                if (sealed.is_error()) {
                    spdlog::error("Final archive failed, {} files stay in {}: {}",
                                  pending.size(), download_dir.string(), describe(sealed.error()));
                }
                tracker.move_to(RunState::Completed);
                break;
            }

            default:
                tracker.abort(AbortReason::None, std::string("run stopped in state ") + to_string(tracker.state()));
                break;
        }
    }

    if (progress_loaded) {
        save_checkpoint(store, progress);
    }

    report.final_state = tracker.state();
    report.progress = progress;
    report.archives_sealed = batcher.sealed_count();
    report.session_failures = failures;
    if (report.message.empty()) {
        report.message = "processed " + std::to_string(progress.last_processed_index) + " of " +
                         std::to_string(queue.size()) + " items";
    }

    bus_.emit(events::RunFinishedEvent{report.final_state, report.abort_reason, report.progress,
                                       report.queue_size, report.archives_sealed, batcher.archive_dir()});
    return report;
}

} // namespace harvest::engine
