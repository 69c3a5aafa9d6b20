/**
 * @file components.hpp
 * @brief Ready-made subscribers for the engine's telemetry
 *
 * WHY THIS FILE EXISTS:
 * The engine only emits events. These components turn them into the
 * operator-facing log and into run statistics. Both subscribe in their
 * constructor and must outlive the bus traffic they observe.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * controller.run(cancel);
 * metrics.print_stats();
 */

#pragma once

#include "harvest/events/event_bus.hpp"
#include "harvest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace harvest::events {

/**
 * @brief Render 1234567 as "1,234,567"
 */
inline std::string group_digits(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i + 3 - lead) % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return out;
}

/**
 * @brief Logger component - one line per event in the operator format
 *
 * Skip and 404 lines dominate long resumed runs, so they are logged at
 * debug level except on every 100th item.
 */
class LoggerComponent {
public:
    static constexpr std::size_t kQuietEvery = 100;

    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ItemProcessedEvent>([this](const ItemProcessedEvent& e) {
            on_item_processed(e);
        });

        bus_.subscribe<ProgressReportEvent>([this](const ProgressReportEvent& e) {
            on_progress_report(e);
        });

        bus_.subscribe<ArchiveSealedEvent>([this](const ArchiveSealedEvent& e) {
            on_archive_sealed(e);
        });

        bus_.subscribe<ArchiveFailedEvent>([this](const ArchiveFailedEvent& e) {
            on_archive_failed(e);
        });

        bus_.subscribe<SessionAcquiredEvent>([](const SessionAcquiredEvent& e) {
            spdlog::info("Session #{} acquired ({} cookies)", e.generation, e.cookie_count);
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent& e) {
            on_session_expired(e);
        });

        bus_.subscribe<RunStateChangedEvent>([](const RunStateChangedEvent& e) {
            spdlog::debug("[RunState] {} -> {}", engine::to_string(e.from), engine::to_string(e.to));
        });

        bus_.subscribe<RunFinishedEvent>([this](const RunFinishedEvent& e) {
            on_run_finished(e);
        });
    }

private:
    void on_item_processed(const ItemProcessedEvent& e) {
        const std::size_t position = e.index + 1;
        switch (e.outcome) {
            case fetch::ItemOutcome::Downloaded:
                spdlog::info("[{}/{}] [OK] {} ({} bytes)",
                             position, e.queue_size, e.filename, group_digits(e.bytes));
                break;
            case fetch::ItemOutcome::Skipped:
            case fetch::ItemOutcome::NotFound:
                if (position % kQuietEvery == 0) {
                    spdlog::info("[{}/{}] [{}] {}", position, e.queue_size, fetch::to_string(e.outcome), e.filename);
                } else {
                    spdlog::debug("[{}/{}] [{}] {}", position, e.queue_size, fetch::to_string(e.outcome), e.filename);
                }
                break;
            case fetch::ItemOutcome::HttpError:
                spdlog::warn("[{}/{}] [HTTP {}] {}", position, e.queue_size, e.http_status, e.filename);
                break;
            case fetch::ItemOutcome::TransportError:
            case fetch::ItemOutcome::WriteFailed:
                spdlog::warn("[{}/{}] [{}] {}: {}",
                             position, e.queue_size, fetch::to_string(e.outcome), e.filename, e.detail);
                break;
            default:
                spdlog::warn("[{}/{}] [{}] {}", position, e.queue_size, fetch::to_string(e.outcome), e.filename);
                break;
        }
    }

    void on_progress_report(const ProgressReportEvent& e) {
        const auto eta_minutes = std::chrono::duration_cast<std::chrono::minutes>(e.eta).count();
        spdlog::info("--- Progress: {}/{} | Success: {} | Errors: {} | Rate: {:.1f}/s | ETA: {} min ---",
                     e.cursor, e.queue_size, e.success_count, e.error_count,
                     e.items_per_second, eta_minutes);
    }

    void on_archive_sealed(const ArchiveSealedEvent& e) {
        spdlog::info("[ARCHIVE] {} sealed: {} files, {} bytes",
                     e.archive_path.filename().string(), e.member_count, group_digits(e.size_bytes));
        if (e.delete_failures > 0) {
            spdlog::warn("[ARCHIVE] {} archived files could not be removed", e.delete_failures);
        }
    }

    void on_archive_failed(const ArchiveFailedEvent& e) {
        spdlog::error("[ARCHIVE] {} failed ({} files kept for retry): {}",
                      e.archive_path.filename().string(), e.member_count, e.reason);
    }

    void on_session_expired(const SessionExpiredEvent& e) {
        spdlog::warn("════════════════════════════════════════════");
        spdlog::warn("Session #{} expired at item {}: {}", e.generation, e.cursor + 1, e.reason);
        spdlog::warn("Consecutive session failures: {}/{}", e.consecutive_failures, e.max_failures);
        spdlog::warn("════════════════════════════════════════════");
    }

    void on_run_finished(const RunFinishedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        if (e.final_state == engine::RunState::Completed) {
            spdlog::info("Run completed");
        } else {
            spdlog::warn("Run aborted: {}", engine::to_string(e.abort_reason));
        }
        spdlog::info("Processed: {}/{}", e.progress.last_processed_index, e.queue_size);
        spdlog::info("Success: {}", e.progress.success_count);
        spdlog::info("Errors: {}", e.progress.error_count);
        spdlog::info("Archives created: {}", e.archives_sealed);
        spdlog::info("Archive location: {}", e.archive_dir.string());
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - run statistics per outcome class
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("downloaded {}", stats.items_downloaded.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> items_downloaded{0};
        std::atomic<std::uint64_t> items_skipped{0};
        std::atomic<std::uint64_t> items_not_found{0};
        std::atomic<std::uint64_t> items_mismatched{0};
        std::atomic<std::uint64_t> items_auth_rejected{0};
        std::atomic<std::uint64_t> items_http_error{0};
        std::atomic<std::uint64_t> items_transport_error{0};
        std::atomic<std::uint64_t> items_write_failed{0};
        std::atomic<std::uint64_t> bytes_downloaded{0};
        std::atomic<std::uint64_t> archives_sealed{0};
        std::atomic<std::uint64_t> archives_failed{0};
        std::atomic<std::uint64_t> bytes_archived{0};
        std::atomic<std::uint64_t> sessions_acquired{0};
        std::atomic<std::uint64_t> sessions_expired{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ItemProcessedEvent>([this](const ItemProcessedEvent& e) {
            on_item_processed(e);
        });

        bus_.subscribe<ArchiveSealedEvent>([this](const ArchiveSealedEvent& e) {
            stats_.archives_sealed++;
            stats_.bytes_archived += e.size_bytes;
        });

        bus_.subscribe<ArchiveFailedEvent>([this](const ArchiveFailedEvent&) {
            stats_.archives_failed++;
        });

        bus_.subscribe<SessionAcquiredEvent>([this](const SessionAcquiredEvent&) {
            stats_.sessions_acquired++;
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent&) {
            stats_.sessions_expired++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Run Statistics:");
        spdlog::info("  Downloaded:      {}", stats_.items_downloaded.load());
        spdlog::info("  Bytes:           {}", group_digits(stats_.bytes_downloaded.load()));
        spdlog::info("  Skipped:         {}", stats_.items_skipped.load());
        spdlog::info("  Not found:       {}", stats_.items_not_found.load());
        spdlog::info("  Not payload:     {}", stats_.items_mismatched.load());
        spdlog::info("  Auth rejected:   {}", stats_.items_auth_rejected.load());
        spdlog::info("  HTTP errors:     {}", stats_.items_http_error.load());
        spdlog::info("  Transport err.:  {}", stats_.items_transport_error.load());
        spdlog::info("  Write errors:    {}", stats_.items_write_failed.load());
        spdlog::info("  Archives sealed: {}", stats_.archives_sealed.load());
        spdlog::info("  Archives failed: {}", stats_.archives_failed.load());
        spdlog::info("  Sessions:        {} acquired, {} expired",
                     stats_.sessions_acquired.load(), stats_.sessions_expired.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_item_processed(const ItemProcessedEvent& e) {
        switch (e.outcome) {
            case fetch::ItemOutcome::Downloaded:
                stats_.items_downloaded++;
                stats_.bytes_downloaded += e.bytes;
                break;
            case fetch::ItemOutcome::Skipped: stats_.items_skipped++; break;
            case fetch::ItemOutcome::NotFound: stats_.items_not_found++; break;
            case fetch::ItemOutcome::ContentMismatch: stats_.items_mismatched++; break;
            case fetch::ItemOutcome::AuthRejected: stats_.items_auth_rejected++; break;
            case fetch::ItemOutcome::HttpError: stats_.items_http_error++; break;
            case fetch::ItemOutcome::TransportError: stats_.items_transport_error++; break;
            case fetch::ItemOutcome::WriteFailed: stats_.items_write_failed++; break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace harvest::events
