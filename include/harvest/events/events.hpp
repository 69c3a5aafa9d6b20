/**
 * @file events.hpp
 * @brief Telemetry event types emitted by the transfer engine
 *
 * WHY THIS FILE EXISTS:
 * Defines every event the engine publishes on the EventBus. Events are the
 * only channel through which the engine reports progress; it never prints.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ItemProcessedEvent, ArchiveSealedEvent
 * - Every event carries the wall-clock time it was created
 */

#pragma once

#include "harvest/engine/run_state.hpp"
#include "harvest/fetch/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace harvest::events {

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per classified work item
 *
 * WHO EMITS:
 * - TransferWorker, after the counters were updated. Items that end the
 *   attempt with a session-expiry signal are reported too, but the cursor
 *   stays on them
 *
 * WHO SUBSCRIBES:
 * - Logger (operator-facing "[i/N] [OUTCOME] file" line)
 * - Metrics (per-outcome counters)
 */
struct ItemProcessedEvent {
    std::size_t index = 0;              // 0-based position in the queue
    std::size_t queue_size = 0;
    std::string filename;
    fetch::ItemOutcome outcome = fetch::ItemOutcome::Downloaded;
    std::uint64_t bytes = 0;            // Bytes written, 0 unless Downloaded
    int http_status = 0;                // 0 when no response was received
    std::string detail;                 // Transport or IO error text
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Periodic rate/ETA report, every checkpoint_interval settled items
 */
struct ProgressReportEvent {
    std::size_t cursor = 0;
    std::size_t queue_size = 0;
    std::uint64_t success_count = 0;
    std::uint64_t error_count = 0;
    double items_per_second = 0.0;      // Over the current attempt
    std::chrono::seconds eta{0};
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// ════════════════════════════════════════════════════════
// Archive Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after an archive has been written, verified and its
 *        members removed from the download directory
 */
struct ArchiveSealedEvent {
    std::uint64_t sequence_number = 0;
    std::filesystem::path archive_path;
    std::size_t member_count = 0;
    std::uint64_t size_bytes = 0;
    std::size_t delete_failures = 0;    // Members archived but not removable
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted when a seal attempt failed and left the pending set intact
 */
struct ArchiveFailedEvent {
    std::uint64_t sequence_number = 0;
    std::filesystem::path archive_path;
    std::size_t member_count = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct SessionAcquiredEvent {
    std::uint64_t generation = 0;
    std::size_t cookie_count = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted when an attempt stops on a session-expiry signal
 *
 * WHO EMITS:
 * - RecoveryController, after counting the episode
 *
 * consecutive_failures already includes this episode.
 */
struct SessionExpiredEvent {
    std::uint64_t generation = 0;
    std::size_t cursor = 0;
    std::string reason;
    std::size_t consecutive_failures = 0;
    std::size_t max_failures = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// ════════════════════════════════════════════════════════
// Run Lifecycle Events
// ════════════════════════════════════════════════════════

struct RunStateChangedEvent {
    engine::RunState from = engine::RunState::LoadingQueue;
    engine::RunState to = engine::RunState::LoadingQueue;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct RunFinishedEvent {
    engine::RunState final_state = engine::RunState::Completed;
    engine::AbortReason abort_reason = engine::AbortReason::None;
    fetch::TransferProgress progress;
    std::size_t queue_size = 0;
    std::size_t archives_sealed = 0;
    std::filesystem::path archive_dir;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

} // namespace harvest::events
