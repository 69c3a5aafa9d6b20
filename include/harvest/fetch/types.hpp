#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace harvest::fetch {

/**
 * @brief One entry of the work queue, immutable once loaded
 */
struct WorkItem {
    std::string filename;
    std::string source_url;
};

/**
 * @brief Durable resumption anchor of a run
 *
 * last_processed_index is the cursor of the next item to attempt, i.e. the
 * number of queue entries already settled. It never exceeds the queue size
 * and never moves backwards within a run.
 */
struct TransferProgress {
    std::size_t last_processed_index = 0;
    std::uint64_t success_count = 0;
    std::uint64_t error_count = 0;
    std::chrono::system_clock::time_point last_update{};
};

/**
 * @brief Classification of a single work item
 */
enum class ItemOutcome {
    Downloaded,
    Skipped,          ///< Valid payload already on disk
    NotFound,
    ContentMismatch,  ///< 2xx but the body is not the expected payload type
    AuthRejected,     ///< 401 / 403
    HttpError,
    TransportError,
    WriteFailed
};

inline const char* to_string(ItemOutcome outcome) {
    switch (outcome) {
        case ItemOutcome::Downloaded: return "OK";
        case ItemOutcome::Skipped: return "SKIP";
        case ItemOutcome::NotFound: return "404";
        case ItemOutcome::ContentMismatch: return "NOT PAYLOAD";
        case ItemOutcome::AuthRejected: return "AUTH ERROR";
        case ItemOutcome::HttpError: return "HTTP ERROR";
        case ItemOutcome::TransportError: return "ERROR";
        case ItemOutcome::WriteFailed: return "WRITE ERROR";
    }
    return "UNKNOWN";
}

} // namespace harvest::fetch
