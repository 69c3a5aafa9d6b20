#pragma once

/**
 * @file progress_store.hpp
 * @brief Durable checkpoint of the transfer cursor and counters
 *
 * The checkpoint is a single, human-readable JSON document:
 *
 *   {
 *     "last_processed_index": 1200,
 *     "success_count": 310,
 *     "error_count": 890,
 *     "last_update": "2026-01-31T17:05:11Z"
 *   }
 *
 * It is the resumption anchor of the downloader: after a crash or a fatal
 * stop the next run reloads it and continues at last_processed_index.
 *
 * FAILURE POLICY:
 * - load() never fails. A missing, truncated or otherwise unusable document
 *   means "start fresh" and is only logged.
 * - save() reports failures as a Result; callers log and carry on, since the
 *   in-memory progress of the running process stays correct.
 *
 * ATOMICITY:
 * save() writes "<checkpoint>.tmp" and renames it over the checkpoint, so a
 * reader (or the next run) sees either the previous or the new document,
 * never a partial one.
 */

#include "harvest/core/result.hpp"
#include "harvest/fetch/types.hpp"

#include <filesystem>
#include <string>

namespace harvest::store {

class ProgressStore {
public:
    explicit ProgressStore(std::filesystem::path checkpoint_file);

    /**
     * @brief Read the checkpoint, or zero progress if there is none usable
     */
    fetch::TransferProgress load() const;

    /**
     * @brief Atomically replace the checkpoint with @p progress
     */
    Result<void> save(const fetch::TransferProgress& progress) const;

    const std::filesystem::path& path() const noexcept { return checkpoint_file_; }

    static std::string serialize(const fetch::TransferProgress& progress);
    static Result<fetch::TransferProgress> deserialize(const std::string& text);

private:
    std::filesystem::path checkpoint_file_;
};

} // namespace harvest::store
