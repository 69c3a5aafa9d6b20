#pragma once

/**
 * @file archive_batcher.hpp
 * @brief Seals accumulated downloads into sequentially numbered archives
 *
 * Archives are named <prefix><NNNN>.zip (at least four digits). The sequence
 * is derived from the archive directory on every start; there is no counter
 * file that could drift from what is actually on disk.
 *
 * SEAL GUARANTEES:
 * - Member files are deleted only after the archive was written and verified
 * - A failed seal leaves the pending set, the member files and the sequence
 *   number exactly as they were, and removes any partial archive it created
 * - Sequence numbers are never reused
 */

#include "harvest/archive/archive_writer.hpp"
#include "harvest/core/cancellation.hpp"
#include "harvest/core/result.hpp"
#include "harvest/events/event_bus.hpp"
#include "harvest/fetch/payload.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace harvest::archive {

/**
 * @brief Downloaded files not yet sealed into an archive, in download order
 */
using PendingArchiveSet = std::vector<std::filesystem::path>;

struct ArchiveBatch {
    std::uint64_t sequence_number = 0;
    std::vector<std::filesystem::path> member_files;
    std::uint64_t size_bytes = 0;
    std::filesystem::path archive_path;
};

class ArchiveBatcher {
public:
    ArchiveBatcher(std::filesystem::path archive_dir,
                   std::string prefix,
                   ArchiveWriter& writer,
                   events::EventBus& bus);

    /**
     * @brief Create the archive directory and derive the next sequence number
     *
     * Fails with IoError when the directory cannot be created or scanned.
     */
    Result<void> initialize();

    /**
     * @brief Write every file in @p pending into the next archive
     *
     * On success @p pending is cleared. On failure it is left untouched,
     * except that entries whose file has vanished are dropped.
     */
    Result<ArchiveBatch> seal(PendingArchiveSet& pending, const CancellationToken& cancel);

    [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
    [[nodiscard]] std::size_t sealed_count() const noexcept { return sealed_count_; }
    [[nodiscard]] const std::filesystem::path& archive_dir() const noexcept { return archive_dir_; }

    std::filesystem::path archive_path_for(std::uint64_t sequence) const;

    /**
     * @brief Sequence number of an archive filename, if it follows <prefix><digits>.zip
     */
    static std::optional<std::uint64_t> parse_sequence(const std::string& filename,
                                                       const std::string& prefix);

private:
    Result<std::uint64_t> highest_on_disk() const;

    std::filesystem::path archive_dir_;
    std::string prefix_;
    ArchiveWriter& writer_;
    events::EventBus& bus_;
    std::uint64_t next_sequence_ = 1;
    std::size_t sealed_count_ = 0;
};

/**
 * @brief Rebuild the pending set from the download directory
 *
 * Every regular file carrying @p extension whose leading bytes match
 * @p signature is pending, sorted by filename. Anything else (partial
 * ".part" files, gate pages saved by older versions) is ignored.
 */
Result<PendingArchiveSet> rebuild_pending(const std::filesystem::path& download_dir,
                                          const std::string& extension,
                                          const fetch::PayloadSignature& signature);

} // namespace harvest::archive
