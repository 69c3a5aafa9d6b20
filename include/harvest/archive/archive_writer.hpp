#pragma once

#include "harvest/core/cancellation.hpp"
#include "harvest/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace harvest::archive {

/**
 * @brief Writes one archive from a list of member files
 *
 * Contract:
 * - @p archive_path does not exist on entry and must be created exclusively
 * - each member is stored under its filename
 * - on success the archive has been verified and its size in bytes is returned
 * - on failure no committed archive may remain at @p archive_path
 */
class ArchiveWriter {
public:
    virtual ~ArchiveWriter() = default;

    virtual Result<std::uint64_t> write(const std::filesystem::path& archive_path,
                                        const std::vector<std::filesystem::path>& members,
                                        const CancellationToken& cancel) = 0;
};

/**
 * @brief ZIP archives through libzip
 *
 * zip_close() is the commit point: libzip writes to a temporary file beside
 * the target and renames it into place, so a crash or a cancelled write never
 * leaves a truncated archive under the final name.
 */
class ZipArchiveWriter : public ArchiveWriter {
public:
    static constexpr std::size_t kProgressEvery = 100;

    Result<std::uint64_t> write(const std::filesystem::path& archive_path,
                                const std::vector<std::filesystem::path>& members,
                                const CancellationToken& cancel) override;

    /**
     * @brief Reopen @p archive_path with consistency checks and count its entries
     */
    static Result<std::uint64_t> verify(const std::filesystem::path& archive_path,
                                        std::size_t expected_entries);
};

} // namespace harvest::archive
