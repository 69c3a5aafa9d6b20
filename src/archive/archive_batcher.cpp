#include "harvest/archive/archive_batcher.hpp"

#include "harvest/events/events.hpp"
#include "harvest/fetch/work_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <system_error>
#include <utility>

namespace harvest::archive {
namespace fs = std::filesystem;

namespace {

constexpr const char* kArchiveSuffix = ".zip";

} // namespace

ArchiveBatcher::ArchiveBatcher(fs::path archive_dir,
                               std::string prefix,
                               ArchiveWriter& writer,
                               events::EventBus& bus)
    : archive_dir_(std::move(archive_dir))
    , prefix_(std::move(prefix))
    , writer_(writer)
    , bus_(bus) {}

std::optional<std::uint64_t> ArchiveBatcher::parse_sequence(const std::string& filename,
                                                            const std::string& prefix) {
    const std::string suffix = kArchiveSuffix;
    if (filename.size() <= prefix.size() + suffix.size() ||
        filename.compare(0, prefix.size(), prefix) != 0 ||
        filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }

    const std::string digits = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    if (digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoull(digits);
}

fs::path ArchiveBatcher::archive_path_for(std::uint64_t sequence) const {
    char number[32];
    std::snprintf(number, sizeof(number), "%04llu", static_cast<unsigned long long>(sequence));
    return archive_dir_ / (prefix_ + number + kArchiveSuffix);
}

Result<std::uint64_t> ArchiveBatcher::highest_on_disk() const {
    std::uint64_t highest = 0;
    std::error_code ec;
    for (fs::directory_iterator it(archive_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (auto sequence = parse_sequence(it->path().filename().string(), prefix_)) {
            highest = std::max(highest, *sequence);
        }
    }
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::IoError,
                                  "cannot scan archive directory " + archive_dir_.string() + ": " + ec.message());
    }
    return Ok(highest);
}

Result<void> ArchiveBatcher::initialize() {
    std::error_code ec;
    fs::create_directories(archive_dir_, ec);
    if (ec) {
        return Err<void>(ErrorCode::IoError,
                         "cannot create archive directory " + archive_dir_.string() + ": " + ec.message());
    }

    auto highest = highest_on_disk();
    if (highest.is_error()) {
        return Err<void>(highest.error());
    }

    next_sequence_ = highest.value() + 1;
    spdlog::info("Archive directory {}: next archive is {}",
                 archive_dir_.string(), archive_path_for(next_sequence_).filename().string());
    return Ok();
}

Result<ArchiveBatch> ArchiveBatcher::seal(PendingArchiveSet& pending, const CancellationToken& cancel) {
    if (pending.empty()) {
        return Err<ArchiveBatch>(ErrorCode::InvalidArgument, "no pending files to archive");
    }

    // Vanished members carry no data; keep only what is still on disk
    std::error_code ec;
    const auto vanished = std::remove_if(pending.begin(), pending.end(), [&ec](const fs::path& member) {
        if (fs::is_regular_file(member, ec)) {
            return false;
        }
        spdlog::warn("Pending file {} no longer exists, dropping it", member.string());
        return true;
    });
    pending.erase(vanished, pending.end());
    if (pending.empty()) {
        return Err<ArchiveBatch>(ErrorCode::InvalidArgument, "none of the pending files exist any more");
    }

    fs::path target = archive_path_for(next_sequence_);
    if (fs::exists(target, ec)) {
        if (auto highest = highest_on_disk(); highest.is_ok()) {
            next_sequence_ = std::max(next_sequence_, highest.value() + 1);
        } else {
            spdlog::warn("{}; searching for a free archive name instead", highest.error().message);
        }
        while (fs::exists(target = archive_path_for(next_sequence_), ec)) {
            ++next_sequence_;
        }
        spdlog::warn("Archive name already taken, continuing at {}", target.filename().string());
    }

    spdlog::info("Creating archive {} with {} files", target.filename().string(), pending.size());
    auto written = writer_.write(target, pending, cancel);
    if (written.is_error()) {
        if (fs::exists(target, ec)) {
            fs::remove(target, ec);
            if (ec) {
                spdlog::error("Failed to remove partial archive {}: {}", target.string(), ec.message());
            }
        }
        bus_.emit(events::ArchiveFailedEvent{next_sequence_, target, pending.size(), describe(written.error())});
        return Err<ArchiveBatch>(written.error());
    }

    std::size_t delete_failures = 0;
    for (const auto& member : pending) {
        fs::remove(member, ec);
        if (ec) {
            ++delete_failures;
            spdlog::warn("Archived file {} could not be removed: {}", member.string(), ec.message());
        }
    }

    ArchiveBatch batch;
    batch.sequence_number = next_sequence_;
    batch.member_files = std::move(pending);
    batch.size_bytes = written.value();
    batch.archive_path = target;
    pending.clear();

    ++next_sequence_;
    ++sealed_count_;
    bus_.emit(events::ArchiveSealedEvent{batch.sequence_number, batch.archive_path,
                                         batch.member_files.size(), batch.size_bytes, delete_failures});
    return Ok(std::move(batch));
}

Result<PendingArchiveSet> rebuild_pending(const fs::path& download_dir,
                                          const std::string& extension,
                                          const fetch::PayloadSignature& signature) {
    PendingArchiveSet pending;
    std::error_code ec;
    if (!fs::exists(download_dir, ec)) {
        return Ok(std::move(pending));
    }

    for (fs::directory_iterator it(download_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !fetch::has_extension(path.filename().string(), extension)) {
            continue;
        }
        if (signature.matches_file(path)) {
            pending.push_back(fs::absolute(path));
        }
    }
    if (ec) {
        return Err<PendingArchiveSet>(ErrorCode::IoError,
                                      "cannot scan " + download_dir.string() + ": " + ec.message());
    }

    std::sort(pending.begin(), pending.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename() < b.filename();
    });
    return Ok(std::move(pending));
}

} // namespace harvest::archive
