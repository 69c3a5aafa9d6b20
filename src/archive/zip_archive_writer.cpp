#include "harvest/archive/archive_writer.hpp"

#include <spdlog/spdlog.h>
#include <zip.h>

#include <memory>
#include <string>
#include <system_error>

namespace harvest::archive {
namespace fs = std::filesystem;

namespace {

// Abandons an unfinished archive; released once zip_close() has committed
struct ZipDiscard {
    void operator()(zip_t* archive) const noexcept { zip_discard(archive); }
};
using ZipHandle = std::unique_ptr<zip_t, ZipDiscard>;

std::string open_error_text(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string text = zip_error_strerror(&error);
    zip_error_fini(&error);
    return text;
}

int cancel_requested(zip_t*, void* state) {
    return static_cast<const CancellationToken*>(state)->is_cancelled() ? 1 : 0;
}

} // namespace

Result<std::uint64_t> ZipArchiveWriter::write(const fs::path& archive_path,
                                              const std::vector<fs::path>& members,
                                              const CancellationToken& cancel) {
    if (members.empty()) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument, "refusing to write an empty archive");
    }

    int open_error = 0;
    ZipHandle archive(zip_open(archive_path.c_str(), ZIP_CREATE | ZIP_EXCL, &open_error));
    if (!archive) {
        return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                  "cannot create " + archive_path.string() + ": " + open_error_text(open_error));
    }

    for (std::size_t i = 0; i < members.size(); ++i) {
        if (cancel.is_cancelled()) {
            return Err<std::uint64_t>(ErrorCode::Cancelled, "archive write cancelled");
        }

        const auto& member = members[i];
        zip_source_t* source = zip_source_file(archive.get(), member.c_str(), 0, 0);
        if (source == nullptr) {
            return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                      "cannot read " + member.string() + ": " + zip_strerror(archive.get()));
        }

        const std::string entry_name = member.filename().string();
        const zip_int64_t index = zip_file_add(archive.get(), entry_name.c_str(), source, ZIP_FL_ENC_UTF_8);
        if (index < 0) {
            zip_source_free(source);
            return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                      "cannot add " + entry_name + ": " + zip_strerror(archive.get()));
        }
        if (zip_set_file_compression(archive.get(), static_cast<zip_uint64_t>(index), ZIP_CM_DEFLATE, 0) != 0) {
            return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                      "cannot compress " + entry_name + ": " + zip_strerror(archive.get()));
        }

        if ((i + 1) % kProgressEvery == 0) {
            spdlog::info("Archiving {}: {}/{} files", archive_path.filename().string(), i + 1, members.size());
        }
    }

    // Checked by libzip between entries while the archive is being written out
    zip_register_cancel_callback_with_state(archive.get(), cancel_requested, nullptr,
                                            const_cast<CancellationToken*>(&cancel));

    if (zip_close(archive.get()) != 0) {
        const std::string reason = zip_strerror(archive.get());
        if (cancel.is_cancelled()) {
            return Err<std::uint64_t>(ErrorCode::Cancelled, "archive write cancelled");
        }
        return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                  "cannot write " + archive_path.string() + ": " + reason);
    }
    archive.release();

    return verify(archive_path, members.size());
}

Result<std::uint64_t> ZipArchiveWriter::verify(const fs::path& archive_path, std::size_t expected_entries) {
    std::error_code ec;
    const auto size = fs::file_size(archive_path, ec);
    if (ec || size == 0) {
        return Err<std::uint64_t>(ErrorCode::ArchiveError, "archive " + archive_path.string() + " is missing or empty");
    }

    int open_error = 0;
    ZipHandle archive(zip_open(archive_path.c_str(), ZIP_RDONLY | ZIP_CHECKCONS, &open_error));
    if (!archive) {
        return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                  "archive " + archive_path.string() + " failed verification: " +
                                  open_error_text(open_error));
    }

    const zip_int64_t entries = zip_get_num_entries(archive.get(), 0);
    if (entries < 0 || static_cast<std::size_t>(entries) != expected_entries) {
        return Err<std::uint64_t>(ErrorCode::ArchiveError,
                                  "archive " + archive_path.string() + " holds " + std::to_string(entries) +
                                  " entries, expected " + std::to_string(expected_entries));
    }
    return Ok(static_cast<std::uint64_t>(size));
}

} // namespace harvest::archive
