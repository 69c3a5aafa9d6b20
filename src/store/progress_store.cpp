#include "harvest/store/progress_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace harvest::store {
namespace fs = std::filesystem;
using json = nlohmann::json;
using fetch::TransferProgress;

namespace {

std::string format_utc(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_utc(const std::string& text) {
    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    if (iss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&utc));
}

} // namespace

ProgressStore::ProgressStore(fs::path checkpoint_file) : checkpoint_file_(std::move(checkpoint_file)) {}

std::string ProgressStore::serialize(const TransferProgress& progress) {
    json document = {
        {"last_processed_index", progress.last_processed_index},
        {"success_count", progress.success_count},
        {"error_count", progress.error_count},
        {"last_update", format_utc(progress.last_update)},
    };
    return document.dump(2);
}

Result<TransferProgress> ProgressStore::deserialize(const std::string& text) {
    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<TransferProgress>(ErrorCode::ParseError, "checkpoint is not a JSON object");
    }

    TransferProgress progress;
    const std::pair<const char*, std::uint64_t*> counters[] = {
        {"success_count", &progress.success_count},
        {"error_count", &progress.error_count},
    };

    auto index = document.find("last_processed_index");
    if (index == document.end() || !index->is_number_unsigned()) {
        return Err<TransferProgress>(ErrorCode::ParseError,
                                     "checkpoint field 'last_processed_index' must be a non-negative integer");
    }
    progress.last_processed_index = index->get<std::size_t>();

    for (const auto& [key, target] : counters) {
        auto it = document.find(key);
        if (it == document.end() || !it->is_number_unsigned()) {
            return Err<TransferProgress>(ErrorCode::ParseError,
                                         std::string("checkpoint field '") + key + "' must be a non-negative integer");
        }
        *target = it->get<std::uint64_t>();
    }

    // A missing or malformed timestamp is cosmetic and does not invalidate the cursor
    if (auto it = document.find("last_update"); it != document.end() && it->is_string()) {
        if (auto parsed = parse_utc(it->get<std::string>())) {
            progress.last_update = *parsed;
        }
    }
    return Ok(progress);
}

TransferProgress ProgressStore::load() const {
    std::error_code ec;
    if (!fs::exists(checkpoint_file_, ec)) {
        spdlog::info("No checkpoint at {}, starting fresh", checkpoint_file_.string());
        return TransferProgress{};
    }

    std::ifstream input(checkpoint_file_);
    if (!input) {
        spdlog::warn("Checkpoint {} is unreadable, starting fresh", checkpoint_file_.string());
        return TransferProgress{};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = deserialize(buffer.str());
    if (parsed.is_error()) {
        spdlog::warn("Checkpoint {} is corrupt ({}), starting fresh",
                     checkpoint_file_.string(), parsed.error().message);
        return TransferProgress{};
    }

    const auto& progress = parsed.value();
    spdlog::info("Loaded progress: last index {} (success={}, errors={})",
                 progress.last_processed_index, progress.success_count, progress.error_count);
    return progress;
}

Result<void> ProgressStore::save(const TransferProgress& progress) const {
    std::error_code ec;
    const auto parent = checkpoint_file_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Err<void>(ErrorCode::IoError, "failed to create checkpoint directory: " + ec.message());
        }
    }

    fs::path temp = checkpoint_file_;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::IoError, "failed to open " + temp.string());
        }
        output << serialize(progress) << '\n';
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::IoError, "failed to write " + temp.string());
        }
    }

    fs::rename(temp, checkpoint_file_, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(ErrorCode::IoError, "failed to replace checkpoint " + checkpoint_file_.string());
    }
    return Ok();
}

} // namespace harvest::store
