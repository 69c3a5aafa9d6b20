#include "harvest/core/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace harvest {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> type_error(const std::string& key, const char* expected) {
    return Err<void>(ErrorCode::ParseError, "config key '" + key + "' must be " + expected);
}

Result<void> read_string(const json& object, const std::string& key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return type_error(key, "a string");
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> read_path(const json& object, const std::string& key, fs::path& out) {
    std::string value = out.string();
    if (auto res = read_string(object, key, value); res.is_error()) {
        return res;
    }
    out = fs::path(value);
    return Ok();
}

template<typename Integer>
Result<void> read_unsigned(const json& object, const std::string& key, Integer& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return type_error(key, "a non-negative integer");
    }
    out = static_cast<Integer>(it->get<std::uint64_t>());
    return Ok();
}

template<typename Duration>
Result<void> read_duration(const json& object, const std::string& key, Duration& out) {
    auto count = static_cast<std::uint64_t>(out.count());
    if (auto res = read_unsigned(object, key, count); res.is_error()) {
        return res;
    }
    out = Duration(static_cast<typename Duration::rep>(count));
    return Ok();
}

Result<void> read_string_list(const json& object, const std::string& key, std::vector<std::string>& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if (!it->is_array()) {
        return type_error(key, "an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& element : *it) {
        if (!element.is_string()) {
            return type_error(key, "an array of strings");
        }
        values.push_back(element.get<std::string>());
    }
    out = std::move(values);
    return Ok();
}

Result<void> apply_transfer(const json& node, TransferPolicy& policy) {
    if (!node.is_object()) {
        return type_error("transfer", "an object");
    }
    Result<void> steps[] = {
        read_duration(node, "inter_item_delay_ms", policy.inter_item_delay),
        read_unsigned(node, "error_streak_threshold", policy.error_streak_threshold),
        read_unsigned(node, "batch_threshold", policy.batch_threshold),
        read_unsigned(node, "checkpoint_interval", policy.checkpoint_interval),
        read_string(node, "magic_bytes", policy.magic_bytes),
        read_string_list(node, "gate_markers", policy.gate_markers),
        read_duration(node, "request_timeout_s", policy.request_timeout),
        read_unsigned(node, "max_body_bytes", policy.max_body_bytes),
        read_unsigned(node, "max_redirects", policy.max_redirects),
        read_string(node, "user_agent", policy.user_agent),
    };
    for (const auto& step : steps) {
        if (step.is_error()) {
            return step;
        }
    }
    return Ok();
}

Result<void> apply_recovery(const json& node, RecoveryPolicy& policy) {
    if (!node.is_object()) {
        return type_error("recovery", "an object");
    }
    Result<void> steps[] = {
        read_unsigned(node, "max_session_failures", policy.max_session_failures),
        read_duration(node, "recovery_pause_ms", policy.recovery_pause),
        read_duration(node, "session_timeout_s", policy.session_timeout),
    };
    for (const auto& step : steps) {
        if (step.is_error()) {
            return step;
        }
    }
    return Ok();
}

} // namespace

fs::path HarvestConfig::resolved_archive_dir() const {
    return archive_dir.empty() ? download_dir / "zipped" : archive_dir;
}

fs::path HarvestConfig::resolved_checkpoint_file() const {
    return checkpoint_file.empty() ? download_dir / "download_progress.json" : checkpoint_file;
}

Result<void> HarvestConfig::validate() const {
    if (download_dir.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "download_dir must not be empty");
    }
    if (transfer.magic_bytes.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.magic_bytes must not be empty");
    }
    if (transfer.error_streak_threshold == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.error_streak_threshold must be > 0");
    }
    if (transfer.batch_threshold == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.batch_threshold must be > 0");
    }
    if (transfer.checkpoint_interval == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.checkpoint_interval must be > 0");
    }
    if (transfer.max_body_bytes == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.max_body_bytes must be > 0");
    }
    if (recovery.max_session_failures == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "recovery.max_session_failures must be > 0");
    }
    if (archive_prefix.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "archive_prefix must not be empty");
    }
    return Ok();
}

Result<HarvestConfig> parse_config(const std::string& json_text) {
    const auto document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return Err<HarvestConfig>(ErrorCode::ParseError, "config is not valid JSON");
    }
    if (!document.is_object()) {
        return Err<HarvestConfig>(ErrorCode::ParseError, "config root must be an object");
    }

    HarvestConfig config;
    Result<void> steps[] = {
        read_path(document, "url_list", config.url_list),
        read_path(document, "download_dir", config.download_dir),
        read_path(document, "archive_dir", config.archive_dir),
        read_path(document, "checkpoint_file", config.checkpoint_file),
        read_path(document, "cookie_file", config.cookie_file),
        read_string(document, "refresh_command", config.refresh_command),
        read_string(document, "file_extension", config.file_extension),
        read_string(document, "archive_prefix", config.archive_prefix),
        read_string(document, "log_level", config.log_level),
    };
    for (const auto& step : steps) {
        if (step.is_error()) {
            return Err<HarvestConfig>(step.error());
        }
    }

    if (auto it = document.find("transfer"); it != document.end()) {
        if (auto res = apply_transfer(*it, config.transfer); res.is_error()) {
            return Err<HarvestConfig>(res.error());
        }
    }
    if (auto it = document.find("recovery"); it != document.end()) {
        if (auto res = apply_recovery(*it, config.recovery); res.is_error()) {
            return Err<HarvestConfig>(res.error());
        }
    }

    if (auto res = config.validate(); res.is_error()) {
        return Err<HarvestConfig>(res.error());
    }
    return Ok(std::move(config));
}

Result<HarvestConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<HarvestConfig>(ErrorCode::IoError, "failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

Result<std::uint64_t> parse_count(const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument, "'" + text + "' is not a non-negative integer");
    }
    try {
        return Ok<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument, "'" + text + "' is out of range");
    }
}

} // namespace harvest
