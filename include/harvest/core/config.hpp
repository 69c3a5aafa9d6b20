#pragma once

#include "harvest/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace harvest {

/**
 * @brief Knobs of the per-item transfer loop
 *
 * Defaults reproduce the pacing and sensitivity the downloader has always
 * shipped with.
 */
struct TransferPolicy {
    std::chrono::milliseconds inter_item_delay{300};
    std::size_t error_streak_threshold = 10;   ///< Consecutive content mismatches before expiry
    std::size_t batch_threshold = 1000;        ///< Pending files that trigger an archive seal
    std::size_t checkpoint_interval = 100;     ///< Settled items between checkpoint saves
    std::string magic_bytes = "%PDF";
    std::vector<std::string> gate_markers{"age-verify", "Age Verification"};
    std::chrono::seconds request_timeout{120};
    std::uint64_t max_body_bytes = 512ULL * 1024 * 1024;
    std::size_t max_redirects = 5;
    std::string user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
};

/**
 * @brief Knobs of the session-recovery circuit breaker
 */
struct RecoveryPolicy {
    std::size_t max_session_failures = 5;
    std::chrono::milliseconds recovery_pause{2000};
    std::chrono::seconds session_timeout{300};
};

struct HarvestConfig {
    std::filesystem::path url_list = "url_list.txt";
    std::filesystem::path download_dir = "downloads";
    std::filesystem::path archive_dir;         ///< Empty means <download_dir>/zipped
    std::filesystem::path checkpoint_file;     ///< Empty means <download_dir>/download_progress.json
    std::filesystem::path cookie_file = "cookies.txt";
    std::string refresh_command;               ///< Optional shell command that renews cookie_file
    std::string file_extension = ".pdf";
    std::string archive_prefix = "batch_";
    std::string log_level = "info";
    TransferPolicy transfer;
    RecoveryPolicy recovery;

    std::filesystem::path resolved_archive_dir() const;
    std::filesystem::path resolved_checkpoint_file() const;

    /**
     * @brief Reject configurations the engine cannot honour (zero thresholds, empty paths)
     */
    Result<void> validate() const;
};

/**
 * @brief Load a JSON configuration file on top of the defaults
 *
 * Keys absent from the document keep their default value. Keys with the
 * wrong JSON type are reported as ParseError.
 */
Result<HarvestConfig> load_config(const std::filesystem::path& path);

Result<HarvestConfig> parse_config(const std::string& json_text);

/**
 * @brief Parse a non-negative decimal count given on the command line
 *
 * Only digits are accepted. Signs, whitespace and values beyond
 * uint64 are InvalidArgument.
 */
Result<std::uint64_t> parse_count(const std::string& text);

} // namespace harvest
