#include "harvest/archive/archive_writer.hpp"
#include "harvest/core/cancellation.hpp"
#include "harvest/core/config.hpp"
#include "harvest/engine/recovery_controller.hpp"
#include "harvest/events/components.hpp"
#include "harvest/events/event_bus.hpp"
#include "harvest/network/curl_http_client.hpp"
#include "harvest/session/cookie_file_provider.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitUsage = 1;
constexpr int kExitAborted = 2;
constexpr int kExitCancelled = 130;

// Global token for signal handling
harvest::CancellationToken* g_cancel = nullptr;

void signal_handler(int) {
    if (g_cancel) {
        g_cancel->request_cancel();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE            JSON configuration file\n";
    std::cout << "  --url-list FILE          URL list, one URL per line (default: url_list.txt)\n";
    std::cout << "  --download-dir DIR       Download directory (default: downloads)\n";
    std::cout << "  --archive-dir DIR        Archive directory (default: <download-dir>/zipped)\n";
    std::cout << "  --cookies FILE           Netscape cookies.txt export (default: cookies.txt)\n";
    std::cout << "  --refresh-command CMD    Shell command that renews the cookies file\n";
    std::cout << "  --delay-ms N             Pause between requests (default: 300)\n";
    std::cout << "  --batch-size N           Files per archive (default: 1000)\n";
    std::cout << "  --log-level LEVEL        trace, debug, info, warn, error (default: info)\n";
    std::cout << "  --log-file FILE          Also write the log to FILE\n";
    std::cout << "  --help                   Show this help message\n";
}

struct Overrides {
    std::optional<std::string> config_file;
    std::optional<std::string> url_list;
    std::optional<std::string> download_dir;
    std::optional<std::string> archive_dir;
    std::optional<std::string> cookie_file;
    std::optional<std::string> refresh_command;
    std::optional<std::uint64_t> delay_ms;
    std::optional<std::uint64_t> batch_size;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
};

bool configure_logging(const std::string& level_name, const std::optional<std::string>& log_file) {
    const auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::error("Unknown log level: {}", level_name);
        return false;
    }

    if (log_file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", *log_file, e.what());
            return false;
        }
        auto logger = std::make_shared<spdlog::logger>("harvest", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
    }

    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    Overrides overrides;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return kExitCompleted;
        }

        if (i + 1 >= argc) {
            spdlog::error("{} requires a value", arg);
            print_usage(argv[0]);
            return kExitUsage;
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            overrides.config_file = value;
        } else if (arg == "--url-list") {
            overrides.url_list = value;
        } else if (arg == "--download-dir") {
            overrides.download_dir = value;
        } else if (arg == "--archive-dir") {
            overrides.archive_dir = value;
        } else if (arg == "--cookies") {
            overrides.cookie_file = value;
        } else if (arg == "--refresh-command") {
            overrides.refresh_command = value;
        } else if (arg == "--delay-ms" || arg == "--batch-size") {
            auto number = harvest::parse_count(value);
            if (number.is_error()) {
                spdlog::error("Invalid number for {}: {}", arg, number.error().message);
                return kExitUsage;
            }
            (arg == "--delay-ms" ? overrides.delay_ms : overrides.batch_size) = number.value();
        } else if (arg == "--log-level") {
            overrides.log_level = value;
        } else if (arg == "--log-file") {
            overrides.log_file = value;
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    harvest::HarvestConfig config;
    if (overrides.config_file) {
        auto loaded = harvest::load_config(*overrides.config_file);
        if (loaded.is_error()) {
            spdlog::error("Invalid configuration {}: {}", *overrides.config_file, harvest::describe(loaded.error()));
            return kExitUsage;
        }
        config = std::move(loaded.value());
    }

    if (overrides.url_list) config.url_list = *overrides.url_list;
    if (overrides.download_dir) config.download_dir = *overrides.download_dir;
    if (overrides.archive_dir) config.archive_dir = *overrides.archive_dir;
    if (overrides.cookie_file) config.cookie_file = *overrides.cookie_file;
    if (overrides.refresh_command) config.refresh_command = *overrides.refresh_command;
    if (overrides.delay_ms) config.transfer.inter_item_delay = std::chrono::milliseconds(*overrides.delay_ms);
    if (overrides.batch_size) config.transfer.batch_threshold = *overrides.batch_size;
    if (overrides.log_level) config.log_level = *overrides.log_level;

    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("Invalid configuration: {}", harvest::describe(valid.error()));
        return kExitUsage;
    }
    if (!configure_logging(config.log_level, overrides.log_file)) {
        return kExitUsage;
    }

    spdlog::info("====================================");
    spdlog::info("harvest - resumable download and archive");
    spdlog::info("====================================");
    spdlog::info("  URL list:     {}", config.url_list.string());
    spdlog::info("  Downloads:    {}", config.download_dir.string());
    spdlog::info("  Archives:     {}", config.resolved_archive_dir().string());
    spdlog::info("  Checkpoint:   {}", config.resolved_checkpoint_file().string());
    spdlog::info("  Cookies:      {}", config.cookie_file.string());
    spdlog::info("  Delay:        {} ms", config.transfer.inter_item_delay.count());
    spdlog::info("  Batch size:   {}", config.transfer.batch_threshold);

    harvest::events::EventBus event_bus;
    harvest::events::LoggerComponent logger(event_bus);
    harvest::events::MetricsComponent metrics(event_bus);

    harvest::network::CurlHttpClient::Options client_options;
    client_options.user_agent = config.transfer.user_agent;
    client_options.timeout = config.transfer.request_timeout;
    client_options.max_body_bytes = config.transfer.max_body_bytes;
    client_options.max_redirects = config.transfer.max_redirects;
    harvest::network::CurlHttpClient http_client(client_options);

    harvest::session::CookieFileSessionProvider sessions(config.cookie_file, config.refresh_command);
    harvest::archive::ZipArchiveWriter archive_writer;

    harvest::CancellationToken cancel;
    g_cancel = &cancel;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    harvest::engine::RecoveryController controller(config, sessions, http_client, archive_writer, event_bus);
    const auto report = controller.run(cancel);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel = nullptr;

    metrics.print_stats();

    if (report.completed()) {
        return kExitCompleted;
    }
    if (report.abort_reason == harvest::engine::AbortReason::Cancelled) {
        spdlog::warn("Interrupted; rerun to resume at item {}", report.progress.last_processed_index + 1);
        return kExitCancelled;
    }
    spdlog::error("Run aborted: {}", report.message);
    return kExitAborted;
}
