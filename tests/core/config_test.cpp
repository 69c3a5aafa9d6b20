#include "harvest/core/config.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

using harvest::ErrorCode;
using harvest::HarvestConfig;
using harvest::load_config;
using harvest::parse_config;
using harvest::parse_count;
using namespace std::chrono_literals;

TEST(HarvestConfigTest, DefaultsMatchTheShippedTool) {
    HarvestConfig config;
    EXPECT_EQ(config.transfer.inter_item_delay, 300ms);
    EXPECT_EQ(config.transfer.error_streak_threshold, 10u);
    EXPECT_EQ(config.transfer.batch_threshold, 1000u);
    EXPECT_EQ(config.transfer.checkpoint_interval, 100u);
    EXPECT_EQ(config.transfer.magic_bytes, "%PDF");
    EXPECT_EQ(config.recovery.max_session_failures, 5u);
    EXPECT_EQ(config.recovery.recovery_pause, 2000ms);
    EXPECT_EQ(config.file_extension, ".pdf");
    EXPECT_EQ(config.archive_prefix, "batch_");
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(HarvestConfigTest, DerivedPathsFollowDownloadDir) {
    HarvestConfig config;
    config.download_dir = "/data/dl";
    EXPECT_EQ(config.resolved_archive_dir(), std::filesystem::path("/data/dl/zipped"));
    EXPECT_EQ(config.resolved_checkpoint_file(), std::filesystem::path("/data/dl/download_progress.json"));

    config.archive_dir = "/archive";
    config.checkpoint_file = "/state/progress.json";
    EXPECT_EQ(config.resolved_archive_dir(), std::filesystem::path("/archive"));
    EXPECT_EQ(config.resolved_checkpoint_file(), std::filesystem::path("/state/progress.json"));
}

TEST(HarvestConfigTest, ParseOverridesOnlyPresentKeys) {
    auto parsed = parse_config(R"({
        "download_dir": "out",
        "archive_prefix": "docs_",
        "transfer": { "inter_item_delay_ms": 50, "batch_threshold": 20, "gate_markers": ["captcha"] },
        "recovery": { "max_session_failures": 3 }
    })");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;

    const auto& config = parsed.value();
    EXPECT_EQ(config.download_dir, std::filesystem::path("out"));
    EXPECT_EQ(config.archive_prefix, "docs_");
    EXPECT_EQ(config.transfer.inter_item_delay, 50ms);
    EXPECT_EQ(config.transfer.batch_threshold, 20u);
    ASSERT_EQ(config.transfer.gate_markers.size(), 1u);
    EXPECT_EQ(config.transfer.gate_markers[0], "captcha");
    EXPECT_EQ(config.transfer.error_streak_threshold, 10u);
    EXPECT_EQ(config.recovery.max_session_failures, 3u);
    EXPECT_EQ(config.recovery.recovery_pause, 2000ms);
}

TEST(HarvestConfigTest, RejectsWrongTypes) {
    auto parsed = parse_config(R"({ "transfer": { "batch_threshold": "many" } })");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::ParseError);

    parsed = parse_config(R"({ "transfer": { "inter_item_delay_ms": -5 } })");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::ParseError);

    parsed = parse_config(R"([1, 2, 3])");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::ParseError);

    parsed = parse_config("{ not json");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::ParseError);
}

TEST(HarvestConfigTest, RejectsZeroThresholds) {
    auto parsed = parse_config(R"({ "transfer": { "error_streak_threshold": 0 } })");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);

    parsed = parse_config(R"({ "recovery": { "max_session_failures": 0 } })");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST(HarvestConfigTest, LoadFromFile) {
    const auto dir = harvest::test_support::create_temp_dir("config");
    const auto file = dir / "harvest.json";
    harvest::test_support::write_file(file, R"({ "url_list": "list.txt", "cookie_file": "c.txt" })");

    auto loaded = load_config(file);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().url_list, std::filesystem::path("list.txt"));
    EXPECT_EQ(loaded.value().cookie_file, std::filesystem::path("c.txt"));

    auto missing = load_config(dir / "absent.json");
    EXPECT_TRUE(missing.is_error());
}

TEST(ParseCountTest, AcceptsPlainDigits) {
    ASSERT_TRUE(parse_count("0").is_ok());
    EXPECT_EQ(parse_count("0").value(), 0u);
    EXPECT_EQ(parse_count("250").value(), 250u);
    EXPECT_EQ(parse_count("18446744073709551615").value(), 18446744073709551615ULL);
}

TEST(ParseCountTest, RejectsNegativeAndMalformedValues) {
    for (const char* text : {"-1", "+5", "", " 7", "7 ", "12abc", "0x10", "1.5"}) {
        auto parsed = parse_count(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument) << text;
    }
}

TEST(ParseCountTest, RejectsValuesBeyondRange) {
    auto parsed = parse_count("18446744073709551616");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}
