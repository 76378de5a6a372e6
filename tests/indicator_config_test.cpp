#include <gtest/gtest.h>

#include "IndicatorConfig.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace demark;

TEST(EngineConfigParserTest, DefaultsMatchClassicParameters) {
    EngineConfig config;
    EXPECT_EQ(config.moving_average.lookback_period, 12);
    EXPECT_EQ(config.moving_average.ma_period, 5);
    EXPECT_EQ(config.moving_average.extension_bars, 4);
    EXPECT_EQ(config.setup.comparison_lag, 4);
    EXPECT_EQ(config.setup.target, 9);
    EXPECT_EQ(config.countdown.target, 13);
    EXPECT_EQ(config.countdown.high_lag, 2);
    EXPECT_EQ(config.countdown.start_policy, CountdownStartPolicy::NextBar);
    EXPECT_EQ(config.setup.follow_through_policy, FollowThroughPolicy::Sticky);
    EXPECT_EQ(config.moving_average.sma_policy, SmaWarmupPolicy::Lenient);
    EXPECT_DOUBLE_EQ(config.exit.tranche1_fraction, 0.30);
    EXPECT_EQ(config.exit.time_stop_days, 20);

    std::string error;
    EXPECT_TRUE(EngineConfigParser::validate(config, error));
    EXPECT_TRUE(error.empty());
}

TEST(EngineConfigParserTest, EmptyObjectKeepsDefaults) {
    auto result = EngineConfigParser::parse_string("{}");
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.config, EngineConfig{});
}

TEST(EngineConfigParserTest, RoundTripsThroughJson) {
    EngineConfig config;
    config.moving_average.lookback_period = 10;
    config.moving_average.sma_policy = SmaWarmupPolicy::Strict;
    config.setup.follow_through_policy = FollowThroughPolicy::ResetOnRunBreak;
    config.countdown.start_policy = CountdownStartPolicy::SameBar;
    config.ma2_blue.slow_period = 21;
    config.exhaustion.compression_ratio = 0.65;
    config.exit.tranche1_fraction = 0.25;
    config.exit.time_stop_days = 15;
    config.log_level = LogLevel::Debug;

    auto result = EngineConfigParser::parse_string(EngineConfigParser::to_json_string(config));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.config, config);
}

TEST(EngineConfigParserTest, PartialSectionsOverrideOnlyGivenKeys) {
    auto result = EngineConfigParser::parse_string(R"({
        "setup": {"follow_through_policy": "reset_on_run_break"},
        "exit": {"time_stop_days": 30}
    })");
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.config.setup.follow_through_policy, FollowThroughPolicy::ResetOnRunBreak);
    EXPECT_EQ(result.config.setup.target, 9);
    EXPECT_EQ(result.config.exit.time_stop_days, 30);
    EXPECT_DOUBLE_EQ(result.config.exit.tranche2_fraction, 0.45);
}

TEST(EngineConfigParserTest, UnknownPolicyFails) {
    auto result = EngineConfigParser::parse_string(R"({"countdown": {"start_policy": "whenever"}})");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("whenever"), std::string::npos);
}

TEST(EngineConfigParserTest, WrongTypesFail) {
    EXPECT_FALSE(EngineConfigParser::parse_string(R"({"setup": {"target": "nine"}})").success);
    EXPECT_FALSE(EngineConfigParser::parse_string(R"({"setup": 9})").success);
    EXPECT_FALSE(EngineConfigParser::parse_string("[1, 2, 3]").success);
}

TEST(EngineConfigParserTest, MalformedJsonFails) {
    auto result = EngineConfigParser::parse_string("{\"setup\": ");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST(EngineConfigParserTest, OutOfRangeValuesFailValidation) {
    auto result = EngineConfigParser::parse_string(R"({"moving_average": {"lookback_period": 0}})");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("moving_average"), std::string::npos);

    EXPECT_FALSE(EngineConfigParser::parse_string(R"({"exit": {"tranche3_fraction": -0.1}})").success);
    EXPECT_FALSE(EngineConfigParser::parse_string(R"({"exhaustion": {"stall_ratio": 0}})").success);

    auto negative = EngineConfigParser::parse_string(R"({"exhaustion": {"vulnerable_countdown": -1}})");
    EXPECT_FALSE(negative.success);
    EXPECT_NE(negative.error_message.find("vulnerable_countdown"), std::string::npos);
}

TEST(EngineConfigParserTest, ParsesFileAndReportsMissingFile) {
    const auto path = std::filesystem::temp_directory_path() / "demark_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"moving_average": {"extension_bars": 6}, "log_level": "warning"})";
    }

    auto result = EngineConfigParser::parse_file(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.config.moving_average.extension_bars, 6);
    EXPECT_EQ(result.config.log_level, LogLevel::Warning);

    auto missing = EngineConfigParser::parse_file((std::filesystem::temp_directory_path() / "no_such_demark.json").string());
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.error_message.find("Unable to open"), std::string::npos);
}

TEST(EngineConfigParserTest, PolicyNamesRoundTrip) {
    EXPECT_EQ(parse_sma_warmup_policy(to_string(SmaWarmupPolicy::Strict)), SmaWarmupPolicy::Strict);
    EXPECT_EQ(parse_follow_through_policy(to_string(FollowThroughPolicy::Sticky)), FollowThroughPolicy::Sticky);
    EXPECT_EQ(parse_countdown_start_policy("same_bar"), CountdownStartPolicy::SameBar);
    EXPECT_FALSE(parse_countdown_start_policy("SAME_BAR").has_value());
}
