#include "IndicatorConfig.hpp"

#include "JsonFormat.hpp"

#include <json/json.h>

#include <fstream>
#include <sstream>

namespace demark {

namespace {

bool read_int(const Json::Value& section, const char* key, int& target, std::string& error)
{
    if (!section.isMember(key)) {
        return true;
    }
    const Json::Value& value = section[key];
    if (!value.isInt()) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    target = value.asInt();
    return true;
}

bool read_double(const Json::Value& section, const char* key, double& target, std::string& error)
{
    if (!section.isMember(key)) {
        return true;
    }
    const Json::Value& value = section[key];
    if (!value.isNumeric()) {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    target = value.asDouble();
    return true;
}

template <typename Policy, typename ParseFn>
bool read_policy(const Json::Value& section, const char* key, Policy& target, ParseFn parse,
                 std::string& error)
{
    if (!section.isMember(key)) {
        return true;
    }
    const Json::Value& value = section[key];
    if (!value.isString()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    const auto parsed = parse(value.asString());
    if (!parsed) {
        error = "Unknown " + std::string(key) + " '" + value.asString() + "'";
        return false;
    }
    target = *parsed;
    return true;
}

bool section_of(const Json::Value& root, const char* name, Json::Value& section, std::string& error)
{
    if (!root.isMember(name)) {
        section = Json::Value(Json::objectValue);
        return true;
    }
    section = root[name];
    if (!section.isObject()) {
        error = std::string("Section '") + name + "' must be an object";
        return false;
    }
    return true;
}

bool populate_config(const Json::Value& root, EngineConfig& config, std::string& error)
{
    if (!root.isObject()) {
        error = "Config JSON must be an object";
        return false;
    }

    Json::Value section;

    if (!section_of(root, "moving_average", section, error)
        || !read_int(section, "lookback_period", config.moving_average.lookback_period, error)
        || !read_int(section, "ma_period", config.moving_average.ma_period, error)
        || !read_int(section, "extension_bars", config.moving_average.extension_bars, error)
        || !read_policy(section, "sma_warmup_policy", config.moving_average.sma_policy,
                        parse_sma_warmup_policy, error)) {
        return false;
    }

    if (!section_of(root, "setup", section, error)
        || !read_int(section, "comparison_lag", config.setup.comparison_lag, error)
        || !read_int(section, "target", config.setup.target, error)
        || !read_policy(section, "follow_through_policy", config.setup.follow_through_policy,
                        parse_follow_through_policy, error)) {
        return false;
    }

    if (!section_of(root, "countdown", section, error)
        || !read_int(section, "target", config.countdown.target, error)
        || !read_int(section, "high_lag", config.countdown.high_lag, error)
        || !read_policy(section, "start_policy", config.countdown.start_policy,
                        parse_countdown_start_policy, error)) {
        return false;
    }

    if (!section_of(root, "ma2_blue", section, error)
        || !read_int(section, "fast_period", config.ma2_blue.fast_period, error)
        || !read_int(section, "slow_period", config.ma2_blue.slow_period, error)
        || !read_int(section, "fast_roc_lag", config.ma2_blue.fast_roc_lag, error)
        || !read_int(section, "slow_roc_lag", config.ma2_blue.slow_roc_lag, error)) {
        return false;
    }

    if (!section_of(root, "exhaustion", section, error)
        || !read_int(section, "range_window", config.exhaustion.range_window, error)
        || !read_double(section, "compression_ratio", config.exhaustion.compression_ratio, error)
        || !read_double(section, "stall_ratio", config.exhaustion.stall_ratio, error)
        || !read_int(section, "vulnerable_countdown", config.exhaustion.vulnerable_countdown, error)) {
        return false;
    }

    if (!section_of(root, "exit", section, error)
        || !read_double(section, "tranche1_fraction", config.exit.tranche1_fraction, error)
        || !read_double(section, "tranche2_fraction", config.exit.tranche2_fraction, error)
        || !read_double(section, "tranche3_fraction", config.exit.tranche3_fraction, error)
        || !read_int(section, "follow_through_bars", config.exit.follow_through_bars, error)
        || !read_double(section, "weak_close_range_pct", config.exit.weak_close_range_pct, error)
        || !read_int(section, "time_stop_days", config.exit.time_stop_days, error)
        || !read_int(section, "post_setup_extension_bars", config.exit.post_setup_extension_bars, error)) {
        return false;
    }

    if (!read_policy(root, "log_level", config.log_level, parse_log_level, error)) {
        return false;
    }

    return EngineConfigParser::validate(config, error);
}

ConfigParseResult parse_stream(std::istream& input, const std::string& origin)
{
    ConfigParseResult result;

    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    if (!Json::parseFromStream(builder, input, &root, &errs)) {
        result.error_message = errs.empty() ? "Failed to parse config JSON from " + origin : errs;
        return result;
    }

    EngineConfig config;
    if (!populate_config(root, config, result.error_message)) {
        return result;
    }

    result.success = true;
    result.config = config;
    return result;
}

} // namespace

ConfigParseResult EngineConfigParser::parse_file(const std::string& file_path)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        ConfigParseResult result;
        result.error_message = "Unable to open config file '" + file_path + "' for reading";
        return result;
    }
    return parse_stream(in, "'" + file_path + "'");
}

ConfigParseResult EngineConfigParser::parse_string(const std::string& text)
{
    std::istringstream in(text);
    return parse_stream(in, "string");
}

std::string EngineConfigParser::to_json_string(const EngineConfig& config)
{
    Json::Value root(Json::objectValue);

    Json::Value& ma = root["moving_average"];
    ma["lookback_period"] = config.moving_average.lookback_period;
    ma["ma_period"] = config.moving_average.ma_period;
    ma["extension_bars"] = config.moving_average.extension_bars;
    ma["sma_warmup_policy"] = std::string(to_string(config.moving_average.sma_policy));

    Json::Value& setup = root["setup"];
    setup["comparison_lag"] = config.setup.comparison_lag;
    setup["target"] = config.setup.target;
    setup["follow_through_policy"] = std::string(to_string(config.setup.follow_through_policy));

    Json::Value& countdown = root["countdown"];
    countdown["target"] = config.countdown.target;
    countdown["high_lag"] = config.countdown.high_lag;
    countdown["start_policy"] = std::string(to_string(config.countdown.start_policy));

    Json::Value& blue = root["ma2_blue"];
    blue["fast_period"] = config.ma2_blue.fast_period;
    blue["slow_period"] = config.ma2_blue.slow_period;
    blue["fast_roc_lag"] = config.ma2_blue.fast_roc_lag;
    blue["slow_roc_lag"] = config.ma2_blue.slow_roc_lag;

    Json::Value& exhaustion = root["exhaustion"];
    exhaustion["range_window"] = config.exhaustion.range_window;
    exhaustion["compression_ratio"] = config.exhaustion.compression_ratio;
    exhaustion["stall_ratio"] = config.exhaustion.stall_ratio;
    exhaustion["vulnerable_countdown"] = config.exhaustion.vulnerable_countdown;

    Json::Value& exit = root["exit"];
    exit["tranche1_fraction"] = config.exit.tranche1_fraction;
    exit["tranche2_fraction"] = config.exit.tranche2_fraction;
    exit["tranche3_fraction"] = config.exit.tranche3_fraction;
    exit["follow_through_bars"] = config.exit.follow_through_bars;
    exit["weak_close_range_pct"] = config.exit.weak_close_range_pct;
    exit["time_stop_days"] = config.exit.time_stop_days;
    exit["post_setup_extension_bars"] = config.exit.post_setup_extension_bars;

    root["log_level"] = std::string(to_string(config.log_level));

    return detail::to_json_text(root);
}

bool EngineConfigParser::validate(const EngineConfig& config, std::string& error)
{
    const auto& ma = config.moving_average;
    if (ma.lookback_period < 1 || ma.ma_period < 1 || ma.extension_bars < 1) {
        error = "moving_average periods must be >= 1";
        return false;
    }

    if (config.setup.comparison_lag < 1) {
        error = "setup.comparison_lag must be >= 1";
        return false;
    }
    if (config.setup.target < 4) {
        error = "setup.target must be >= 4";
        return false;
    }

    if (config.countdown.target < 1 || config.countdown.high_lag < 1) {
        error = "countdown.target and countdown.high_lag must be >= 1";
        return false;
    }

    const auto& blue = config.ma2_blue;
    if (blue.fast_period < 1 || blue.slow_period < 1 || blue.fast_roc_lag < 1 || blue.slow_roc_lag < 1) {
        error = "ma2_blue periods and lags must be >= 1";
        return false;
    }

    const auto& ex = config.exhaustion;
    if (ex.range_window < 1) {
        error = "exhaustion.range_window must be >= 1";
        return false;
    }
    if (ex.compression_ratio <= 0.0 || ex.stall_ratio <= 0.0) {
        error = "exhaustion ratios must be positive";
        return false;
    }
    if (ex.vulnerable_countdown < 1) {
        error = "exhaustion.vulnerable_countdown must be >= 1";
        return false;
    }

    const auto& exit = config.exit;
    for (double f : {exit.tranche1_fraction, exit.tranche2_fraction, exit.tranche3_fraction}) {
        if (f < 0.0 || f > 1.0) {
            error = "exit tranche fractions must lie in [0, 1]";
            return false;
        }
    }
    if (exit.follow_through_bars < 0 || exit.time_stop_days < 0 || exit.post_setup_extension_bars < 0) {
        error = "exit bar counts must be non-negative";
        return false;
    }

    error.clear();
    return true;
}

std::string_view to_string(SmaWarmupPolicy policy)
{
    switch (policy) {
        case SmaWarmupPolicy::Lenient: return "lenient";
        case SmaWarmupPolicy::Strict: return "strict";
    }
    return "lenient";
}

std::string_view to_string(FollowThroughPolicy policy)
{
    switch (policy) {
        case FollowThroughPolicy::Sticky: return "sticky";
        case FollowThroughPolicy::ResetOnRunBreak: return "reset_on_run_break";
    }
    return "sticky";
}

std::string_view to_string(CountdownStartPolicy policy)
{
    switch (policy) {
        case CountdownStartPolicy::NextBar: return "next_bar";
        case CountdownStartPolicy::SameBar: return "same_bar";
    }
    return "next_bar";
}

std::optional<SmaWarmupPolicy> parse_sma_warmup_policy(std::string_view text)
{
    if (text == "lenient") return SmaWarmupPolicy::Lenient;
    if (text == "strict") return SmaWarmupPolicy::Strict;
    return std::nullopt;
}

std::optional<FollowThroughPolicy> parse_follow_through_policy(std::string_view text)
{
    if (text == "sticky") return FollowThroughPolicy::Sticky;
    if (text == "reset_on_run_break") return FollowThroughPolicy::ResetOnRunBreak;
    return std::nullopt;
}

std::optional<CountdownStartPolicy> parse_countdown_start_policy(std::string_view text)
{
    if (text == "next_bar") return CountdownStartPolicy::NextBar;
    if (text == "same_bar") return CountdownStartPolicy::SameBar;
    return std::nullopt;
}

} // namespace demark
