#pragma once

#include "Logger.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace demark {

/// What a TD moving average reports when its trigger fires before the
/// short SMA has enough bars.
enum class SmaWarmupPolicy {
    Lenient,   // fire anyway, value reported as 0.0 for the whole window
    Strict     // suppress the trigger until the SMA is defined
};

/// How the post-Setup-9 follow-through tracking reacts to a broken run
enum class FollowThroughPolicy {
    Sticky,           // keep advancing until the next Setup-9 re-seeds it
    ResetOnRunBreak   // return to Idle as soon as the setup condition fails
};

/// Whether the bar that arms the countdown may count toward it
enum class CountdownStartPolicy {
    NextBar,
    SameBar
};

struct MovingAverageConfig {
    int lookback_period = 12;
    int ma_period = 5;
    int extension_bars = 4;
    SmaWarmupPolicy sma_policy = SmaWarmupPolicy::Lenient;

    bool operator==(const MovingAverageConfig&) const = default;
};

struct SetupConfig {
    int comparison_lag = 4;
    int target = 9;
    FollowThroughPolicy follow_through_policy = FollowThroughPolicy::Sticky;

    bool operator==(const SetupConfig&) const = default;
};

struct CountdownConfig {
    int target = 13;
    int high_lag = 2;
    CountdownStartPolicy start_policy = CountdownStartPolicy::NextBar;

    bool operator==(const CountdownConfig&) const = default;
};

struct Ma2BlueConfig {
    int fast_period = 3;
    int slow_period = 34;
    int fast_roc_lag = 2;
    int slow_roc_lag = 1;

    bool operator==(const Ma2BlueConfig&) const = default;
};

struct ExhaustionConfig {
    int range_window = 5;
    double compression_ratio = 0.7;
    double stall_ratio = 0.5;
    int vulnerable_countdown = 11;

    bool operator==(const ExhaustionConfig&) const = default;
};

struct ExitConfig {
    double tranche1_fraction = 0.30;
    double tranche2_fraction = 0.45;
    double tranche3_fraction = 0.25;

    int follow_through_bars = 3;
    double weak_close_range_pct = 0.5;

    int time_stop_days = 20;
    int post_setup_extension_bars = 10;

    bool operator==(const ExitConfig&) const = default;
};

/// Complete engine configuration. Defaults reproduce the classic DeMark
/// parameters (12/5/4 moving averages, 9-count setup, 13-count countdown).
struct EngineConfig {
    MovingAverageConfig moving_average{};
    SetupConfig setup{};
    CountdownConfig countdown{};
    Ma2BlueConfig ma2_blue{};
    ExhaustionConfig exhaustion{};
    ExitConfig exit{};

    LogLevel log_level = LogLevel::Info;

    bool operator==(const EngineConfig&) const = default;
};

/// Result of parsing a config file
struct ConfigParseResult {
    bool success = false;
    EngineConfig config;
    std::string error_message;
};

/// JSON reader/writer for EngineConfig.
///
/// Layout:
///   {
///     "moving_average": {"lookback_period": 12, "ma_period": 5,
///                        "extension_bars": 4, "sma_warmup_policy": "lenient"},
///     "setup":          {"comparison_lag": 4, "target": 9,
///                        "follow_through_policy": "sticky"},
///     "countdown":      {"target": 13, "high_lag": 2, "start_policy": "next_bar"},
///     "ma2_blue":       {"fast_period": 3, "slow_period": 34,
///                        "fast_roc_lag": 2, "slow_roc_lag": 1},
///     "exhaustion":     {"range_window": 5, "compression_ratio": 0.7,
///                        "stall_ratio": 0.5, "vulnerable_countdown": 11},
///     "exit":           {"tranche1_fraction": 0.30, ...},
///     "log_level":      "info"
///   }
///
/// Every section and key is optional; missing values keep their defaults.
class EngineConfigParser {
public:
    static ConfigParseResult parse_file(const std::string& file_path);

    static ConfigParseResult parse_string(const std::string& text);

    static std::string to_json_string(const EngineConfig& config);

    /// Check value ranges. Returns false and fills `error` on the first problem.
    static bool validate(const EngineConfig& config, std::string& error);
};

std::string_view to_string(SmaWarmupPolicy policy);
std::string_view to_string(FollowThroughPolicy policy);
std::string_view to_string(CountdownStartPolicy policy);

std::optional<SmaWarmupPolicy> parse_sma_warmup_policy(std::string_view text);
std::optional<FollowThroughPolicy> parse_follow_through_policy(std::string_view text);
std::optional<CountdownStartPolicy> parse_countdown_start_policy(std::string_view text);

} // namespace demark
