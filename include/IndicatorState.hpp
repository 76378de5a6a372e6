#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace demark {

enum class CalculatorId {
    MovingAverage1,
    MovingAverage2,
    Setup,
    Countdown,
    Tdst,
    HigherLow,
    Ma2Blue,
    Exhaustion
};

enum class IndicatorStatus {
    Ok,
    InsufficientHistory
};

/// Follow-through phase of the bullish setup
enum class SetupPhase {
    Idle,
    Building,
    Completed
};

enum class ExhaustionLevel {
    None,
    Maturing,
    Vulnerable,
    Exhausted,
    Confirmed
};

/// Per-calculator warm-up flags. A false flag means the calculator has not
/// seen enough bars yet, so its fields are placeholders rather than an
/// "inactive" reading.
struct Readiness {
    bool ma1 = false;
    bool ma2 = false;
    bool setup = false;
    bool countdown = false;
    bool tdst = false;
    bool higher_low = false;
    bool ma2_blue = false;
    bool exhaustion = false;

    bool is_ready(CalculatorId id) const noexcept;
    bool all_ready() const noexcept;

    bool operator==(const Readiness&) const = default;
};

/// Combined indicator record for one bar
struct IndicatorState {
    std::size_t bar_index = 0;

    // TD MA I / TD MA II
    bool ma1_active = false;
    double ma1_value = 0.0;
    bool ma2_active = false;
    double ma2_value = 0.0;
    bool entry_valid = false;

    // Bullish TD Sequential setup
    int setup_count = 0;
    bool setup_complete = false;
    SetupPhase setup_phase = SetupPhase::Idle;
    double setup_bar9_close = 0.0;
    double setup_bar9_range_pct = 0.0;
    bool setup_bar9_degenerate_range = false;
    double setup_lowest_low = 0.0;
    int bars_since_setup9 = 0;
    double highest_close_since_setup9 = 0.0;

    // Bearish mirror run, feeds TDST resistance
    int bearish_setup_count = 0;

    // TDST levels
    double tdst_support = 0.0;
    bool tdst_active = false;
    double tdst_resistance = 0.0;
    bool tdst_res_active = false;
    bool tdst_res_broken = false;

    // TD Countdown
    int countdown = 0;
    bool countdown_complete = false;

    // Swing structure
    double recent_higher_low = 0.0;

    // TD MA II blue filter (3/34 SMA of closes)
    double ma2_fast = 0.0;
    double ma2_slow = 0.0;
    double ma2_roc_fast = 0.0;
    double ma2_roc_slow = 0.0;
    bool ma2_fast_blue = false;
    bool ma2_slow_blue = false;
    bool ma2_both_blue = false;
    bool ma2_fast_above_slow = false;
    bool ma2_entry_valid = false;
    bool ma2_fast_below_slow = false;

    // Exhaustion assessment
    ExhaustionLevel exhaustion_level = ExhaustionLevel::None;
    bool stall_detected = false;
    bool range_compression = false;
    bool tdst_broken = false;
    std::vector<std::string> exhaustion_signals;

    Readiness readiness{};

    bool operator==(const IndicatorState&) const = default;
};

std::string_view to_string(CalculatorId id);
std::string_view to_string(IndicatorStatus status);
std::string_view to_string(SetupPhase phase);
std::string_view to_string(ExhaustionLevel level);

} // namespace demark
