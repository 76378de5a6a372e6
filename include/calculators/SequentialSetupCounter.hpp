#pragma once

#include "BarWindow.hpp"
#include "IndicatorConfig.hpp"
#include "IndicatorState.hpp"

#include <cstddef>

namespace demark {

enum class SetupDirection {
    Bullish,   // close[i] > close[i-lag]
    Bearish    // close[i] < close[i-lag]
};

/// TD Sequential Setup (9-count).
///
/// The run counter grows without bound while the condition holds and drops
/// to 0 the bar it fails; callers see min(run, target). The bar where the run
/// first equals the target is the setup's rising edge: it records the bar-9
/// close and range position and seeds the follow-through tracker.
///
/// For a bullish run the tracked extreme is the lowest low of bars 1..9 (the
/// setup validity level). A bearish run tracks the highest high and mirrors
/// the follow-through close (lowest close instead of highest).
///
/// Follow-through phase transitions:
///
///   from       | condition holds, run < T | run == T   | condition fails
///   -----------+--------------------------+------------+------------------------
///   Idle       | Building                 | Completed  | Idle
///   Building   | Building                 | Completed  | Idle
///   Completed  | Completed (advance)      | Completed  | Sticky: Completed (advance)
///              |                          | (re-seed)  | Reset:  Idle (zeroed)
class SequentialSetupCounter {
public:
    struct State {
        bool ready = false;
        int run_length = 0;
        int count = 0;
        bool complete = false;
        bool completed_this_bar = false;

        SetupPhase phase = SetupPhase::Idle;
        double run_extreme = 0.0;

        double bar9_close = 0.0;
        double bar9_range_pct = 0.0;
        bool bar9_degenerate_range = false;

        int bars_since_setup9 = 0;
        double best_close_since_setup9 = 0.0;

        bool operator==(const State&) const = default;
    };

    SequentialSetupCounter(SetupDirection direction, const SetupConfig& config);

    State step(const State& previous, const BarWindow& window) const;

    std::size_t required_bars() const noexcept;
    std::size_t window_span() const noexcept;

    int target() const noexcept { return config_.target; }

private:
    SetupDirection direction_;
    SetupConfig config_;

    bool condition_holds(const BarWindow& window) const;
};

} // namespace demark
