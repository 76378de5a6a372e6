#pragma once

#include "BarWindow.hpp"
#include "IndicatorConfig.hpp"

#include <cstddef>

namespace demark {

/// Which breakout a TD moving average watches for
enum class TriggerKind {
    LowAboveLowestLow,       // TD MA I: low[i] > min(low[i-N..i-1]), value SMA(low)
    CloseAboveHighestClose   // TD MA II: close[i] > max(close[i-N..i-1]), value SMA(close)
};

/// TD Moving Average I / II.
///
/// A trigger opens an active window of `extension_bars` bars, starting with
/// the trigger bar. The value is the short SMA captured on the trigger bar and
/// is held for the whole window. Re-triggering inside an open window restarts
/// the countdown and re-captures the value; windows never stack.
class MovingAverageTrigger {
public:
    struct State {
        bool ready = false;
        bool triggered = false;    // trigger fired on this bar
        bool active = false;
        double value = 0.0;        // 0.0 while inactive
        int bars_remaining = 0;    // active bars left after this one
        double window_value = 0.0;

        bool operator==(const State&) const = default;
    };

    MovingAverageTrigger(TriggerKind kind, const MovingAverageConfig& config);

    State step(const State& previous, const BarWindow& window) const;

    /// Bars needed before the trigger condition can be evaluated
    std::size_t required_bars() const noexcept;

    /// Window size this calculator reads
    std::size_t window_span() const noexcept;

private:
    TriggerKind kind_;
    PriceField field_;
    MovingAverageConfig config_;
};

} // namespace demark
