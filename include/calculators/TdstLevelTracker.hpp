#pragma once

#include "BarWindow.hpp"

#include <cstddef>

namespace demark {

/// TDST support and resistance.
///
/// Support is the lowest low of bars 1-4 of a completed bullish setup and
/// stays active until a close below it. Resistance is the highest high of
/// bars 1-4 of a completed bearish setup and stays active until a close above
/// it; the breakout bar itself is flagged and still reports the level.
class TdstLevelTracker {
public:
    struct State {
        bool ready = false;

        double support_level = 0.0;
        bool support_active = false;
        bool support_activated_this_bar = false;
        bool support_violated_this_bar = false;

        double resistance_level = 0.0;
        bool resistance_active = false;
        bool resistance_broken = false;   // this bar only

        double support() const noexcept { return support_active ? support_level : 0.0; }
        double resistance() const noexcept {
            return (resistance_active || resistance_broken) ? resistance_level : 0.0;
        }

        bool operator==(const State&) const = default;
    };

    /// @param setup_target Setup length; bars 1-4 sit at offsets target-1 .. target-4
    explicit TdstLevelTracker(int setup_target);

    State step(const State& previous, bool bullish_setup_completed,
               bool bearish_setup_completed, const BarWindow& window) const;

    std::size_t required_bars() const noexcept;
    std::size_t window_span() const noexcept;

private:
    int setup_target_;
};

} // namespace demark
