#pragma once

#include "BarWindow.hpp"
#include "IndicatorConfig.hpp"

#include <cstddef>

namespace demark {

/// TD Countdown (13-count).
///
/// Arms on the rising edge of a completed setup, counts bars closing at or
/// above the high two bars earlier, and disarms on the rising edge of a new
/// setup run (setup count entering 1). Counts need not be consecutive.
class CountdownCounter {
public:
    struct State {
        bool ready = false;
        bool armed = false;
        bool armed_this_bar = false;
        int count = 0;
        bool complete = false;

        bool operator==(const State&) const = default;
    };

    CountdownCounter(const CountdownConfig& config, int setup_target);

    /// @param previous_setup_count Reported setup count of the prior bar
    /// @param setup_count Reported setup count of the current bar
    State step(const State& previous, int previous_setup_count, int setup_count,
               const BarWindow& window) const;

    std::size_t required_bars() const noexcept;
    std::size_t window_span() const noexcept;

private:
    CountdownConfig config_;
    int setup_target_;
};

} // namespace demark
