#pragma once

#include "BarWindow.hpp"

#include <cstddef>
#include <optional>

namespace demark {

/// Swing higher-low tracking with a one-bar confirmation delay.
///
/// When a bar's low rises above the prior low, the prior low becomes the
/// pending candidate. The next bar confirms it and the output moves up to the
/// candidate if it is higher. Only one candidate is pending at a time and the
/// confirming bar cannot register a new one.
class HigherLowTracker {
public:
    struct State {
        bool ready = false;
        std::optional<double> candidate;
        double recent_higher_low = 0.0;
        bool confirmed_this_bar = false;

        bool operator==(const State&) const = default;
    };

    State step(const State& previous, const BarWindow& window) const;

    std::size_t required_bars() const noexcept { return 2; }
    std::size_t window_span() const noexcept { return 2; }
};

} // namespace demark
