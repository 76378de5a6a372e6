#pragma once

#include "BarWindow.hpp"
#include "IndicatorConfig.hpp"

#include <cstddef>

namespace demark {

/// TD MA II "blue" trend filter.
///
/// fast = SMA(close, 3), slow = SMA(close, 34). A line is blue while it is
/// rising or flat over its rate-of-change lag (2 bars fast, 1 bar slow).
/// Entry is valid when both lines are blue and fast > slow.
class Ma2BlueFilter {
public:
    struct State {
        bool ready = false;
        double fast = 0.0;
        double slow = 0.0;
        double roc_fast = 0.0;
        double roc_slow = 0.0;
        bool fast_blue = false;
        bool slow_blue = false;
        bool both_blue = false;
        bool fast_above_slow = false;
        bool entry_valid = false;
        bool fast_below_slow = false;

        bool operator==(const State&) const = default;
    };

    explicit Ma2BlueFilter(const Ma2BlueConfig& config);

    State step(const BarWindow& window) const;

    std::size_t required_bars() const noexcept;
    std::size_t window_span() const noexcept { return required_bars(); }

private:
    Ma2BlueConfig config_;
};

} // namespace demark
