#include "calculators/TdstLevelTracker.hpp"

#include <stdexcept>

namespace demark {

TdstLevelTracker::TdstLevelTracker(int setup_target)
    : setup_target_(setup_target)
{
    if (setup_target_ < 4) {
        throw std::invalid_argument("TDST needs a setup of at least 4 bars");
    }
}

std::size_t TdstLevelTracker::required_bars() const noexcept
{
    return static_cast<std::size_t>(setup_target_);
}

std::size_t TdstLevelTracker::window_span() const noexcept
{
    return required_bars();
}

TdstLevelTracker::State TdstLevelTracker::step(const State& previous, bool bullish_setup_completed,
                                               bool bearish_setup_completed,
                                               const BarWindow& window) const
{
    State next = previous;
    next.ready = window.has_enough_data(required_bars());
    next.support_activated_this_bar = false;
    next.support_violated_this_bar = false;
    next.resistance_broken = false;

    // Bars 1-4 of the completed run
    const auto first_bar = static_cast<std::size_t>(setup_target_) - 1;
    const auto fourth_bar = first_bar - 3;

    if (bullish_setup_completed && next.ready) {
        next.support_level = window.lowest(PriceField::Low, fourth_bar, first_bar);
        next.support_active = true;
        next.support_activated_this_bar = true;
    }

    if (bearish_setup_completed && next.ready) {
        next.resistance_level = window.highest(PriceField::High, fourth_bar, first_bar);
        next.resistance_active = true;
    }

    if (window.empty()) {
        return next;
    }

    const double close = window.value(PriceField::Close, 0);

    if (next.support_active && close < next.support_level) {
        next.support_active = false;
        next.support_violated_this_bar = true;
    }

    if (next.resistance_active && close > next.resistance_level) {
        next.resistance_active = false;
        next.resistance_broken = true;
    }

    return next;
}

} // namespace demark
