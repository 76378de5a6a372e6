#include "calculators/HigherLowTracker.hpp"

namespace demark {

HigherLowTracker::State HigherLowTracker::step(const State& previous, const BarWindow& window) const
{
    State next = previous;
    next.confirmed_this_bar = false;

    if (!window.has_enough_data(required_bars())) {
        next.ready = false;
        return next;
    }
    next.ready = true;

    if (!next.candidate.has_value()) {
        const double low = window.value(PriceField::Low, 0);
        const double prior_low = window.value(PriceField::Low, 1);
        if (low > prior_low) {
            next.candidate = prior_low;
        }
    } else {
        // One bar has elapsed since registration: confirm
        if (*next.candidate > next.recent_higher_low) {
            next.recent_higher_low = *next.candidate;
        }
        next.candidate.reset();
        next.confirmed_this_bar = true;
    }

    return next;
}

} // namespace demark
