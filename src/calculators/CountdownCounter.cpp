#include "calculators/CountdownCounter.hpp"

#include <stdexcept>

namespace demark {

CountdownCounter::CountdownCounter(const CountdownConfig& config, int setup_target)
    : config_(config)
    , setup_target_(setup_target)
{
    if (config_.target < 1) {
        throw std::invalid_argument("Countdown target must be >= 1");
    }
    if (config_.high_lag < 1) {
        throw std::invalid_argument("Countdown high lag must be >= 1");
    }
}

std::size_t CountdownCounter::required_bars() const noexcept
{
    return static_cast<std::size_t>(config_.high_lag) + 1;
}

std::size_t CountdownCounter::window_span() const noexcept
{
    return required_bars();
}

CountdownCounter::State CountdownCounter::step(const State& previous, int previous_setup_count,
                                               int setup_count, const BarWindow& window) const
{
    if (!window.has_enough_data(required_bars())) {
        return State{};
    }

    State next = previous;
    next.ready = true;
    next.armed_this_bar = false;

    if (setup_count == setup_target_ && previous_setup_count < setup_target_) {
        next.armed = true;
        next.armed_this_bar = true;
        next.count = 0;
    }

    const bool may_count = next.armed && next.count < config_.target
        && (config_.start_policy == CountdownStartPolicy::SameBar || !next.armed_this_bar);
    if (may_count) {
        const double close = window.value(PriceField::Close, 0);
        const double reference_high = window.value(PriceField::High, static_cast<std::size_t>(config_.high_lag));
        if (close >= reference_high) {
            ++next.count;
        }
    }

    // A new setup run cancels the countdown in progress
    if (setup_count == 1 && previous_setup_count != 1) {
        next.armed = false;
        next.count = 0;
    }

    next.complete = next.count >= config_.target;
    return next;
}

} // namespace demark
