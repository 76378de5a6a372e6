#include "calculators/SequentialSetupCounter.hpp"

#include <algorithm>
#include <stdexcept>

namespace demark {

SequentialSetupCounter::SequentialSetupCounter(SetupDirection direction, const SetupConfig& config)
    : direction_(direction)
    , config_(config)
{
    if (config_.comparison_lag < 1) {
        throw std::invalid_argument("Setup comparison lag must be >= 1");
    }
    if (config_.target < 4) {
        throw std::invalid_argument("Setup target must be >= 4 bars");
    }
}

std::size_t SequentialSetupCounter::required_bars() const noexcept
{
    return static_cast<std::size_t>(config_.comparison_lag) + 1;
}

std::size_t SequentialSetupCounter::window_span() const noexcept
{
    return required_bars();
}

bool SequentialSetupCounter::condition_holds(const BarWindow& window) const
{
    const auto lag = static_cast<std::size_t>(config_.comparison_lag);
    const double close = window.value(PriceField::Close, 0);
    const double reference = window.value(PriceField::Close, lag);
    return direction_ == SetupDirection::Bullish ? close > reference : close < reference;
}

SequentialSetupCounter::State SequentialSetupCounter::step(const State& previous,
                                                           const BarWindow& window) const
{
    if (!window.has_enough_data(required_bars())) {
        return State{};
    }

    const bool bullish = direction_ == SetupDirection::Bullish;
    const Bar& bar = window.latest();

    State next = previous;
    next.ready = true;
    next.completed_this_bar = false;

    if (condition_holds(window)) {
        ++next.run_length;
        if (next.run_length <= config_.target) {
            const double extreme = bullish ? bar.low : bar.high;
            if (next.run_length == 1) {
                next.run_extreme = extreme;
            } else {
                next.run_extreme = bullish ? std::min(next.run_extreme, extreme)
                                           : std::max(next.run_extreme, extreme);
            }
        }
    } else {
        next.run_length = 0;
        next.run_extreme = 0.0;

        if (config_.follow_through_policy == FollowThroughPolicy::ResetOnRunBreak) {
            next.phase = SetupPhase::Idle;
            next.bars_since_setup9 = 0;
            next.best_close_since_setup9 = 0.0;
        }
    }

    if (next.run_length == config_.target) {
        next.completed_this_bar = true;
        next.phase = SetupPhase::Completed;
        next.bars_since_setup9 = 0;
        next.bar9_close = bar.close;
        next.best_close_since_setup9 = bar.close;

        const auto location = close_location(bar);
        next.bar9_degenerate_range = !location.has_value();
        next.bar9_range_pct = location.value_or(0.5);
    } else if (next.phase == SetupPhase::Completed) {
        ++next.bars_since_setup9;
        next.best_close_since_setup9 = bullish ? std::max(next.best_close_since_setup9, bar.close)
                                               : std::min(next.best_close_since_setup9, bar.close);
    } else {
        next.phase = next.run_length > 0 ? SetupPhase::Building : SetupPhase::Idle;
    }

    next.count = std::min(next.run_length, config_.target);
    next.complete = next.run_length >= config_.target;
    return next;
}

} // namespace demark
