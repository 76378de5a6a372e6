#include "calculators/MovingAverageTrigger.hpp"

#include <algorithm>
#include <stdexcept>

namespace demark {

MovingAverageTrigger::MovingAverageTrigger(TriggerKind kind, const MovingAverageConfig& config)
    : kind_(kind)
    , field_(kind == TriggerKind::LowAboveLowestLow ? PriceField::Low : PriceField::Close)
    , config_(config)
{
    if (config_.lookback_period < 1) {
        throw std::invalid_argument("TD MA lookback period must be >= 1");
    }
    if (config_.ma_period < 1) {
        throw std::invalid_argument("TD MA average period must be >= 1");
    }
    if (config_.extension_bars < 1) {
        throw std::invalid_argument("TD MA extension must be >= 1 bar");
    }
}

std::size_t MovingAverageTrigger::required_bars() const noexcept
{
    const auto lookback_bars = static_cast<std::size_t>(config_.lookback_period) + 1;
    if (config_.sma_policy == SmaWarmupPolicy::Strict) {
        return std::max(lookback_bars, static_cast<std::size_t>(config_.ma_period));
    }
    return lookback_bars;
}

std::size_t MovingAverageTrigger::window_span() const noexcept
{
    return std::max(static_cast<std::size_t>(config_.lookback_period) + 1,
                    static_cast<std::size_t>(config_.ma_period));
}

MovingAverageTrigger::State MovingAverageTrigger::step(const State& previous,
                                                       const BarWindow& window) const
{
    State next;
    next.bars_remaining = previous.bars_remaining;
    next.window_value = previous.window_value;
    next.ready = window.has_enough_data(required_bars());

    const auto lookback = static_cast<std::size_t>(config_.lookback_period);
    if (window.current_index() >= lookback) {
        const double current = window.value(field_, 0);
        const bool breakout = (kind_ == TriggerKind::LowAboveLowestLow)
            ? current > window.lowest(field_, 1, lookback)
            : current > window.highest(field_, 1, lookback);

        if (breakout) {
            const auto average = window.sma(field_, static_cast<std::size_t>(config_.ma_period));
            if (average.has_value()) {
                next.triggered = true;
                next.window_value = *average;
            } else if (config_.sma_policy == SmaWarmupPolicy::Lenient) {
                next.triggered = true;
                next.window_value = 0.0;
            }

            if (next.triggered) {
                next.bars_remaining = config_.extension_bars;
            }
        }
    }

    if (next.bars_remaining > 0) {
        next.active = true;
        next.value = next.window_value;
        --next.bars_remaining;
    } else {
        next.active = false;
        next.value = 0.0;
    }

    return next;
}

} // namespace demark
