#include "calculators/Ma2BlueFilter.hpp"

#include <algorithm>
#include <stdexcept>

namespace demark {

Ma2BlueFilter::Ma2BlueFilter(const Ma2BlueConfig& config)
    : config_(config)
{
    if (config_.fast_period < 1 || config_.slow_period < 1) {
        throw std::invalid_argument("MA2 blue periods must be >= 1");
    }
    if (config_.fast_roc_lag < 1 || config_.slow_roc_lag < 1) {
        throw std::invalid_argument("MA2 blue rate-of-change lags must be >= 1");
    }
}

std::size_t Ma2BlueFilter::required_bars() const noexcept
{
    return static_cast<std::size_t>(std::max(config_.fast_period + config_.fast_roc_lag,
                                             config_.slow_period + config_.slow_roc_lag));
}

Ma2BlueFilter::State Ma2BlueFilter::step(const BarWindow& window) const
{
    State next;
    if (!window.has_enough_data(required_bars())) {
        return next;
    }

    const auto fast_len = static_cast<std::size_t>(config_.fast_period);
    const auto slow_len = static_cast<std::size_t>(config_.slow_period);

    const auto fast = window.sma(PriceField::Close, fast_len);
    const auto fast_prior = window.sma(PriceField::Close, fast_len, static_cast<std::size_t>(config_.fast_roc_lag));
    const auto slow = window.sma(PriceField::Close, slow_len);
    const auto slow_prior = window.sma(PriceField::Close, slow_len, static_cast<std::size_t>(config_.slow_roc_lag));
    if (!fast || !fast_prior || !slow || !slow_prior) {
        return next;
    }

    next.ready = true;
    next.fast = *fast;
    next.slow = *slow;
    next.roc_fast = *fast - *fast_prior;
    next.roc_slow = *slow - *slow_prior;
    next.fast_blue = next.roc_fast >= 0.0;
    next.slow_blue = next.roc_slow >= 0.0;
    next.both_blue = next.fast_blue && next.slow_blue;
    next.fast_above_slow = next.fast > next.slow;
    next.entry_valid = next.both_blue && next.fast_above_slow;
    next.fast_below_slow = next.fast < next.slow;
    return next;
}

} // namespace demark
