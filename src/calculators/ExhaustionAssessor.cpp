#include "calculators/ExhaustionAssessor.hpp"

#include "MathUtils.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace demark {

ExhaustionAssessor::ExhaustionAssessor(const ExhaustionConfig& config, int countdown_target)
    : config_(config)
    , countdown_target_(countdown_target)
{
    if (config_.range_window < 1) {
        throw std::invalid_argument("Exhaustion range window must be >= 1");
    }
    if (config_.compression_ratio <= 0.0 || config_.stall_ratio <= 0.0) {
        throw std::invalid_argument("Exhaustion ratios must be positive");
    }
    if (config_.vulnerable_countdown < 1) {
        throw std::invalid_argument("Vulnerable countdown must be >= 1");
    }
}

std::size_t ExhaustionAssessor::required_bars() const noexcept
{
    return static_cast<std::size_t>(config_.range_window);
}

std::size_t ExhaustionAssessor::window_span() const noexcept
{
    return 2 * static_cast<std::size_t>(config_.range_window);
}

double ExhaustionAssessor::average_range(const BarWindow& window, std::size_t first_offset) const
{
    const auto length = static_cast<std::size_t>(config_.range_window);
    std::vector<double> ranges;
    ranges.reserve(length);
    for (std::size_t k = first_offset; k < first_offset + length; ++k) {
        const Bar& bar = window.at(k);
        ranges.push_back(bar.high - bar.low);
    }
    return mean(ranges).value_or(0.0);
}

ExhaustionAssessor::Assessment ExhaustionAssessor::assess(const IndicatorState& state,
                                                          const SetupHistory& history,
                                                          const BarWindow& window) const
{
    Assessment result;
    if (history.last_support && !window.empty()) {
        result.tdst_broken = window.value(PriceField::Close, 0) < *history.last_support;
    }
    result.ready = window.size() >= required_bars();

    if (result.ready) {
        const auto length = static_cast<std::size_t>(config_.range_window);
        const double avg_recent = average_range(window, 0);
        const double avg_prior = window.size() >= 2 * length ? average_range(window, length) : avg_recent;

        if (avg_prior > 0.0 && avg_recent < avg_prior * config_.compression_ratio) {
            result.range_compression = true;
        }

        const double close_span = window.highest(PriceField::Close, 0, length - 1)
                                - window.lowest(PriceField::Close, 0, length - 1);
        if (avg_recent > 0.0 && close_span < avg_recent * config_.stall_ratio) {
            result.stall_detected = true;
        }
    }

    if (history.setup_seen) {
        result.signals.emplace_back("Setup 9 Complete");
    }
    if (state.countdown >= config_.vulnerable_countdown && state.countdown < countdown_target_) {
        result.signals.push_back("Countdown " + std::to_string(state.countdown) + "/"
                                 + std::to_string(countdown_target_));
    }
    if (state.countdown >= countdown_target_) {
        result.signals.push_back("Countdown " + std::to_string(countdown_target_) + " Complete");
    }
    if (!state.ma1_active && history.setup_seen) {
        result.signals.emplace_back("TD MA I Failed");
    }
    if (result.stall_detected) {
        result.signals.emplace_back("Stall Detected");
    }
    if (result.range_compression) {
        result.signals.emplace_back("Range Compression");
    }
    if (result.tdst_broken) {
        result.signals.emplace_back("TDST Broken");
    }

    if (result.tdst_broken) {
        result.level = ExhaustionLevel::Confirmed;
    } else if (state.countdown >= countdown_target_) {
        result.level = ExhaustionLevel::Exhausted;
    } else if (state.countdown >= config_.vulnerable_countdown) {
        result.level = ExhaustionLevel::Vulnerable;
    } else if (history.setup_seen) {
        result.level = ExhaustionLevel::Maturing;
    } else {
        result.level = ExhaustionLevel::None;
    }

    return result;
}

} // namespace demark
