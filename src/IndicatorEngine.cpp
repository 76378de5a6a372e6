#include "IndicatorEngine.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace demark {

namespace {

const EngineConfig& validated(const EngineConfig& config)
{
    std::string error;
    if (!EngineConfigParser::validate(config, error)) {
        throw std::invalid_argument("Invalid engine configuration: " + error);
    }
    return config;
}

} // namespace

IndicatorEngine::IndicatorEngine()
    : IndicatorEngine(EngineConfig{})
{
}

IndicatorEngine::IndicatorEngine(const EngineConfig& config)
    : config_(validated(config))
    , ma1_(TriggerKind::LowAboveLowestLow, config_.moving_average)
    , ma2_(TriggerKind::CloseAboveHighestClose, config_.moving_average)
    , setup_(SetupDirection::Bullish, config_.setup)
    , bearish_setup_(SetupDirection::Bearish, config_.setup)
    , countdown_(config_.countdown, config_.setup.target)
    , tdst_(config_.setup.target)
    , higher_low_()
    , ma2_blue_(config_.ma2_blue)
    , exhaustion_(config_.exhaustion, config_.countdown.target)
    , max_lookback_(0)
{
    max_lookback_ = std::max({ma1_.window_span(), ma2_.window_span(),
                              setup_.window_span(), bearish_setup_.window_span(),
                              countdown_.window_span(), tdst_.window_span(),
                              higher_low_.window_span(), ma2_blue_.window_span(),
                              exhaustion_.window_span()});
}

EngineState IndicatorEngine::initial_state() const
{
    EngineState state{BarWindow(max_lookback_)};
    return state;
}

EngineState IndicatorEngine::step(EngineState state, const Bar& bar) const
{
    const bool countdown_was_complete = state.countdown.complete;

    state.window.append_bar(bar);
    const BarWindow& window = state.window;

    state.ma1 = ma1_.step(state.ma1, window);
    state.ma2 = ma2_.step(state.ma2, window);

    const int previous_setup_count = state.setup.count;
    state.setup = setup_.step(state.setup, window);
    state.bearish_setup = bearish_setup_.step(state.bearish_setup, window);

    state.countdown = countdown_.step(state.countdown, previous_setup_count, state.setup.count, window);
    state.tdst = tdst_.step(state.tdst, state.setup.completed_this_bar,
                            state.bearish_setup.completed_this_bar, window);
    state.higher_low = higher_low_.step(state.higher_low, window);
    state.ma2_blue = ma2_blue_.step(window);

    if (state.setup.completed_this_bar) {
        state.setup_history.setup_seen = true;
    }
    if (state.tdst.support_activated_this_bar) {
        state.setup_history.last_support = state.tdst.support_level;
    }

    state.latest = make_snapshot(state);

    if (Logger::enabled(LogLevel::Debug)) {
        log_transitions(state, countdown_was_complete);
    }

    return state;
}

IndicatorState IndicatorEngine::make_snapshot(const EngineState& state) const
{
    IndicatorState out;
    out.bar_index = state.window.current_index();

    out.ma1_active = state.ma1.active;
    out.ma1_value = state.ma1.value;
    out.ma2_active = state.ma2.active;
    out.ma2_value = state.ma2.value;
    out.entry_valid = out.ma1_active && out.ma2_active;

    const auto& setup = state.setup;
    out.setup_count = setup.count;
    out.setup_complete = setup.complete;
    out.setup_phase = setup.phase;
    out.setup_bar9_close = setup.bar9_close;
    out.setup_bar9_range_pct = setup.bar9_range_pct;
    out.setup_bar9_degenerate_range = setup.bar9_degenerate_range;
    out.setup_lowest_low = setup.run_extreme;
    out.bars_since_setup9 = setup.bars_since_setup9;
    out.highest_close_since_setup9 = setup.best_close_since_setup9;
    out.bearish_setup_count = state.bearish_setup.count;

    out.tdst_support = state.tdst.support();
    out.tdst_active = state.tdst.support_active;
    out.tdst_resistance = state.tdst.resistance();
    out.tdst_res_active = state.tdst.resistance_active;
    out.tdst_res_broken = state.tdst.resistance_broken;

    out.countdown = state.countdown.count;
    out.countdown_complete = state.countdown.complete;

    out.recent_higher_low = state.higher_low.recent_higher_low;

    const auto& blue = state.ma2_blue;
    out.ma2_fast = blue.fast;
    out.ma2_slow = blue.slow;
    out.ma2_roc_fast = blue.roc_fast;
    out.ma2_roc_slow = blue.roc_slow;
    out.ma2_fast_blue = blue.fast_blue;
    out.ma2_slow_blue = blue.slow_blue;
    out.ma2_both_blue = blue.both_blue;
    out.ma2_fast_above_slow = blue.fast_above_slow;
    out.ma2_entry_valid = blue.entry_valid;
    out.ma2_fast_below_slow = blue.fast_below_slow;

    auto assessment = exhaustion_.assess(out, state.setup_history, state.window);
    out.exhaustion_level = assessment.level;
    out.stall_detected = assessment.stall_detected;
    out.range_compression = assessment.range_compression;
    out.tdst_broken = assessment.tdst_broken;
    out.exhaustion_signals = std::move(assessment.signals);

    out.readiness.ma1 = state.ma1.ready;
    out.readiness.ma2 = state.ma2.ready;
    out.readiness.setup = setup.ready;
    out.readiness.countdown = state.countdown.ready;
    out.readiness.tdst = state.tdst.ready;
    out.readiness.higher_low = state.higher_low.ready;
    out.readiness.ma2_blue = blue.ready;
    out.readiness.exhaustion = assessment.ready;

    return out;
}

void IndicatorEngine::log_transitions(const EngineState& current, bool countdown_was_complete) const
{
    const auto index = current.latest.bar_index;

    if (current.setup.completed_this_bar) {
        std::ostringstream oss;
        oss << "Bar " << index << ": bullish setup " << setup_.target()
            << " complete (close " << current.setup.bar9_close << ")";
        Logger::debug(oss.str());
    }
    if (current.bearish_setup.completed_this_bar) {
        Logger::debug("Bar " + std::to_string(index) + ": bearish setup complete");
    }
    if (current.tdst.support_activated_this_bar) {
        std::ostringstream oss;
        oss << "Bar " << index << ": TDST support " << current.tdst.support_level << " active";
        Logger::debug(oss.str());
    }
    if (current.tdst.support_violated_this_bar) {
        std::ostringstream oss;
        oss << "Bar " << index << ": TDST support " << current.tdst.support_level << " violated";
        Logger::debug(oss.str());
    }
    if (current.tdst.resistance_broken) {
        std::ostringstream oss;
        oss << "Bar " << index << ": TDST resistance " << current.tdst.resistance_level << " broken";
        Logger::debug(oss.str());
    }
    if (current.countdown.complete && !countdown_was_complete) {
        Logger::debug("Bar " + std::to_string(index) + ": countdown complete");
    }
}

std::vector<IndicatorState> IndicatorEngine::compute(const BarSeries& series) const
{
    std::vector<IndicatorState> states;
    states.reserve(series.size());

    EngineState state = initial_state();
    for (const auto& bar : series.bars) {
        state = step(std::move(state), bar);
        states.push_back(state.latest);
    }

    return states;
}

std::optional<IndicatorState> IndicatorEngine::compute_latest(const BarSeries& series) const
{
    if (series.empty()) {
        return std::nullopt;
    }

    EngineState state = initial_state();
    for (const auto& bar : series.bars) {
        state = step(std::move(state), bar);
    }
    return std::move(state.latest);
}

std::size_t IndicatorEngine::required_bars(CalculatorId id) const noexcept
{
    switch (id) {
        case CalculatorId::MovingAverage1: return ma1_.required_bars();
        case CalculatorId::MovingAverage2: return ma2_.required_bars();
        case CalculatorId::Setup: return setup_.required_bars();
        case CalculatorId::Countdown: return countdown_.required_bars();
        case CalculatorId::Tdst: return tdst_.required_bars();
        case CalculatorId::HigherLow: return higher_low_.required_bars();
        case CalculatorId::Ma2Blue: return ma2_blue_.required_bars();
        case CalculatorId::Exhaustion: return exhaustion_.required_bars();
    }
    return max_lookback_;
}

IndicatorStatus IndicatorEngine::check_history(CalculatorId id, std::size_t bar_count) const noexcept
{
    return bar_count >= required_bars(id) ? IndicatorStatus::Ok : IndicatorStatus::InsufficientHistory;
}

} // namespace demark
