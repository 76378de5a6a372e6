#include "ExitRules.hpp"

#include <algorithm>
#include <stdexcept>

namespace demark {

std::string_view to_string(ExitReason reason)
{
    switch (reason) {
        case ExitReason::None: return "";
        case ExitReason::CloseBelowTdMa1: return "CLOSE_BELOW_TD_MA1";
        case ExitReason::FailedFollowThrough: return "FAILED_FOLLOW_THROUGH";
        case ExitReason::TdstSupportBreach: return "TDST_SUPPORT_BREACH";
        case ExitReason::SetupValidityBreach: return "SETUP_VALIDITY_BREACH";
        case ExitReason::CountdownExhaustion: return "COUNTDOWN_EXHAUSTION";
        case ExitReason::HigherLowBreak: return "HIGHER_LOW_BREAK";
        case ExitReason::TimeStop: return "TIME_STOP";
        case ExitReason::Ma2Crossover: return "MA2_CROSSOVER";
    }
    return "";
}

std::string_view to_string(Tranche tranche)
{
    switch (tranche) {
        case Tranche::DeRisk: return "TRANCHE_1";
        case Tranche::Structural: return "TRANCHE_2";
        case Tranche::Runner: return "TRANCHE_3";
    }
    return "UNKNOWN";
}

double ExitEvaluation::total_fraction() const noexcept
{
    double total = 0.0;
    for (const auto& t : tranches) {
        if (t.decision.triggered) {
            total += t.fraction;
        }
    }
    return total;
}

bool ExitEvaluation::any_triggered() const noexcept
{
    return std::any_of(tranches.begin(), tranches.end(),
                       [](const TrancheDecision& t) { return t.decision.triggered; });
}

ExitRuleEvaluator::ExitRuleEvaluator(const ExitConfig& config)
    : config_(config)
{
    const double fractions[] = {config.tranche1_fraction, config.tranche2_fraction, config.tranche3_fraction};
    for (double f : fractions) {
        if (f < 0.0 || f > 1.0) {
            throw std::invalid_argument("Tranche fractions must lie in [0, 1]");
        }
    }
    if (config.follow_through_bars < 0 || config.time_stop_days < 0 || config.post_setup_extension_bars < 0) {
        throw std::invalid_argument("Exit bar counts must be non-negative");
    }
}

ExitDecision ExitRuleEvaluator::check_tranche1(double close, const IndicatorState& state) const
{
    if (state.ma1_active && close < state.ma1_value) {
        return ExitDecision::fire(ExitReason::CloseBelowTdMa1);
    }

    if (state.setup_complete && state.bars_since_setup9 >= config_.follow_through_bars) {
        const bool no_new_high = state.highest_close_since_setup9 <= state.setup_bar9_close;
        const bool weak = state.setup_bar9_range_pct < config_.weak_close_range_pct
                       || close < state.setup_bar9_close;
        if (no_new_high && weak) {
            return ExitDecision::fire(ExitReason::FailedFollowThrough);
        }
    }

    return ExitDecision::hold();
}

ExitDecision ExitRuleEvaluator::check_tranche2(double close, const IndicatorState& state,
                                               double setup_lowest_low) const
{
    if (state.tdst_active && close < state.tdst_support) {
        return ExitDecision::fire(ExitReason::TdstSupportBreach);
    }

    if (setup_lowest_low > 0.0 && close < setup_lowest_low) {
        return ExitDecision::fire(ExitReason::SetupValidityBreach);
    }

    return ExitDecision::hold();
}

ExitDecision ExitRuleEvaluator::check_tranche3(double close, const IndicatorState& state,
                                               double entry_price, int days_held) const
{
    if (state.countdown_complete && state.ma2_active && close < state.ma2_value) {
        return ExitDecision::fire(ExitReason::CountdownExhaustion);
    }

    if (state.recent_higher_low > 0.0 && close < state.recent_higher_low) {
        return ExitDecision::fire(ExitReason::HigherLowBreak);
    }

    // Holding limit stretches while a completed setup is still following through
    const int limit = state.setup_complete
        ? std::max(config_.time_stop_days, state.bars_since_setup9 + config_.post_setup_extension_bars)
        : config_.time_stop_days;
    if (days_held >= limit && close <= entry_price && !state.setup_complete) {
        return ExitDecision::fire(ExitReason::TimeStop);
    }

    return ExitDecision::hold();
}

ExitDecision ExitRuleEvaluator::check_ma2_crossover_exit(const IndicatorState& state) const
{
    if (state.readiness.ma2_blue && state.ma2_fast_below_slow) {
        return ExitDecision::fire(ExitReason::Ma2Crossover);
    }
    return ExitDecision::hold();
}

ExitEvaluation ExitRuleEvaluator::evaluate_all(double close, const IndicatorState& state,
                                               const PositionContext& position) const
{
    ExitEvaluation result;
    result.tranches[0] = {Tranche::DeRisk, config_.tranche1_fraction,
                          check_tranche1(close, state)};
    result.tranches[1] = {Tranche::Structural, config_.tranche2_fraction,
                          check_tranche2(close, state, position.setup_lowest_low.value_or(state.setup_lowest_low))};
    result.tranches[2] = {Tranche::Runner, config_.tranche3_fraction,
                          check_tranche3(close, state, position.entry_price, position.days_held)};
    return result;
}

double ExitRuleEvaluator::fraction(Tranche tranche) const noexcept
{
    switch (tranche) {
        case Tranche::DeRisk: return config_.tranche1_fraction;
        case Tranche::Structural: return config_.tranche2_fraction;
        case Tranche::Runner: return config_.tranche3_fraction;
    }
    return 0.0;
}

} // namespace demark
