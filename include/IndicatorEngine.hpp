#pragma once

#include "BarWindow.hpp"
#include "IndicatorConfig.hpp"
#include "IndicatorState.hpp"
#include "Series.hpp"
#include "calculators/CountdownCounter.hpp"
#include "calculators/ExhaustionAssessor.hpp"
#include "calculators/HigherLowTracker.hpp"
#include "calculators/Ma2BlueFilter.hpp"
#include "calculators/MovingAverageTrigger.hpp"
#include "calculators/SequentialSetupCounter.hpp"
#include "calculators/TdstLevelTracker.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace demark {

/// Everything the engine carries from one bar to the next
struct EngineState {
    BarWindow window;

    MovingAverageTrigger::State ma1{};
    MovingAverageTrigger::State ma2{};
    SequentialSetupCounter::State setup{};
    SequentialSetupCounter::State bearish_setup{};
    CountdownCounter::State countdown{};
    TdstLevelTracker::State tdst{};
    HigherLowTracker::State higher_low{};
    Ma2BlueFilter::State ma2_blue{};
    ExhaustionAssessor::SetupHistory setup_history{};

    /// Combined record for the latest bar (meaningless before the first step)
    IndicatorState latest{};
};

/// Composes the DeMark calculators into one per-bar transition.
///
/// step() is a pure function of the previous EngineState and the new bar;
/// compute() folds it over a whole series. The engine itself holds only
/// configuration, so one instance can serve any number of instruments.
class IndicatorEngine {
public:
    IndicatorEngine();

    /// Throws std::invalid_argument when the configuration is out of range
    explicit IndicatorEngine(const EngineConfig& config);

    EngineState initial_state() const;

    EngineState step(EngineState state, const Bar& bar) const;

    /// Full per-bar state sequence, one record per input bar
    std::vector<IndicatorState> compute(const BarSeries& series) const;

    /// Latest record only, nullopt for an empty series
    std::optional<IndicatorState> compute_latest(const BarSeries& series) const;

    /// Bars a calculator needs before its output is meaningful
    std::size_t required_bars(CalculatorId id) const noexcept;

    IndicatorStatus check_history(CalculatorId id, std::size_t bar_count) const noexcept;

    /// Largest window any calculator reads
    std::size_t max_lookback() const noexcept { return max_lookback_; }

    const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;

    MovingAverageTrigger ma1_;
    MovingAverageTrigger ma2_;
    SequentialSetupCounter setup_;
    SequentialSetupCounter bearish_setup_;
    CountdownCounter countdown_;
    TdstLevelTracker tdst_;
    HigherLowTracker higher_low_;
    Ma2BlueFilter ma2_blue_;
    ExhaustionAssessor exhaustion_;

    std::size_t max_lookback_;

    IndicatorState make_snapshot(const EngineState& state) const;
    void log_transitions(const EngineState& current, bool countdown_was_complete) const;
};

} // namespace demark
