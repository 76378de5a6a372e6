#pragma once

#include "IndicatorConfig.hpp"
#include "IndicatorEngine.hpp"
#include "IndicatorState.hpp"
#include "Series.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace demark {

/// Compute indicators incrementally as bars arrive
class IncrementalComputer {
public:
    /// @param keep_history Retain every per-bar record, not just the latest
    explicit IncrementalComputer(const EngineConfig& config = {}, bool keep_history = false);

    /// Validate and process one bar. Rejected bars leave the state untouched.
    bool append_bar(const Bar& bar);

    /// Latest record, nullopt before the first accepted bar
    std::optional<IndicatorState> latest() const;

    /// Per-bar records (empty unless keep_history was requested)
    const std::vector<IndicatorState>& history() const noexcept { return history_; }

    std::size_t bar_count() const noexcept { return bar_count_; }

    std::size_t rejected_count() const noexcept { return rejected_count_; }

    /// Start over with an empty history
    void reset();

    const IndicatorEngine& engine() const noexcept { return engine_; }

private:
    IndicatorEngine engine_;
    EngineState state_;
    std::vector<IndicatorState> history_;
    bool keep_history_;
    std::size_t bar_count_{0};
    std::size_t rejected_count_{0};
};

/// Simple example usage pattern
///
/// ```cpp
/// IncrementalComputer computer;
///
/// // Warm up with historical data
/// for (const auto& bar : historical.bars) {
///     computer.append_bar(bar);
/// }
///
/// // Real-time update (called on each new bar)
/// computer.append_bar(new_bar);
/// if (auto state = computer.latest()) {
///     auto exits = evaluator.evaluate_all(new_bar.close, *state, position);
/// }
/// ```

} // namespace demark
