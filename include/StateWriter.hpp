#pragma once

#include "ExitRules.hpp"
#include "IndicatorState.hpp"
#include "Series.hpp"

#include <string>
#include <vector>

namespace demark {

/// Writes indicator state for diagnostics and backtesting
class StateWriter {
public:
    /// CSV with one row per bar.
    /// Format: bar, date, time, close, ma1_active, ma1_value, ...
    /// `series` supplies dates, times and closes and must match `states` in length.
    static bool write_csv(const std::string& output_path,
                          const BarSeries& series,
                          const std::vector<IndicatorState>& states,
                          std::string* error = nullptr);

    static std::vector<std::string> csv_columns();

    /// Pretty-printed JSON object for one snapshot
    static std::string to_json_string(const IndicatorState& state);

    /// JSON array of the tranche decisions
    static std::string to_json_string(const ExitEvaluation& evaluation);
};

} // namespace demark
