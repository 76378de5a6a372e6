#pragma once

#include "BarWindow.hpp"
#include "IndicatorConfig.hpp"
#include "IndicatorState.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace demark {

/// Classifies how mature the current bullish trend is.
///
/// Levels, highest first: Confirmed (close below the TDST support of the
/// latest completed setup), Exhausted (countdown complete), Vulnerable
/// (countdown >= 11), Maturing (a setup has completed), None. Stall and
/// range-compression detection compare the last five bar ranges against the
/// five before them.
class ExhaustionAssessor {
public:
    struct Assessment {
        bool ready = false;
        ExhaustionLevel level = ExhaustionLevel::None;
        bool stall_detected = false;
        bool range_compression = false;
        bool tdst_broken = false;
        std::vector<std::string> signals;
    };

    /// Outlives the setup run that produced it
    struct SetupHistory {
        bool setup_seen = false;
        std::optional<double> last_support;   // TDST support of the latest completed setup
    };

    ExhaustionAssessor(const ExhaustionConfig& config, int countdown_target);

    /// Reads the countdown and MA I fields of `state`
    Assessment assess(const IndicatorState& state, const SetupHistory& history,
                      const BarWindow& window) const;

    std::size_t required_bars() const noexcept;
    std::size_t window_span() const noexcept;

private:
    ExhaustionConfig config_;
    int countdown_target_;

    double average_range(const BarWindow& window, std::size_t first_offset) const;
};

} // namespace demark
