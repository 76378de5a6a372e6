#pragma once

#include "IndicatorConfig.hpp"
#include "IndicatorState.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace demark {

enum class ExitReason {
    None,
    CloseBelowTdMa1,
    FailedFollowThrough,
    TdstSupportBreach,
    SetupValidityBreach,
    CountdownExhaustion,
    HigherLowBreak,
    TimeStop,
    Ma2Crossover
};

/// Reason code, e.g. "TDST_SUPPORT_BREACH". Empty for ExitReason::None.
std::string_view to_string(ExitReason reason);

enum class Tranche {
    DeRisk = 1,       // 30%
    Structural = 2,   // 45%
    Runner = 3        // 25%
};

std::string_view to_string(Tranche tranche);

struct ExitDecision {
    bool triggered = false;
    ExitReason reason = ExitReason::None;

    static ExitDecision fire(ExitReason why) noexcept { return {true, why}; }
    static ExitDecision hold() noexcept { return {}; }

    bool operator==(const ExitDecision&) const = default;
};

/// Position data owned by the caller
struct PositionContext {
    double entry_price = 0.0;
    int days_held = 0;

    /// Setup validity level for tranche 2; the snapshot's value when unset
    std::optional<double> setup_lowest_low;
};

struct TrancheDecision {
    Tranche tranche = Tranche::DeRisk;
    double fraction = 0.0;
    ExitDecision decision{};
};

struct ExitEvaluation {
    std::array<TrancheDecision, 3> tranches{};

    /// Sum of the fractions of every triggered tranche
    double total_fraction() const noexcept;
    bool any_triggered() const noexcept;
};

/// Three independent partial-exit gates evaluated against one snapshot.
///
/// Stateless; safe to share between threads. Within a tranche the conditions
/// are checked in a fixed order and the first that holds names the reason.
class ExitRuleEvaluator {
public:
    ExitRuleEvaluator() = default;
    explicit ExitRuleEvaluator(const ExitConfig& config);

    /// Tranche 1: close below TD MA I, then failed follow-through after Setup 9
    ExitDecision check_tranche1(double close, const IndicatorState& state) const;

    /// Tranche 2: TDST support breach, then setup validity breach
    ExitDecision check_tranche2(double close, const IndicatorState& state,
                                double setup_lowest_low) const;

    ExitDecision check_tranche2(double close, const IndicatorState& state) const {
        return check_tranche2(close, state, state.setup_lowest_low);
    }

    /// Tranche 3: countdown exhaustion, higher-low break, then time stop
    ExitDecision check_tranche3(double close, const IndicatorState& state,
                                double entry_price, int days_held) const;

    /// Full exit when the MA2 fast line closes below the slow line
    ExitDecision check_ma2_crossover_exit(const IndicatorState& state) const;

    ExitEvaluation evaluate_all(double close, const IndicatorState& state,
                                const PositionContext& position) const;

    double fraction(Tranche tranche) const noexcept;

    const ExitConfig& config() const noexcept { return config_; }

private:
    ExitConfig config_{};
};

} // namespace demark
