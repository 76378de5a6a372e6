#include <gtest/gtest.h>

#include "calculators/MovingAverageTrigger.hpp"
#include "test_bar_helpers.hpp"

#include <stdexcept>
#include <vector>

using namespace demark;
using test_helpers::bar_at_close;
using test_helpers::bar_with_low;
using test_helpers::run_calculator;

namespace {

// Twelve bars with low 10, then the given lows
std::vector<Bar> lows_after_flat_base(const std::vector<double>& tail)
{
    std::vector<Bar> bars;
    for (int i = 0; i < 12; ++i) {
        bars.push_back(bar_with_low(10.0));
    }
    for (double low : tail) {
        bars.push_back(bar_with_low(low));
    }
    return bars;
}

} // namespace

TEST(MovingAverageTriggerTest, Ma1ActiveForFourBarsIncludingTrigger) {
    MovingAverageTrigger ma1(TriggerKind::LowAboveLowestLow, MovingAverageConfig{});
    auto states = run_calculator(ma1, lows_after_flat_base({11.0, 9.0, 9.0, 9.0, 9.0, 9.0}));

    for (int i = 0; i < 12; ++i) {
        EXPECT_FALSE(states[i].active) << "bar " << i;
        EXPECT_DOUBLE_EQ(states[i].value, 0.0);
    }

    EXPECT_TRUE(states[12].triggered);
    for (int i = 12; i <= 15; ++i) {
        EXPECT_TRUE(states[i].active) << "bar " << i;
        EXPECT_DOUBLE_EQ(states[i].value, 51.0 / 5.0) << "bar " << i;
    }
    EXPECT_FALSE(states[13].triggered);
    EXPECT_FALSE(states[16].active);
    EXPECT_DOUBLE_EQ(states[16].value, 0.0);
}

TEST(MovingAverageTriggerTest, RetriggerRestartsWindowWithoutStacking) {
    MovingAverageTrigger ma1(TriggerKind::LowAboveLowestLow, MovingAverageConfig{});
    auto states = run_calculator(ma1, lows_after_flat_base({11.0, 9.0, 9.0, 9.5, 9.0, 9.0, 9.0, 9.0}));

    EXPECT_TRUE(states[15].triggered);
    // Low SMA over bars 11..15: 10, 11, 9, 9, 9.5
    for (int i = 15; i <= 18; ++i) {
        EXPECT_TRUE(states[i].active) << "bar " << i;
        EXPECT_DOUBLE_EQ(states[i].value, 48.5 / 5.0) << "bar " << i;
    }
    EXPECT_FALSE(states[19].active);
}

TEST(MovingAverageTriggerTest, NoTriggerBeforeLookbackIsAvailable) {
    MovingAverageTrigger ma1(TriggerKind::LowAboveLowestLow, MovingAverageConfig{});
    std::vector<Bar> bars;
    for (int i = 0; i < 12; ++i) {
        bars.push_back(bar_with_low(10.0 + i));
    }
    auto states = run_calculator(ma1, bars);
    for (const auto& s : states) {
        EXPECT_FALSE(s.triggered);
        EXPECT_FALSE(s.ready);
    }
}

TEST(MovingAverageTriggerTest, Ma2UsesClosesAgainstHighestClose) {
    MovingAverageTrigger ma2(TriggerKind::CloseAboveHighestClose, MovingAverageConfig{});
    std::vector<Bar> bars;
    for (int i = 0; i < 12; ++i) {
        bars.push_back(bar_at_close(100.0));
    }
    bars.push_back(bar_at_close(101.0));
    bars.push_back(bar_at_close(100.0));

    auto states = run_calculator(ma2, bars);
    EXPECT_FALSE(states[11].active);
    EXPECT_TRUE(states[12].triggered);
    EXPECT_DOUBLE_EQ(states[12].value, 501.0 / 5.0);
    EXPECT_TRUE(states[13].active);
    EXPECT_FALSE(states[13].triggered);
}

TEST(MovingAverageTriggerTest, LenientPolicyReportsZeroDuringSmaWarmup) {
    MovingAverageConfig config;
    config.lookback_period = 2;
    config.ma_period = 5;
    config.sma_policy = SmaWarmupPolicy::Lenient;
    MovingAverageTrigger ma1(TriggerKind::LowAboveLowestLow, config);

    auto states = run_calculator(ma1, {bar_with_low(10.0), bar_with_low(10.0), bar_with_low(11.0)});
    EXPECT_TRUE(states[2].triggered);
    EXPECT_TRUE(states[2].active);
    EXPECT_DOUBLE_EQ(states[2].value, 0.0);
    EXPECT_EQ(ma1.required_bars(), 3u);
}

TEST(MovingAverageTriggerTest, StrictPolicySuppressesTriggerUntilSmaDefined) {
    MovingAverageConfig config;
    config.lookback_period = 2;
    config.ma_period = 5;
    config.sma_policy = SmaWarmupPolicy::Strict;
    MovingAverageTrigger ma1(TriggerKind::LowAboveLowestLow, config);

    auto states = run_calculator(ma1, {bar_with_low(10.0), bar_with_low(10.0), bar_with_low(11.0),
                                       bar_with_low(11.0), bar_with_low(12.0)});
    EXPECT_FALSE(states[2].active);
    EXPECT_FALSE(states[3].active);
    // Bar 4 is the first with five lows available
    EXPECT_TRUE(states[4].triggered);
    EXPECT_DOUBLE_EQ(states[4].value, 54.0 / 5.0);
    EXPECT_EQ(ma1.required_bars(), 5u);
}

TEST(MovingAverageTriggerTest, RejectsNonPositivePeriods) {
    MovingAverageConfig config;
    config.lookback_period = 0;
    EXPECT_THROW(MovingAverageTrigger(TriggerKind::LowAboveLowestLow, config), std::invalid_argument);

    config = MovingAverageConfig{};
    config.extension_bars = 0;
    EXPECT_THROW(MovingAverageTrigger(TriggerKind::CloseAboveHighestClose, config), std::invalid_argument);
}
