#include <gtest/gtest.h>

#include "BarWindow.hpp"
#include "calculators/TdstLevelTracker.hpp"
#include "test_bar_helpers.hpp"

#include <stdexcept>
#include <vector>

using namespace demark;
using test_helpers::bar_at_close;
using test_helpers::linear_bars;

namespace {

// Feed bars, signalling a completed bullish/bearish setup at the given indices
std::vector<TdstLevelTracker::State> run_tdst(const std::vector<Bar>& bars, int bullish_at, int bearish_at)
{
    TdstLevelTracker tracker(9);
    BarWindow window;
    TdstLevelTracker::State state{};
    std::vector<TdstLevelTracker::State> states;
    for (std::size_t i = 0; i < bars.size(); ++i) {
        window.append_bar(bars[i]);
        state = tracker.step(state, static_cast<int>(i) == bullish_at, static_cast<int>(i) == bearish_at, window);
        states.push_back(state);
    }
    return states;
}

} // namespace

TEST(TdstLevelTrackerTest, SupportFromBarsOneToFourOfTheSetup) {
    auto bars = linear_bars(16, 100.0, 1.0);
    bars.push_back(bar_at_close(103.0));

    auto states = run_tdst(bars, 12, -1);
    EXPECT_FALSE(states[11].support_active);
    EXPECT_DOUBLE_EQ(states[11].support(), 0.0);

    // min(low[4..7]) = low[4]
    EXPECT_TRUE(states[12].support_active);
    EXPECT_TRUE(states[12].support_activated_this_bar);
    EXPECT_DOUBLE_EQ(states[12].support(), 103.5);

    EXPECT_TRUE(states[15].support_active);
    EXPECT_FALSE(states[15].support_activated_this_bar);

    // Close 103 below the level
    EXPECT_FALSE(states[16].support_active);
    EXPECT_TRUE(states[16].support_violated_this_bar);
    EXPECT_DOUBLE_EQ(states[16].support(), 0.0);
}

TEST(TdstLevelTrackerTest, IgnoresCompletionBeforeNineBars) {
    auto states = run_tdst(linear_bars(10, 100.0, 1.0), 7, -1);
    EXPECT_FALSE(states[7].support_active);
    EXPECT_FALSE(states[9].support_active);
}

TEST(TdstLevelTrackerTest, ResistanceBreakoutFlagLastsOneBar) {
    auto bars = linear_bars(13, 200.0, -1.0);
    bars.push_back(bar_at_close(197.0));
    bars.push_back(bar_at_close(196.0));

    auto states = run_tdst(bars, -1, 12);

    // max(high[4..7]) = high[4]
    EXPECT_TRUE(states[12].resistance_active);
    EXPECT_DOUBLE_EQ(states[12].resistance(), 196.5);
    EXPECT_FALSE(states[12].resistance_broken);

    EXPECT_FALSE(states[13].resistance_active);
    EXPECT_TRUE(states[13].resistance_broken);
    EXPECT_DOUBLE_EQ(states[13].resistance(), 196.5);

    EXPECT_FALSE(states[14].resistance_broken);
    EXPECT_DOUBLE_EQ(states[14].resistance(), 0.0);
}

TEST(TdstLevelTrackerTest, NewSetupReplacesActiveLevel) {
    auto bars = linear_bars(26, 100.0, 1.0);
    auto first = run_tdst(bars, 12, -1);
    EXPECT_DOUBLE_EQ(first[25].support(), 103.5);

    TdstLevelTracker tracker(9);
    BarWindow window;
    TdstLevelTracker::State state{};
    for (std::size_t i = 0; i < bars.size(); ++i) {
        window.append_bar(bars[i]);
        state = tracker.step(state, i == 12 || i == 25, false, window);
    }
    // Bars 17..20 of the series are bars 1..4 of the second setup
    EXPECT_DOUBLE_EQ(state.support(), 116.5);
}

TEST(TdstLevelTrackerTest, RejectsShortSetup) {
    EXPECT_THROW(TdstLevelTracker(3), std::invalid_argument);
}
