#include <gtest/gtest.h>

#include "IndicatorEngine.hpp"
#include "Logger.hpp"
#include "test_bar_helpers.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace demark;
using test_helpers::linear_bars;
using test_helpers::make_series;
using test_helpers::random_walk;

TEST(IndicatorEngineTest, EmptySeriesProducesNothing) {
    IndicatorEngine engine;
    EXPECT_TRUE(engine.compute(BarSeries{}).empty());
    EXPECT_FALSE(engine.compute_latest(BarSeries{}).has_value());
}

TEST(IndicatorEngineTest, RisingSeriesCompletesSetupAndStartsCountdown) {
    IndicatorEngine engine;
    auto states = engine.compute(make_series(linear_bars(20, 100.0, 1.0)));
    ASSERT_EQ(states.size(), 20u);

    EXPECT_EQ(states[11].setup_count, 8);
    EXPECT_EQ(states[12].setup_count, 9);
    EXPECT_TRUE(states[12].setup_complete);
    EXPECT_DOUBLE_EQ(states[12].setup_lowest_low, 103.5);
    EXPECT_DOUBLE_EQ(states[12].setup_bar9_close, 112.0);

    EXPECT_EQ(states[12].countdown, 0);
    EXPECT_EQ(states[13].countdown, 1);
    EXPECT_EQ(states[19].countdown, 7);

    EXPECT_TRUE(states[12].tdst_active);
    EXPECT_DOUBLE_EQ(states[12].tdst_support, 103.5);
    EXPECT_FALSE(states[11].tdst_active);

    // Both moving averages trigger on every bar of a steady climb
    EXPECT_TRUE(states[12].ma1_active);
    EXPECT_DOUBLE_EQ(states[12].ma1_value, 109.5);
    EXPECT_TRUE(states[12].ma2_active);
    EXPECT_DOUBLE_EQ(states[12].ma2_value, 110.0);
    EXPECT_TRUE(states[12].entry_valid);
    EXPECT_FALSE(states[11].entry_valid);

    EXPECT_EQ(states[12].exhaustion_level, ExhaustionLevel::Maturing);
    EXPECT_EQ(states[12].bar_index, 12u);
}

TEST(IndicatorEngineTest, TdstBreakStaysConfirmedWhileBelowSupport) {
    auto bars = linear_bars(16, 100.0, 1.0);
    for (double close : {95.0, 94.0, 93.0, 92.0}) {
        bars.push_back(test_helpers::bar_at_close(close));
    }

    IndicatorEngine engine;
    auto states = engine.compute(make_series(bars));
    ASSERT_EQ(states.size(), 20u);

    EXPECT_EQ(states[15].exhaustion_level, ExhaustionLevel::Maturing);
    EXPECT_FALSE(states[15].tdst_broken);

    for (std::size_t i = 16; i < 20; ++i) {
        SCOPED_TRACE("bar " + std::to_string(i));
        EXPECT_FALSE(states[i].setup_complete);
        EXPECT_FALSE(states[i].tdst_active);
        EXPECT_TRUE(states[i].tdst_broken);
        EXPECT_EQ(states[i].exhaustion_level, ExhaustionLevel::Confirmed);
        const auto& signals = states[i].exhaustion_signals;
        EXPECT_NE(std::find(signals.begin(), signals.end(), "TDST Broken"), signals.end());
        EXPECT_NE(std::find(signals.begin(), signals.end(), "Setup 9 Complete"), signals.end());
    }
}

TEST(IndicatorEngineTest, MaturityOutlivesTheSetupRun) {
    auto bars = linear_bars(16, 100.0, 1.0);
    for (int i = 0; i < 4; ++i) {
        bars.push_back(test_helpers::bar_at_close(110.0));
    }

    IndicatorEngine engine;
    auto states = engine.compute(make_series(bars));
    ASSERT_EQ(states.size(), 20u);

    for (std::size_t i = 16; i < 20; ++i) {
        SCOPED_TRACE("bar " + std::to_string(i));
        EXPECT_FALSE(states[i].setup_complete);
        EXPECT_FALSE(states[i].tdst_broken);
        EXPECT_EQ(states[i].exhaustion_level, ExhaustionLevel::Maturing);
    }
}

TEST(IndicatorEngineTest, InvariantsHoldOnRandomWalks) {
    IndicatorEngine engine;

    for (unsigned seed : {1u, 7u, 42u, 2024u}) {
        auto series = random_walk(600, seed);
        auto states = engine.compute(series);
        ASSERT_EQ(states.size(), series.size());

        for (std::size_t i = 0; i < states.size(); ++i) {
            const auto& s = states[i];
            SCOPED_TRACE("seed " + std::to_string(seed) + " bar " + std::to_string(i));

            EXPECT_GE(s.setup_count, 0);
            EXPECT_LE(s.setup_count, 9);
            EXPECT_GE(s.bearish_setup_count, 0);
            EXPECT_LE(s.bearish_setup_count, 9);
            EXPECT_GE(s.countdown, 0);
            EXPECT_LE(s.countdown, 13);
            EXPECT_EQ(s.countdown_complete, s.countdown >= 13);
            EXPECT_EQ(s.entry_valid, s.ma1_active && s.ma2_active);
            if (!s.ma1_active) {
                EXPECT_EQ(s.ma1_value, 0.0);
            }
            if (!s.tdst_active) {
                EXPECT_EQ(s.tdst_support, 0.0);
            }
            EXPECT_GE(s.setup_bar9_range_pct, 0.0);
            EXPECT_LE(s.setup_bar9_range_pct, 1.0);
            EXPECT_EQ(s.readiness.setup, i >= 4);
            EXPECT_EQ(s.readiness.ma2_blue, i >= 34);

            if (i == 0) {
                continue;
            }
            const auto& prev = states[i - 1];
            const double close = series[i].close;
            const bool setup_edge = s.setup_count == 9 && prev.setup_count < 9;

            EXPECT_GE(s.recent_higher_low, prev.recent_higher_low);

            if (!prev.tdst_active && s.tdst_active) {
                EXPECT_TRUE(setup_edge);
            }
            if (prev.tdst_active && !s.tdst_active && !setup_edge) {
                EXPECT_LT(close, prev.tdst_support);
                EXPECT_TRUE(s.tdst_broken);
                EXPECT_EQ(s.exhaustion_level, ExhaustionLevel::Confirmed);
            }
            if (prev.tdst_active && s.tdst_active && !setup_edge) {
                EXPECT_EQ(s.tdst_support, prev.tdst_support);
            }
        }
    }
}

TEST(IndicatorEngineTest, RecomputationIsIdempotent) {
    IndicatorEngine engine;
    auto series = random_walk(300, 99u);
    EXPECT_EQ(engine.compute(series), engine.compute(series));
}

TEST(IndicatorEngineTest, StepFoldMatchesBatchCompute) {
    IndicatorEngine engine;
    auto series = random_walk(250, 5u);
    auto batch = engine.compute(series);

    EngineState state = engine.initial_state();
    for (std::size_t i = 0; i < series.size(); ++i) {
        state = engine.step(std::move(state), series[i]);
        ASSERT_EQ(state.latest, batch[i]) << "bar " << i;
    }

    auto latest = engine.compute_latest(series);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(*latest, batch.back());
}

TEST(IndicatorEngineTest, CheckHistoryReportsRequiredBars) {
    IndicatorEngine engine;

    EXPECT_EQ(engine.check_history(CalculatorId::Setup, 4), IndicatorStatus::InsufficientHistory);
    EXPECT_EQ(engine.check_history(CalculatorId::Setup, 5), IndicatorStatus::Ok);
    EXPECT_EQ(engine.check_history(CalculatorId::MovingAverage1, 12), IndicatorStatus::InsufficientHistory);
    EXPECT_EQ(engine.check_history(CalculatorId::MovingAverage1, 13), IndicatorStatus::Ok);
    EXPECT_EQ(engine.check_history(CalculatorId::Countdown, 3), IndicatorStatus::Ok);
    EXPECT_EQ(engine.check_history(CalculatorId::Tdst, 8), IndicatorStatus::InsufficientHistory);
    EXPECT_EQ(engine.check_history(CalculatorId::HigherLow, 2), IndicatorStatus::Ok);
    EXPECT_EQ(engine.check_history(CalculatorId::Ma2Blue, 34), IndicatorStatus::InsufficientHistory);
    EXPECT_EQ(engine.check_history(CalculatorId::Ma2Blue, 35), IndicatorStatus::Ok);
    EXPECT_EQ(engine.max_lookback(), 35u);
    EXPECT_EQ(engine.initial_state().window.capacity(), engine.max_lookback());
}

TEST(IndicatorEngineTest, ReadinessFlagsTurnOnAfterWarmup) {
    IndicatorEngine engine;
    auto states = engine.compute(make_series(linear_bars(40, 100.0, 1.0)));

    EXPECT_FALSE(states[0].readiness.higher_low);
    EXPECT_TRUE(states[1].readiness.higher_low);
    EXPECT_FALSE(states[11].readiness.ma1);
    EXPECT_TRUE(states[12].readiness.ma1);
    EXPECT_FALSE(states[7].readiness.tdst);
    EXPECT_TRUE(states[8].readiness.tdst);
    EXPECT_FALSE(states[33].readiness.all_ready());
    EXPECT_TRUE(states[34].readiness.all_ready());
}

TEST(IndicatorEngineTest, RejectsInvalidConfiguration) {
    EngineConfig config;
    config.moving_average.lookback_period = 0;
    EXPECT_THROW(IndicatorEngine{config}, std::invalid_argument);

    config = EngineConfig{};
    config.setup.target = 2;
    EXPECT_THROW(IndicatorEngine{config}, std::invalid_argument);
}

TEST(IndicatorEngineTest, LogsSetupCompletionAtDebug) {
    std::vector<std::string> messages;
    Logger::set_level(LogLevel::Debug);
    Logger::set_callback([&messages](LogLevel, const std::string& message) {
        messages.push_back(message);
    });

    IndicatorEngine engine;
    engine.compute(make_series(linear_bars(14, 100.0, 1.0)));

    Logger::clear_callback();
    Logger::set_level(LogLevel::Info);

    bool found_setup = false;
    bool found_tdst = false;
    for (const auto& m : messages) {
        found_setup = found_setup || m.find("bullish setup 9 complete") != std::string::npos;
        found_tdst = found_tdst || m.find("TDST support 103.5 active") != std::string::npos;
    }
    EXPECT_TRUE(found_setup);
    EXPECT_TRUE(found_tdst);
}
