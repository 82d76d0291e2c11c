// moving_average_test.cpp — tests for SmaCalculator and MacdCalculator
//
// MACD expectations on closes [1, 2, 4, 8, 16] with (fast, slow, signal) =
// (2, 3, 2) were worked by hand as exact fractions.

#include <gtest/gtest.h>

#include "indicators/moving_average.hpp"

#include "test_bar_helpers.hpp"

#include <cmath>
#include <vector>

namespace {

using test_helpers::linear_closes;
using test_helpers::make_bars_from_closes;
using test_helpers::make_sine_bars;

}  // namespace

// ===========================================================================
// 1. Moving-Average (SMA)
// ===========================================================================
class SmaTest : public ::testing::Test {
protected:
    BarSequence bars_ = make_bars_from_closes(linear_closes(25));
};

TEST_F(SmaTest, IdentityAndSchema) {
    SmaCalculator sma;
    EXPECT_EQ(sma.name(), "Moving-Average");
    EXPECT_EQ(sma.min_periods(), 50u);
    EXPECT_EQ(sma.column_names(), (std::vector<std::string>{"SMA_20", "SMA_50"}));
}

TEST_F(SmaTest, Sma20AtRow19IsMeanOfFirstTwentyCloses) {
    auto out = SmaCalculator(20, 50).compute(bars_);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].name, "SMA_20");
    EXPECT_DOUBLE_EQ(out[0].values[19], 10.5);
    EXPECT_DOUBLE_EQ(out[0].values[24], 15.5);
    for (size_t i = 0; i < 19; ++i) EXPECT_TRUE(std::isnan(out[0].values[i]));
}

TEST_F(SmaTest, SlowColumnAllNaNOnShortInput) {
    auto out = SmaCalculator(20, 50).compute(bars_);
    EXPECT_EQ(out[1].name, "SMA_50");
    for (double v : out[1].values) EXPECT_TRUE(std::isnan(v));
}

TEST_F(SmaTest, CustomPeriodsRenameColumns) {
    SmaCalculator sma(5, 10);
    EXPECT_EQ(sma.column_names(), (std::vector<std::string>{"SMA_5", "SMA_10"}));
    EXPECT_EQ(sma.min_periods(), 10u);
}

// ===========================================================================
// 2. Convergence-Divergence (MACD)
// ===========================================================================
class MacdTest : public ::testing::Test {};

TEST_F(MacdTest, IdentityAndSchema) {
    MacdCalculator macd;
    EXPECT_EQ(macd.name(), "Convergence-Divergence");
    EXPECT_EQ(macd.min_periods(), 26u);
    EXPECT_EQ(macd.required_bars(), 34u);
    EXPECT_EQ(macd.column_names(),
              (std::vector<std::string>{"MACD", "MACD_Signal", "MACD_Histogram"}));
}

TEST_F(MacdTest, HandWorkedSmallPeriods) {
    auto bars = make_bars_from_closes({1, 2, 4, 8, 16});
    auto out = MacdCalculator(2, 3, 2).compute(bars);
    const auto& line = out[0].values;
    const auto& signal = out[1].values;
    const auto& hist = out[2].values;

    EXPECT_TRUE(std::isnan(line[1]));
    EXPECT_NEAR(line[2], 5.0 / 6.0, 1e-12);
    EXPECT_NEAR(line[3], 11.0 / 9.0, 1e-12);
    EXPECT_NEAR(line[4], 239.0 / 108.0, 1e-12);

    EXPECT_TRUE(std::isnan(signal[2]));
    EXPECT_NEAR(signal[3], 37.0 / 36.0, 1e-12);
    EXPECT_NEAR(signal[4], 589.0 / 324.0, 1e-12);

    EXPECT_NEAR(hist[3], 11.0 / 9.0 - 37.0 / 36.0, 1e-12);
    EXPECT_NEAR(hist[4], 128.0 / 324.0, 1e-12);
}

TEST_F(MacdTest, DefaultWarmUpRows) {
    auto bars = make_sine_bars(60);
    auto out = MacdCalculator().compute(bars);
    // line from row slow - 1 = 25, signal from row 25 + 9 - 1 = 33
    EXPECT_TRUE(std::isnan(out[0].values[24]));
    EXPECT_FALSE(std::isnan(out[0].values[25]));
    EXPECT_TRUE(std::isnan(out[1].values[32]));
    EXPECT_FALSE(std::isnan(out[1].values[33]));
    EXPECT_TRUE(std::isnan(out[2].values[32]));
    EXPECT_FALSE(std::isnan(out[2].values[33]));
}

TEST_F(MacdTest, HistogramIsLineMinusSignal) {
    auto bars = make_sine_bars(120);
    auto out = MacdCalculator().compute(bars);
    for (size_t i = 33; i < bars.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[2].values[i], out[0].values[i] - out[1].values[i]);
    }
}

TEST_F(MacdTest, RecomputationFromSameStartIsBitIdentical) {
    auto bars = make_sine_bars(150);
    auto a = MacdCalculator().compute(bars);
    auto b = MacdCalculator().compute(bars);
    for (size_t c = 0; c < a.size(); ++c) {
        for (size_t i = 33; i < bars.size(); ++i) {
            EXPECT_EQ(a[c].values[i], b[c].values[i]);
        }
    }
}

TEST_F(MacdTest, StartingMidSequenceChangesEarlyValues) {
    auto bars = make_sine_bars(150);
    BarSequence tail(bars.begin() + 10, bars.end());
    auto full = MacdCalculator().compute(bars);
    auto late = MacdCalculator().compute(tail);
    // Same bar, different EMA seed window.
    EXPECT_NE(full[0].values[40], late[0].values[30]);
}
