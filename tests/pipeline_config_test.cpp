// pipeline_config_test.cpp — defaults, validation and option-name parsing

#include <gtest/gtest.h>

#include "pipeline_config.hpp"

#include <stdexcept>
#include <variant>

// ===========================================================================
// 1. Defaults
// ===========================================================================
class PipelineConfigDefaultsTest : public ::testing::Test {};

TEST_F(PipelineConfigDefaultsTest, IndicatorPeriods) {
    IndicatorPeriods p{};
    EXPECT_EQ(p.atr, 14);
    EXPECT_EQ(p.sma_fast, 20);
    EXPECT_EQ(p.sma_slow, 50);
    EXPECT_EQ(p.bollinger, 20);
    EXPECT_DOUBLE_EQ(p.bollinger_width, 2.0);
    EXPECT_EQ(p.rsi, 14);
    EXPECT_EQ(p.macd_fast, 12);
    EXPECT_EQ(p.macd_slow, 26);
    EXPECT_EQ(p.macd_signal, 9);
    EXPECT_EQ(p.stochastic, 14);
    EXPECT_EQ(p.stochastic_smoothing, 3);
    EXPECT_EQ(p.adx, 14);
    EXPECT_EQ(p.cci, 20);
}

TEST_F(PipelineConfigDefaultsTest, PipelineUsesForwardFillSerially) {
    PipelineConfig cfg{};
    EXPECT_TRUE(std::holds_alternative<ForwardFill>(cfg.missing_value_policy));
    EXPECT_FALSE(cfg.parallel);
}

TEST_F(PipelineConfigDefaultsTest, FeatureConfig) {
    FeatureConfig cfg{};
    EXPECT_DOUBLE_EQ(cfg.label_threshold, 0.005);
    EXPECT_DOUBLE_EQ(cfg.split_ratios.train, 0.70);
    EXPECT_DOUBLE_EQ(cfg.split_ratios.validation, 0.15);
    EXPECT_DOUBLE_EQ(cfg.split_ratios.test, 0.15);
    EXPECT_DOUBLE_EQ(cfg.imbalance_threshold, 0.40);
    EXPECT_EQ(cfg.balance_strategy, BalanceStrategy::Oversample);
    EXPECT_EQ(cfg.oversample_neighbors, 5);
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_NO_THROW(validate_config(cfg));
}

// ===========================================================================
// 2. Validation
// ===========================================================================
class PipelineConfigValidationTest : public ::testing::Test {};

TEST_F(PipelineConfigValidationTest, DefaultPeriodsAreValid) {
    EXPECT_NO_THROW(validate_periods(IndicatorPeriods{}));
}

TEST_F(PipelineConfigValidationTest, NonPositivePeriodRejected) {
    IndicatorPeriods p{};
    p.adx = 0;
    EXPECT_THROW(validate_periods(p), std::invalid_argument);
    p = IndicatorPeriods{};
    p.cci = -3;
    EXPECT_THROW(validate_periods(p), std::invalid_argument);
}

TEST_F(PipelineConfigValidationTest, InconsistentPeriodsRejected) {
    IndicatorPeriods p{};
    p.macd_fast = 30;
    EXPECT_THROW(validate_periods(p), std::invalid_argument);

    p = IndicatorPeriods{};
    p.sma_fast = p.sma_slow;
    EXPECT_THROW(validate_periods(p), std::invalid_argument);

    p = IndicatorPeriods{};
    p.bollinger = 1;
    EXPECT_THROW(validate_periods(p), std::invalid_argument);

    p = IndicatorPeriods{};
    p.bollinger_width = 0.0;
    EXPECT_THROW(validate_periods(p), std::invalid_argument);
}

TEST_F(PipelineConfigValidationTest, SplitRatiosMustSumToOne) {
    EXPECT_THROW(validate_split_ratios({0.7, 0.2, 0.2}), std::invalid_argument);
    EXPECT_NO_THROW(validate_split_ratios({0.6, 0.2, 0.2}));
    EXPECT_NO_THROW(validate_split_ratios({0.7, 0.15, 0.1505}));   // within 1e-3
}

TEST_F(PipelineConfigValidationTest, SplitRatiosMustLieInUnitInterval) {
    EXPECT_THROW(validate_split_ratios({1.0, 0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(validate_split_ratios({1.2, -0.1, -0.1}), std::invalid_argument);
}

TEST_F(PipelineConfigValidationTest, FeatureConfigDomains) {
    FeatureConfig cfg{};
    cfg.label_threshold = -0.01;
    EXPECT_THROW(validate_config(cfg), std::invalid_argument);

    cfg = FeatureConfig{};
    cfg.imbalance_threshold = 0.0;
    EXPECT_THROW(validate_config(cfg), std::invalid_argument);
    cfg.imbalance_threshold = 0.6;
    EXPECT_THROW(validate_config(cfg), std::invalid_argument);
    cfg.imbalance_threshold = 0.5;
    EXPECT_NO_THROW(validate_config(cfg));

    cfg = FeatureConfig{};
    cfg.oversample_neighbors = 0;
    EXPECT_THROW(validate_config(cfg), std::invalid_argument);
}

// ===========================================================================
// 3. Option names
// ===========================================================================
class PipelineConfigParsingTest : public ::testing::Test {};

TEST_F(PipelineConfigParsingTest, MissingValuePolicyNames) {
    EXPECT_TRUE(std::holds_alternative<ForwardFill>(parse_missing_value_policy("forward_fill")));
    EXPECT_TRUE(std::holds_alternative<DropIncomplete>(parse_missing_value_policy("drop")));
    EXPECT_EQ(policy_name(ForwardFill{}), "forward_fill");
    EXPECT_EQ(policy_name(DropIncomplete{}), "drop");
    EXPECT_THROW(parse_missing_value_policy("interpolate"), std::invalid_argument);
}

TEST_F(PipelineConfigParsingTest, BalanceStrategyNames) {
    for (auto s : {BalanceStrategy::Oversample, BalanceStrategy::Weight, BalanceStrategy::None}) {
        EXPECT_EQ(parse_balance_strategy(strategy_name(s)), s);
    }
    EXPECT_THROW(parse_balance_strategy("smote"), std::invalid_argument);
}

TEST_F(PipelineConfigParsingTest, SplitRatiosFromText) {
    auto r = parse_split_ratios("0.6,0.25,0.15");
    EXPECT_DOUBLE_EQ(r.train, 0.6);
    EXPECT_DOUBLE_EQ(r.validation, 0.25);
    EXPECT_DOUBLE_EQ(r.test, 0.15);

    auto spaced = parse_split_ratios(" 0.8, 0.1 ,0.1");
    EXPECT_DOUBLE_EQ(spaced.train, 0.8);
    EXPECT_DOUBLE_EQ(spaced.test, 0.1);
}

TEST_F(PipelineConfigParsingTest, MalformedSplitRatiosRejected) {
    EXPECT_THROW(parse_split_ratios("0.7,0.3"), std::invalid_argument);
    EXPECT_THROW(parse_split_ratios("0.5,0.25,0.15,0.1"), std::invalid_argument);
    EXPECT_THROW(parse_split_ratios("0.7,,0.3"), std::invalid_argument);
    EXPECT_THROW(parse_split_ratios("0.7,0.15x,0.15"), std::invalid_argument);
    EXPECT_THROW(parse_split_ratios("0.7,nan,0.15"), std::invalid_argument);
    // parses, but does not sum to one
    EXPECT_THROW(parse_split_ratios("0.5,0.5,0.5"), std::invalid_argument);
}

TEST_F(PipelineConfigParsingTest, PeriodOverridesByName) {
    IndicatorPeriods p;
    set_indicator_period(p, "rsi", "21");
    set_indicator_period(p, "macd_signal", "5");
    set_indicator_period(p, "bollinger_width", "2.5");
    EXPECT_EQ(p.rsi, 21);
    EXPECT_EQ(p.macd_signal, 5);
    EXPECT_DOUBLE_EQ(p.bollinger_width, 2.5);
    EXPECT_EQ(p.atr, 14);
    EXPECT_NO_THROW(validate_periods(p));

    set_indicator_period(p, "sma_fast", "50");
    EXPECT_THROW(validate_periods(p), std::invalid_argument);
}

TEST_F(PipelineConfigParsingTest, BadPeriodOverridesRejected) {
    IndicatorPeriods p;
    EXPECT_THROW(set_indicator_period(p, "vwap", "10"), std::invalid_argument);
    EXPECT_THROW(set_indicator_period(p, "rsi", "0"), std::invalid_argument);
    EXPECT_THROW(set_indicator_period(p, "rsi", "14.5"), std::invalid_argument);
    EXPECT_THROW(set_indicator_period(p, "rsi", "abc"), std::invalid_argument);
    EXPECT_THROW(set_indicator_period(p, "bollinger_width", "inf"), std::invalid_argument);
    EXPECT_EQ(p.rsi, 14);
}
