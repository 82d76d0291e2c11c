#pragma once

#include "indicators/indicator_calculator.hpp"
#include "indicators/rolling.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RsiCalculator — Momentum-Oscillator
//
// Averages the last `period` close-to-close gains and losses (simple means).
// RSI = 100 - 100 / (1 + avg_gain / avg_loss); avg_loss == 0 saturates at 100.
// The first defined row is `period` (row 0 has no change).
// ---------------------------------------------------------------------------
class RsiCalculator : public IndicatorCalculator {
public:
    explicit RsiCalculator(int period = 14) : period_(period) {}

    std::string name() const override { return "Momentum-Oscillator"; }
    size_t min_periods() const override { return static_cast<size_t>(period_); }
    // `period` changes need `period + 1` closes.
    size_t required_bars() const override { return static_cast<size_t>(period_) + 1; }
    std::vector<std::string> column_names() const override { return {"RSI"}; }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        size_t n = bars.size();
        std::vector<double> gains(n, rolling::NaN);
        std::vector<double> losses(n, rolling::NaN);
        for (size_t i = 1; i < n; ++i) {
            double delta = bars[i].close - bars[i - 1].close;
            gains[i] = delta > 0.0 ? delta : 0.0;
            losses[i] = delta < 0.0 ? -delta : 0.0;
        }

        size_t window = static_cast<size_t>(period_);
        auto avg_gain = rolling::mean(gains, window);
        auto avg_loss = rolling::mean(losses, window);

        std::vector<double> rsi(n, rolling::NaN);
        for (size_t i = 0; i < n; ++i) {
            if (std::isnan(avg_gain[i]) || std::isnan(avg_loss[i])) continue;
            if (avg_loss[i] == 0.0) {
                rsi[i] = 100.0;
                continue;
            }
            double rs = avg_gain[i] / avg_loss[i];
            rsi[i] = 100.0 - 100.0 / (1.0 + rs);
        }
        return {{"RSI", std::move(rsi)}};
    }

private:
    int period_;
};

// ---------------------------------------------------------------------------
// StochasticCalculator — Stochastic-Oscillator
//
// %K = 100 * (close - LL) / (HH - LL) over `period` bars, NaN when HH == LL.
// %D = simple mean of %K over `smoothing` rows.
// ---------------------------------------------------------------------------
class StochasticCalculator : public IndicatorCalculator {
public:
    StochasticCalculator(int period = 14, int smoothing = 3)
        : period_(period), smoothing_(smoothing) {}

    std::string name() const override { return "Stochastic-Oscillator"; }
    size_t min_periods() const override { return static_cast<size_t>(period_); }
    // First %D row is period + smoothing - 2.
    size_t required_bars() const override {
        return static_cast<size_t>(period_ + smoothing_ - 1);
    }
    std::vector<std::string> column_names() const override { return {"Stoch_K", "Stoch_D"}; }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        size_t window = static_cast<size_t>(period_);
        auto lowest = rolling::min(lows(bars), window);
        auto highest = rolling::max(highs(bars), window);

        std::vector<double> k(bars.size(), rolling::NaN);
        for (size_t i = 0; i < bars.size(); ++i) {
            if (std::isnan(lowest[i]) || std::isnan(highest[i])) continue;
            double range = highest[i] - lowest[i];
            if (range <= 0.0) continue;
            double v = 100.0 * (bars[i].close - lowest[i]) / range;
            // Close sits inside [low, high] for valid bars; guard rounding at the edges.
            if (v < 0.0) v = 0.0;
            if (v > 100.0) v = 100.0;
            k[i] = v;
        }

        auto d = rolling::mean(k, static_cast<size_t>(smoothing_));
        return {{"Stoch_K", std::move(k)}, {"Stoch_D", std::move(d)}};
    }

private:
    int period_;
    int smoothing_;
};

// ---------------------------------------------------------------------------
// CciCalculator — Channel-Index
//
// (tp - SMA(tp)) / (0.015 * MAD(tp)), tp = (high + low + close) / 3.
// NaN when the mean absolute deviation is zero.
// ---------------------------------------------------------------------------
class CciCalculator : public IndicatorCalculator {
public:
    explicit CciCalculator(int period = 20) : period_(period) {}

    static constexpr double LAMBERT_CONSTANT = 0.015;

    std::string name() const override { return "Channel-Index"; }
    size_t min_periods() const override { return static_cast<size_t>(period_); }
    std::vector<std::string> column_names() const override { return {"CCI"}; }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        std::vector<double> tp;
        tp.reserve(bars.size());
        for (const auto& b : bars) tp.push_back((b.high + b.low + b.close) / 3.0);

        size_t window = static_cast<size_t>(period_);
        auto sma = rolling::mean(tp, window);
        auto mad = rolling::mean_abs_deviation(tp, window);

        std::vector<double> cci(bars.size(), rolling::NaN);
        for (size_t i = 0; i < bars.size(); ++i) {
            if (std::isnan(sma[i]) || std::isnan(mad[i]) || mad[i] == 0.0) continue;
            cci[i] = (tp[i] - sma[i]) / (LAMBERT_CONSTANT * mad[i]);
        }
        return {{"CCI", std::move(cci)}};
    }

private:
    int period_;
};
