#pragma once

#include "indicators/indicator_calculator.hpp"
#include "indicators/rolling.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AtrCalculator — Range-Volatility: simple rolling mean of true range
//
// Rows [0, period - 1) are NaN.
// ---------------------------------------------------------------------------
class AtrCalculator : public IndicatorCalculator {
public:
    explicit AtrCalculator(int period = 14) : period_(period) {}

    std::string name() const override { return "Range-Volatility"; }
    size_t min_periods() const override { return static_cast<size_t>(period_); }
    std::vector<std::string> column_names() const override { return {"ATR"}; }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        auto tr = true_range(bars);
        return {{"ATR", rolling::mean(tr, static_cast<size_t>(period_))}};
    }

private:
    int period_;
};

// ---------------------------------------------------------------------------
// BollingerBandsCalculator — Banded-Volatility
//
// middle = SMA(close, period); half width = width * sample stddev(close, period).
// ---------------------------------------------------------------------------
class BollingerBandsCalculator : public IndicatorCalculator {
public:
    BollingerBandsCalculator(int period = 20, double width = 2.0)
        : period_(period), width_(width) {}

    std::string name() const override { return "Banded-Volatility"; }
    size_t min_periods() const override { return static_cast<size_t>(period_); }
    std::vector<std::string> column_names() const override {
        return {"BB_Upper", "BB_Middle", "BB_Lower"};
    }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        auto close = closes(bars);
        size_t window = static_cast<size_t>(period_);
        auto middle = rolling::mean(close, window);
        auto sd = rolling::stddev(close, window);

        std::vector<double> upper(close.size(), rolling::NaN);
        std::vector<double> lower(close.size(), rolling::NaN);
        for (size_t i = 0; i < close.size(); ++i) {
            if (std::isnan(middle[i]) || std::isnan(sd[i])) continue;
            double half = width_ * sd[i];
            upper[i] = middle[i] + half;
            lower[i] = middle[i] - half;
        }
        return {{"BB_Upper", std::move(upper)},
                {"BB_Middle", std::move(middle)},
                {"BB_Lower", std::move(lower)}};
    }

private:
    int period_;
    double width_;
};
