#pragma once

#include "indicators/indicator_calculator.hpp"
#include "indicators/rolling.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SmaCalculator — Moving-Average: two independent trailing means of close
// ---------------------------------------------------------------------------
class SmaCalculator : public IndicatorCalculator {
public:
    SmaCalculator(int fast = 20, int slow = 50) : fast_(fast), slow_(slow) {}

    std::string name() const override { return "Moving-Average"; }
    size_t min_periods() const override {
        return static_cast<size_t>(std::max(fast_, slow_));
    }
    std::vector<std::string> column_names() const override {
        return {column_name(fast_), column_name(slow_)};
    }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        auto close = closes(bars);
        return {{column_name(fast_), rolling::mean(close, static_cast<size_t>(fast_))},
                {column_name(slow_), rolling::mean(close, static_cast<size_t>(slow_))}};
    }

    static std::string column_name(int period) { return "SMA_" + std::to_string(period); }

private:
    int fast_;
    int slow_;
};

// ---------------------------------------------------------------------------
// MacdCalculator — Convergence-Divergence
//
// line      = EMA(close, fast) - EMA(close, slow)   defined from row slow - 1
// signal    = EMA(line, signal)                     defined from row slow + signal - 2
// histogram = line - signal
// ---------------------------------------------------------------------------
class MacdCalculator : public IndicatorCalculator {
public:
    MacdCalculator(int fast = 12, int slow = 26, int signal = 9)
        : fast_(fast), slow_(slow), signal_(signal) {}

    std::string name() const override { return "Convergence-Divergence"; }
    size_t min_periods() const override { return static_cast<size_t>(slow_); }
    size_t required_bars() const override { return static_cast<size_t>(slow_ + signal_ - 1); }
    std::vector<std::string> column_names() const override {
        return {"MACD", "MACD_Signal", "MACD_Histogram"};
    }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        auto close = closes(bars);
        auto fast = rolling::ema(close, static_cast<size_t>(fast_));
        auto slow = rolling::ema(close, static_cast<size_t>(slow_));

        std::vector<double> line(close.size(), rolling::NaN);
        for (size_t i = 0; i < close.size(); ++i) {
            if (std::isnan(fast[i]) || std::isnan(slow[i])) continue;
            line[i] = fast[i] - slow[i];
        }

        auto signal = rolling::ema(line, static_cast<size_t>(signal_));

        std::vector<double> hist(close.size(), rolling::NaN);
        for (size_t i = 0; i < close.size(); ++i) {
            if (std::isnan(line[i]) || std::isnan(signal[i])) continue;
            hist[i] = line[i] - signal[i];
        }

        return {{"MACD", std::move(line)},
                {"MACD_Signal", std::move(signal)},
                {"MACD_Histogram", std::move(hist)}};
    }

private:
    int fast_;
    int slow_;
    int signal_;
};
