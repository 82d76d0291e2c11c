#pragma once

#include "bars/bar.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorColumn — named values aligned 1:1 with the bar sequence
// ---------------------------------------------------------------------------
struct IndicatorColumn {
    std::string name;
    std::vector<double> values;
};

// ---------------------------------------------------------------------------
// IndicatorCalculator — abstract interface for one indicator family
//
// compute() is a pure function of the bars and the calculator's parameters.
// Rows whose lookback window is incomplete are NaN; compute() never throws
// on a short sequence.
// ---------------------------------------------------------------------------
class IndicatorCalculator {
public:
    virtual ~IndicatorCalculator() = default;

    // Family name used in error reports, e.g. "Directional-Trend".
    virtual std::string name() const = 0;

    // Longest lookback window of this calculator.
    virtual size_t min_periods() const = 0;

    // Bars needed before every output column has at least one defined row.
    // Calculators that chain windows (smoothing, signal lines) extend it.
    virtual size_t required_bars() const { return min_periods(); }

    // Names of the columns compute() produces, in output order.
    virtual std::vector<std::string> column_names() const = 0;

    virtual std::vector<IndicatorColumn> compute(const BarSequence& bars) const = 0;
};

// ---------------------------------------------------------------------------
// Column extraction helpers
// ---------------------------------------------------------------------------
inline std::vector<double> closes(const BarSequence& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.close);
    return out;
}

inline std::vector<double> highs(const BarSequence& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.high);
    return out;
}

inline std::vector<double> lows(const BarSequence& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.low);
    return out;
}

// True range; row 0 has no previous close and uses high - low alone.
inline std::vector<double> true_range(const BarSequence& bars) {
    std::vector<double> tr(bars.size(), 0.0);
    for (size_t i = 0; i < bars.size(); ++i) {
        double hl = bars[i].high - bars[i].low;
        if (i == 0) {
            tr[i] = hl;
            continue;
        }
        double prev_close = bars[i - 1].close;
        double hc = bars[i].high - prev_close;
        double lc = bars[i].low - prev_close;
        if (hc < 0.0) hc = -hc;
        if (lc < 0.0) lc = -lc;
        double m = hl > hc ? hl : hc;
        tr[i] = m > lc ? m : lc;
    }
    return tr;
}
