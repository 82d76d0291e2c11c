#pragma once

#include "indicators/indicator_calculator.hpp"
#include "indicators/rolling.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AdxCalculator — Directional-Trend
//
//   up   = high[t] - high[t-1]      down = low[t-1] - low[t]
//   +DM  = up   if up > down and up > 0, else 0
//   -DM  = down if down > up and down > 0, else 0
//   +DI  = 100 * sum(+DM, P) / sum(TR, P)     (same for -DI)
//   DX   = 100 * |+DI - -DI| / (+DI + -DI)    (0 when both are 0)
//   ADX  = mean(DX, P)
//
// Sums and means are simple rolling windows. The first defined ADX row is
// 2P - 1; a window whose true range sums to zero leaves DX undefined.
// ---------------------------------------------------------------------------
class AdxCalculator : public IndicatorCalculator {
public:
    explicit AdxCalculator(int period = 14) : period_(period) {}

    std::string name() const override { return "Directional-Trend"; }
    size_t min_periods() const override { return static_cast<size_t>(period_); }
    std::vector<std::string> column_names() const override { return {"ADX"}; }

    std::vector<IndicatorColumn> compute(const BarSequence& bars) const override {
        size_t n = bars.size();
        std::vector<double> plus_dm(n, rolling::NaN);
        std::vector<double> minus_dm(n, rolling::NaN);
        std::vector<double> tr(n, rolling::NaN);

        auto full_tr = true_range(bars);
        for (size_t i = 1; i < n; ++i) {
            double up = bars[i].high - bars[i - 1].high;
            double down = bars[i - 1].low - bars[i].low;
            plus_dm[i] = (up > down && up > 0.0) ? up : 0.0;
            minus_dm[i] = (down > up && down > 0.0) ? down : 0.0;
            tr[i] = full_tr[i];
        }

        size_t window = static_cast<size_t>(period_);
        auto plus_sum = rolling::sum(plus_dm, window);
        auto minus_sum = rolling::sum(minus_dm, window);
        auto tr_sum = rolling::sum(tr, window);

        std::vector<double> dx(n, rolling::NaN);
        for (size_t i = 0; i < n; ++i) {
            if (std::isnan(tr_sum[i]) || tr_sum[i] <= 0.0) continue;
            double plus_di = 100.0 * plus_sum[i] / tr_sum[i];
            double minus_di = 100.0 * minus_sum[i] / tr_sum[i];
            double di_sum = plus_di + minus_di;
            dx[i] = di_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
        }

        return {{"ADX", rolling::mean(dx, window)}};
    }

private:
    int period_;
};
