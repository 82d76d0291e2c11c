#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// Rolling-window primitives shared by the indicator calculators.
//
// Every window is summed afresh in index order, oldest value first. A window
// containing any NaN yields NaN. Rows before the first full window are NaN.
// ---------------------------------------------------------------------------
namespace rolling {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// True when values[end - window .. end) is fully defined.
inline bool window_defined(const std::vector<double>& values, size_t end, size_t window) {
    if (window == 0 || end < window) return false;
    for (size_t j = end - window; j < end; ++j) {
        if (std::isnan(values[j])) return false;
    }
    return true;
}

inline std::vector<double> sum(const std::vector<double>& values, size_t window) {
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!window_defined(values, i + 1, window)) continue;
        double s = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) s += values[j];
        out[i] = s;
    }
    return out;
}

inline std::vector<double> mean(const std::vector<double>& values, size_t window) {
    auto out = sum(values, window);
    for (auto& v : out) {
        if (!std::isnan(v)) v /= static_cast<double>(window);
    }
    return out;
}

// Sample (n - 1) standard deviation over the window.
inline std::vector<double> stddev(const std::vector<double>& values, size_t window) {
    std::vector<double> out(values.size(), NaN);
    if (window < 2) return out;
    auto means = mean(values, window);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(means[i])) continue;
        double ss = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            double d = values[j] - means[i];
            ss += d * d;
        }
        out[i] = std::sqrt(ss / static_cast<double>(window - 1));
    }
    return out;
}

// Mean absolute deviation from the window mean.
inline std::vector<double> mean_abs_deviation(const std::vector<double>& values, size_t window) {
    std::vector<double> out(values.size(), NaN);
    auto means = mean(values, window);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(means[i])) continue;
        double s = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) s += std::abs(values[j] - means[i]);
        out[i] = s / static_cast<double>(window);
    }
    return out;
}

inline std::vector<double> min(const std::vector<double>& values, size_t window) {
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!window_defined(values, i + 1, window)) continue;
        out[i] = *std::min_element(values.begin() + (i + 1 - window), values.begin() + (i + 1));
    }
    return out;
}

inline std::vector<double> max(const std::vector<double>& values, size_t window) {
    std::vector<double> out(values.size(), NaN);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!window_defined(values, i + 1, window)) continue;
        out[i] = *std::max_element(values.begin() + (i + 1 - window), values.begin() + (i + 1));
    }
    return out;
}

// ---------------------------------------------------------------------------
// EMA recurrence — the state is carried explicitly through the fold.
//
// The first `period` defined inputs seed the average with their simple mean;
// afterwards ema = alpha * x + (1 - alpha) * prev with alpha = 2 / (period + 1).
// ---------------------------------------------------------------------------
struct EmaState {
    double value = NaN;
    double seed_sum = 0.0;
    size_t seen = 0;
    bool seeded = false;
};

inline EmaState ema_step(EmaState state, double x, size_t period) {
    if (std::isnan(x)) return state;
    if (!state.seeded) {
        state.seed_sum += x;
        ++state.seen;
        if (state.seen == period) {
            state.value = state.seed_sum / static_cast<double>(period);
            state.seeded = true;
        }
        return state;
    }
    double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    state.value = alpha * x + (1.0 - alpha) * state.value;
    return state;
}

// Leading NaNs are skipped; the output is NaN until the seed window is full.
inline std::vector<double> ema(const std::vector<double>& values, size_t period) {
    std::vector<double> out(values.size(), NaN);
    EmaState state;
    for (size_t i = 0; i < values.size(); ++i) {
        state = ema_step(state, values[i], period);
        if (state.seeded && !std::isnan(values[i])) out[i] = state.value;
    }
    return out;
}

}  // namespace rolling
