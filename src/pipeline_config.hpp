#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorPeriods — per-indicator window parameters
// ---------------------------------------------------------------------------
struct IndicatorPeriods {
    int atr = 14;
    int sma_fast = 20;
    int sma_slow = 50;
    int bollinger = 20;
    double bollinger_width = 2.0;
    int rsi = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int stochastic = 14;
    int stochastic_smoothing = 3;
    int adx = 14;
    int cci = 20;
};

// ---------------------------------------------------------------------------
// Missing-value policy — chosen once per run, applied to every column
//
// ForwardFill:    leading warm-up rows take the column's first defined value.
// DropIncomplete: leading rows with any undefined column are removed.
// Both carry the last defined value across interior gaps.
// ---------------------------------------------------------------------------
struct ForwardFill {};
struct DropIncomplete {};
using MissingValuePolicy = std::variant<ForwardFill, DropIncomplete>;

inline std::string policy_name(const MissingValuePolicy& policy) {
    return std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ForwardFill>) return "forward_fill";
        else return "drop";
    }, policy);
}

inline MissingValuePolicy parse_missing_value_policy(const std::string& name) {
    if (name == "forward_fill") return ForwardFill{};
    if (name == "drop") return DropIncomplete{};
    throw std::invalid_argument("Unknown missing_value_policy: '" + name + "'");
}

// ---------------------------------------------------------------------------
// PipelineConfig
// ---------------------------------------------------------------------------
struct PipelineConfig {
    IndicatorPeriods periods;
    MissingValuePolicy missing_value_policy = ForwardFill{};
    bool parallel = false;
};

// ---------------------------------------------------------------------------
// BalanceStrategy
// ---------------------------------------------------------------------------
enum class BalanceStrategy { Oversample, Weight, None };

inline std::string strategy_name(BalanceStrategy s) {
    switch (s) {
        case BalanceStrategy::Oversample: return "oversample";
        case BalanceStrategy::Weight: return "weight";
        case BalanceStrategy::None: return "none";
    }
    return "none";
}

inline BalanceStrategy parse_balance_strategy(const std::string& name) {
    if (name == "oversample") return BalanceStrategy::Oversample;
    if (name == "weight") return BalanceStrategy::Weight;
    if (name == "none") return BalanceStrategy::None;
    throw std::invalid_argument("Unknown balance_strategy: '" + name + "'");
}

// ---------------------------------------------------------------------------
// SplitRatios / FeatureConfig
// ---------------------------------------------------------------------------
struct SplitRatios {
    double train = 0.70;
    double validation = 0.15;
    double test = 0.15;
};

struct FeatureConfig {
    double label_threshold = 0.005;
    SplitRatios split_ratios;
    double imbalance_threshold = 0.40;
    BalanceStrategy balance_strategy = BalanceStrategy::Oversample;
    int oversample_neighbors = 5;
    uint32_t seed = 42;
};

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
inline void validate_periods(const IndicatorPeriods& p) {
    auto require_positive = [](int v, const char* name) {
        if (v < 1) {
            throw std::invalid_argument(std::string("indicator period '") + name +
                                        "' must be >= 1, got " + std::to_string(v));
        }
    };
    require_positive(p.atr, "atr");
    require_positive(p.sma_fast, "sma_fast");
    require_positive(p.sma_slow, "sma_slow");
    require_positive(p.bollinger, "bollinger");
    require_positive(p.rsi, "rsi");
    require_positive(p.macd_fast, "macd_fast");
    require_positive(p.macd_slow, "macd_slow");
    require_positive(p.macd_signal, "macd_signal");
    require_positive(p.stochastic, "stochastic");
    require_positive(p.stochastic_smoothing, "stochastic_smoothing");
    require_positive(p.adx, "adx");
    require_positive(p.cci, "cci");
    if (p.bollinger < 2) {
        throw std::invalid_argument("bollinger period must be >= 2 for a sample deviation");
    }
    if (!(p.bollinger_width > 0.0)) {
        throw std::invalid_argument("bollinger_width must be positive");
    }
    if (p.sma_fast == p.sma_slow) {
        throw std::invalid_argument("sma_fast and sma_slow must differ");
    }
    if (p.macd_fast >= p.macd_slow) {
        throw std::invalid_argument("macd_fast must be shorter than macd_slow");
    }
}

inline void validate_split_ratios(const SplitRatios& r) {
    auto in_unit = [](double v) { return v > 0.0 && v < 1.0; };
    if (!in_unit(r.train) || !in_unit(r.validation) || !in_unit(r.test)) {
        throw std::invalid_argument("All split ratios must be between 0 and 1");
    }
    if (std::abs(r.train + r.validation + r.test - 1.0) > 0.001) {
        throw std::invalid_argument("Split ratios must sum to 1.0");
    }
}

// ---------------------------------------------------------------------------
// Option values from strings (CLI)
// ---------------------------------------------------------------------------
namespace config_detail {

inline double parse_number(const std::string& text, const std::string& what) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || text.find_first_not_of(" \t", pos) != std::string::npos || !std::isfinite(v)) {
        throw std::invalid_argument(what + ": '" + text + "' is not a finite number");
    }
    return v;
}

inline int parse_period(const std::string& text, const std::string& what) {
    size_t pos = 0;
    long v = 0;
    try {
        v = std::stol(text, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size() || v < 1 || v > 100000) {
        throw std::invalid_argument(what + ": '" + text + "' is not a period in [1, 100000]");
    }
    return static_cast<int>(v);
}

}  // namespace config_detail

// "a,b,c" -> {train, validation, test}, validated.
inline SplitRatios parse_split_ratios(const std::string& text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        parts.push_back(text.substr(start, comma - start));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (parts.size() != 3) {
        throw std::invalid_argument("split ratios need three comma-separated values, got '" +
                                    text + "'");
    }
    SplitRatios r{config_detail::parse_number(parts[0], "split ratio"),
                  config_detail::parse_number(parts[1], "split ratio"),
                  config_detail::parse_number(parts[2], "split ratio")};
    validate_split_ratios(r);
    return r;
}

// Sets one IndicatorPeriods field by name ("sma_fast", "bollinger_width", ...).
// Cross-field consistency is left to validate_periods.
inline void set_indicator_period(IndicatorPeriods& p, const std::string& name,
                                 const std::string& value) {
    if (name == "bollinger_width") {
        p.bollinger_width = config_detail::parse_number(value, name);
        return;
    }
    int* field = name == "atr"                    ? &p.atr
                 : name == "sma_fast"             ? &p.sma_fast
                 : name == "sma_slow"             ? &p.sma_slow
                 : name == "bollinger"            ? &p.bollinger
                 : name == "rsi"                  ? &p.rsi
                 : name == "macd_fast"            ? &p.macd_fast
                 : name == "macd_slow"            ? &p.macd_slow
                 : name == "macd_signal"          ? &p.macd_signal
                 : name == "stochastic"           ? &p.stochastic
                 : name == "stochastic_smoothing" ? &p.stochastic_smoothing
                 : name == "adx"                  ? &p.adx
                 : name == "cci"                  ? &p.cci
                                                  : nullptr;
    if (field == nullptr) {
        throw std::invalid_argument("Unknown indicator period: '" + name + "'");
    }
    *field = config_detail::parse_period(value, name);
}

inline void validate_config(const FeatureConfig& c) {
    if (!(c.label_threshold >= 0.0) || !std::isfinite(c.label_threshold)) {
        throw std::invalid_argument("label_threshold must be a non-negative number");
    }
    validate_split_ratios(c.split_ratios);
    if (!(c.imbalance_threshold > 0.0 && c.imbalance_threshold <= 0.5)) {
        throw std::invalid_argument("imbalance_threshold must lie in (0, 0.5]");
    }
    if (c.oversample_neighbors < 1) {
        throw std::invalid_argument("oversample_neighbors must be >= 1");
    }
}
