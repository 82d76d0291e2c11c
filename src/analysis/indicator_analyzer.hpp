#pragma once

#include "features/feature_table.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorImportance — one indicator's share of model importance
// ---------------------------------------------------------------------------
struct IndicatorImportance {
    std::string name;
    double importance = 0.0;
};

struct IndicatorCorrelation {
    std::string name;
    double abs_correlation = 0.0;
};

// ---------------------------------------------------------------------------
// InsightThresholds
// ---------------------------------------------------------------------------
struct InsightThresholds {
    double good_accuracy = 0.60;
    double moderate_accuracy = 0.55;
    double strong_correlation = 0.30;
    int top_n = 3;
};

// ---------------------------------------------------------------------------
// IndicatorAnalyzer — ranks indicators from classifier importances
//
// Importances come from an external classifier: one non-negative value per
// indicator column, summing to 1. Ranking is descending by importance with
// ties broken by name.
// ---------------------------------------------------------------------------
class IndicatorAnalyzer {
public:
    static constexpr double SUM_TOL = 1e-6;

    // Throws std::invalid_argument when the map is empty, has a negative or
    // non-finite entry, or does not sum to 1 within SUM_TOL.
    static void validate_importances(const std::map<std::string, double>& importances) {
        double sum = check_entries(importances);
        if (std::abs(sum - 1.0) > SUM_TOL) {
            throw std::invalid_argument("importances sum to " + std::to_string(sum) +
                                        ", expected 1");
        }
    }

    // Scales raw non-negative scores so they sum to 1.
    static std::map<std::string, double> normalize_importances(
        const std::map<std::string, double>& raw) {
        double sum = check_entries(raw);
        if (sum <= 0.0) {
            throw std::invalid_argument("importances are all zero");
        }
        std::map<std::string, double> out;
        for (const auto& [name, v] : raw) out[name] = v / sum;
        return out;
    }

    static std::vector<IndicatorImportance> rank(
        const std::map<std::string, double>& importances) {
        validate_importances(importances);
        std::vector<IndicatorImportance> ranked;
        ranked.reserve(importances.size());
        for (const auto& [name, v] : importances) ranked.push_back({name, v});
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const IndicatorImportance& a, const IndicatorImportance& b) {
                             return a.importance > b.importance;
                         });
        return ranked;
    }

    static std::vector<std::string> top_indicators(
        const std::map<std::string, double>& importances, int top_n = 3) {
        if (top_n < 0) throw std::invalid_argument("top_n must be non-negative");
        auto ranked = rank(importances);
        std::vector<std::string> out;
        for (size_t i = 0; i < ranked.size() && i < static_cast<size_t>(top_n); ++i) {
            out.push_back(ranked[i].name);
        }
        return out;
    }

    // Nested prefixes of the ranking: {top1}, {top1, top2}, {top1, top2, top3}.
    static std::vector<std::vector<std::string>> top_combinations(
        const std::map<std::string, double>& importances, int top_n = 3) {
        auto top = top_indicators(importances, top_n);
        std::vector<std::vector<std::string>> combos;
        for (size_t k = 1; k <= top.size(); ++k) {
            combos.emplace_back(top.begin(), top.begin() + static_cast<std::ptrdiff_t>(k));
        }
        return combos;
    }

    // |Pearson(column, labels)| per column, descending. Undefined correlation
    // (constant column or labels) reports 0.
    static std::vector<IndicatorCorrelation> label_correlations(
        const FeatureTable& table, const std::vector<int>& labels,
        const std::vector<std::string>& columns) {
        if (labels.size() != table.rows()) {
            throw std::invalid_argument("labels have " + std::to_string(labels.size()) +
                                        " rows, table has " + std::to_string(table.rows()));
        }
        std::vector<double> y(labels.begin(), labels.end());
        std::vector<IndicatorCorrelation> out;
        for (const auto& name : columns) {
            if (!table.has_column(name)) continue;
            double r = pearson(table.column(name), y);
            out.push_back({name, std::isnan(r) ? 0.0 : std::abs(r)});
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const IndicatorCorrelation& a, const IndicatorCorrelation& b) {
                             return a.abs_correlation > b.abs_correlation;
                         });
        return out;
    }

    static std::vector<std::string> generate_insights(
        const std::map<std::string, double>& importances,
        const std::vector<IndicatorCorrelation>& correlations, double accuracy,
        const InsightThresholds& th = InsightThresholds{}) {
        std::vector<std::string> insights;

        auto top = top_indicators(importances, th.top_n);
        insights.push_back("Top " + std::to_string(top.size()) +
                           " most predictive indicators: " + join(top));

        std::string band = accuracy > th.good_accuracy       ? "good"
                           : accuracy > th.moderate_accuracy ? "moderate"
                                                             : "weak";
        char pct[32];
        std::snprintf(pct, sizeof(pct), "%.1f%%", accuracy * 100.0);
        insights.push_back("Model shows " + band + " predictive power with " + pct +
                           " accuracy");

        std::vector<std::string> strong;
        for (const auto& c : correlations) {
            if (c.abs_correlation > th.strong_correlation) strong.push_back(c.name);
        }
        if (!strong.empty()) {
            insights.push_back("Indicators with strong correlation to price movements: " +
                               join(strong));
        }
        return insights;
    }

    static double pearson(const std::vector<double>& x, const std::vector<double>& y) {
        size_t n = x.size();
        if (n != y.size() || n < 2) return std::nan("");
        double mx = 0.0, my = 0.0;
        for (size_t i = 0; i < n; ++i) {
            mx += x[i];
            my += y[i];
        }
        mx /= static_cast<double>(n);
        my /= static_cast<double>(n);
        double sxy = 0.0, sxx = 0.0, syy = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double dx = x[i] - mx;
            double dy = y[i] - my;
            sxy += dx * dy;
            sxx += dx * dx;
            syy += dy * dy;
        }
        if (sxx < 1e-20 || syy < 1e-20) return std::nan("");
        return sxy / std::sqrt(sxx * syy);
    }

private:
    static double check_entries(const std::map<std::string, double>& importances) {
        if (importances.empty()) {
            throw std::invalid_argument("no feature importances given");
        }
        double sum = 0.0;
        for (const auto& [name, v] : importances) {
            if (!std::isfinite(v) || v < 0.0) {
                throw std::invalid_argument("importance for '" + name +
                                            "' must be a non-negative number");
            }
            sum += v;
        }
        return sum;
    }

    static std::string join(const std::vector<std::string>& items) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += items[i];
        }
        return out;
    }
};
