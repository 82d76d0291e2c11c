#pragma once

#include "features/feature_table.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ColumnStats / NormalizationState — frozen per-column (mean, std)
// ---------------------------------------------------------------------------
struct ColumnStats {
    std::string name;
    double mean = 0.0;
    double stddev = 0.0;
    bool degenerate = false;   // zero variance over the reference rows
};

struct NormalizationState {
    std::vector<ColumnStats> columns;

    bool fitted() const { return !columns.empty(); }

    const ColumnStats* find(const std::string& name) const {
        for (const auto& c : columns) {
            if (c.name == name) return &c;
        }
        return nullptr;
    }

    std::vector<std::string> degenerate_columns() const {
        std::vector<std::string> out;
        for (const auto& c : columns) {
            if (c.degenerate) out.push_back(c.name);
        }
        return out;
    }

    bool operator==(const NormalizationState& other) const {
        if (columns.size() != other.columns.size()) return false;
        for (size_t i = 0; i < columns.size(); ++i) {
            const auto& a = columns[i];
            const auto& b = other.columns[i];
            if (a.name != b.name || a.mean != b.mean || a.stddev != b.stddev ||
                a.degenerate != b.degenerate) {
                return false;
            }
        }
        return true;
    }
};

struct RowRange {
    size_t begin = 0;
    size_t end = 0;
};

// ---------------------------------------------------------------------------
// FeatureNormalizer — z-score transform fit on reference rows only
//
// transform: (x - mean) / std, or 0 for a degenerate column.
// inverse:   x * std + mean, or mean for a degenerate column.
// Columns not named in the state pass through unchanged.
// ---------------------------------------------------------------------------
class FeatureNormalizer {
public:
    // Relative tolerance under which a deviation counts as zero.
    static constexpr double DEGENERATE_TOL = 1e-12;

    static NormalizationState fit(const FeatureTable& table, RowRange reference,
                                  const std::vector<std::string>& columns) {
        if (reference.begin >= reference.end || reference.end > table.rows()) {
            throw std::invalid_argument("reference rows [" + std::to_string(reference.begin) +
                                        ", " + std::to_string(reference.end) +
                                        ") are empty or outside the table");
        }
        if (columns.empty()) {
            throw std::invalid_argument("No feature columns to normalize");
        }

        NormalizationState state;
        double n = static_cast<double>(reference.end - reference.begin);
        for (const auto& name : columns) {
            const auto& values = table.column(name);
            double sum = 0.0;
            for (size_t i = reference.begin; i < reference.end; ++i) sum += values[i];
            double mean = sum / n;
            double ss = 0.0;
            for (size_t i = reference.begin; i < reference.end; ++i) {
                double d = values[i] - mean;
                ss += d * d;
            }

            ColumnStats stats;
            stats.name = name;
            stats.mean = mean;
            stats.stddev = std::sqrt(ss / n);
            stats.degenerate = stats.stddev <= DEGENERATE_TOL * std::max(1.0, std::abs(mean));
            if (stats.degenerate) {
                spdlog::warn("FeatureNormalizer: column '{}' is constant over {} reference "
                             "rows (mean={}); normalized values will be 0",
                             name, reference.end - reference.begin, mean);
            }
            state.columns.push_back(std::move(stats));
        }
        return state;
    }

    // Fit on every row of `table`.
    static NormalizationState fit(const FeatureTable& table,
                                  const std::vector<std::string>& columns) {
        return fit(table, RowRange{0, table.rows()}, columns);
    }

    static FeatureTable transform(const FeatureTable& table, const NormalizationState& state) {
        return apply(table, state, [](double x, const ColumnStats& s) {
            return s.degenerate ? 0.0 : (x - s.mean) / s.stddev;
        });
    }

    static FeatureTable inverse(const FeatureTable& table, const NormalizationState& state) {
        return apply(table, state, [](double x, const ColumnStats& s) {
            return s.degenerate ? s.mean : x * s.stddev + s.mean;
        });
    }

private:
    template <typename Fn>
    static FeatureTable apply(const FeatureTable& table, const NormalizationState& state, Fn fn) {
        if (!state.fitted()) {
            throw std::invalid_argument("Normalizer not fitted. Call fit() first.");
        }
        for (const auto& s : state.columns) {
            if (!table.has_column(s.name)) {
                throw std::invalid_argument("table is missing normalized column '" + s.name + "'");
            }
        }

        FeatureTable out(table.timestamps());
        const auto& names = table.column_names();
        for (size_t c = 0; c < table.cols(); ++c) {
            const ColumnStats* s = state.find(names[c]);
            std::vector<double> values = table.column(c);
            if (s) {
                for (auto& v : values) v = fn(v, *s);
            }
            out.add_column(names[c], std::move(values));
        }
        return out;
    }
};
