#pragma once

#include "features/feature_table.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <type_traits>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// carry_forward — replace interior NaNs with the last defined value
//
// Returns the index of the first defined value, or values.size() if none.
// Leading NaNs are left untouched.
// ---------------------------------------------------------------------------
inline size_t carry_forward(std::vector<double>& values) {
    size_t first = values.size();
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isnan(values[i])) {
            first = i;
            break;
        }
    }
    for (size_t i = first + 1; i < values.size(); ++i) {
        if (std::isnan(values[i])) values[i] = values[i - 1];
    }
    return first;
}

// ---------------------------------------------------------------------------
// apply_missing_value_policy — merge step after all columns are joined
//
// Produces a table with no NaN. Throws FeaturePipelineError if a column is
// never defined, since neither policy can recover it.
// ---------------------------------------------------------------------------
inline FeatureTable apply_missing_value_policy(const FeatureTable& table,
                                               const MissingValuePolicy& policy) {
    std::vector<std::vector<double>> filled;
    filled.reserve(table.cols());
    size_t warmup = 0;

    for (size_t c = 0; c < table.cols(); ++c) {
        std::vector<double> values = table.column(c);
        size_t first = carry_forward(values);
        if (first == values.size() && !values.empty()) {
            throw FeaturePipelineError("column '" + table.column_names()[c] +
                                       "' has no defined value over " +
                                       std::to_string(values.size()) + " rows");
        }
        if (first > warmup) warmup = first;
        filled.push_back(std::move(values));
    }

    return std::visit([&](const auto& p) -> FeatureTable {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ForwardFill>) {
            FeatureTable out(table.timestamps());
            for (size_t c = 0; c < filled.size(); ++c) {
                auto& values = filled[c];
                size_t first = 0;
                while (first < values.size() && std::isnan(values[first])) ++first;
                for (size_t i = 0; i < first; ++i) values[i] = values[first];
                out.add_column(table.column_names()[c], std::move(values));
            }
            spdlog::debug("forward_fill: seeded {} warm-up rows", warmup);
            return out;
        } else {
            const auto& ts = table.timestamps();
            FeatureTable out(std::vector<int64_t>(ts.begin() + warmup, ts.end()));
            for (size_t c = 0; c < filled.size(); ++c) {
                out.add_column(table.column_names()[c],
                               std::vector<double>(filled[c].begin() + warmup, filled[c].end()));
            }
            spdlog::debug("drop: removed {} warm-up rows, {} remain", warmup, out.rows());
            return out;
        }
    }, policy);
}
