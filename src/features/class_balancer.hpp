#pragma once

#include "features/feature_table.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ImbalanceReport — label distribution of a training segment
// ---------------------------------------------------------------------------
struct ImbalanceReport {
    size_t total = 0;
    std::map<int, size_t> counts;
    std::map<int, double> proportions;
    int minority_label = LABEL_UP;
    int majority_label = LABEL_DOWN;
    double minority_proportion = 0.0;
    double imbalance_ratio = 1.0;   // majority count / minority count
    double threshold = 0.0;
    bool is_imbalanced = false;
};

// ---------------------------------------------------------------------------
// BalancedSegment — training rows after rebalancing
//
// Synthetic rows are appended after the original rows and carry the
// timestamp of the minority row they were interpolated from.
// ---------------------------------------------------------------------------
struct BalancedSegment {
    FeatureTable features;
    std::vector<int> labels;
    std::vector<double> weights;
    std::vector<bool> synthetic;

    size_t rows() const { return labels.size(); }
    size_t synthetic_count() const {
        return static_cast<size_t>(std::count(synthetic.begin(), synthetic.end(), true));
    }
};

// ---------------------------------------------------------------------------
// ClassBalancer
//
// Operates on the training segment only. Oversampling interpolates between a
// minority row and one of its k nearest minority neighbours (Euclidean, in the
// segment's feature space) until both classes have equal counts. Weighting
// assigns total / (n_classes * count) to every row of a class.
// ---------------------------------------------------------------------------
class ClassBalancer {
public:
    explicit ClassBalancer(double imbalance_threshold = 0.40, int neighbors = 5,
                           uint32_t seed = 42)
        : imbalance_threshold_(imbalance_threshold), neighbors_(neighbors), seed_(seed) {
        if (neighbors_ < 1) throw std::invalid_argument("neighbors must be >= 1");
    }

    // Throws SingleClassLabelsError when only one label value is present.
    ImbalanceReport inspect(const std::vector<int>& labels) const {
        if (labels.empty()) {
            throw std::invalid_argument("Cannot inspect an empty label set");
        }
        ImbalanceReport r;
        r.total = labels.size();
        r.threshold = imbalance_threshold_;
        r.counts[LABEL_DOWN] = 0;
        r.counts[LABEL_UP] = 0;
        for (int l : labels) {
            if (l != LABEL_DOWN && l != LABEL_UP) {
                throw std::invalid_argument("label values must be 0 or 1, got " +
                                            std::to_string(l));
            }
            r.counts[l]++;
        }
        for (const auto& [label, count] : r.counts) {
            if (count == r.total) throw SingleClassLabelsError(label, count);
        }

        size_t up = r.counts[LABEL_UP];
        size_t down = r.counts[LABEL_DOWN];
        r.minority_label = up <= down ? LABEL_UP : LABEL_DOWN;
        r.majority_label = r.minority_label == LABEL_UP ? LABEL_DOWN : LABEL_UP;
        size_t minority = r.counts[r.minority_label];
        size_t majority = r.counts[r.majority_label];

        double n = static_cast<double>(r.total);
        r.proportions[LABEL_DOWN] = static_cast<double>(down) / n;
        r.proportions[LABEL_UP] = static_cast<double>(up) / n;
        r.minority_proportion = static_cast<double>(minority) / n;
        r.imbalance_ratio = static_cast<double>(majority) / static_cast<double>(minority);
        r.is_imbalanced = r.minority_proportion < imbalance_threshold_;
        return r;
    }

    std::map<int, double> compute_class_weights(const std::vector<int>& labels) const {
        auto report = inspect(labels);
        std::map<int, double> weights;
        double n = static_cast<double>(report.total);
        double n_classes = static_cast<double>(report.counts.size());
        for (const auto& [label, count] : report.counts) {
            weights[label] = n / (n_classes * static_cast<double>(count));
        }
        return weights;
    }

    // Rows unchanged, one weight per row inversely proportional to class frequency.
    BalancedSegment weight(const LabeledTable& train) const {
        auto class_weights = compute_class_weights(train.labels);
        BalancedSegment out = unchanged(train);
        for (size_t i = 0; i < out.labels.size(); ++i) {
            out.weights[i] = class_weights[out.labels[i]];
        }
        spdlog::info("ClassBalancer: weighted {} rows (down={:.4f}, up={:.4f})",
                     out.rows(), class_weights[LABEL_DOWN], class_weights[LABEL_UP]);
        return out;
    }

    // Appends synthetic minority rows until both classes are equally represented.
    BalancedSegment oversample(const LabeledTable& train) const {
        auto report = inspect(train.labels);
        const FeatureTable& table = train.table;

        std::vector<size_t> minority_rows;
        for (size_t i = 0; i < train.labels.size(); ++i) {
            if (train.labels[i] == report.minority_label) minority_rows.push_back(i);
        }
        size_t needed = report.counts[report.majority_label] - minority_rows.size();

        std::vector<std::vector<double>> points;
        points.reserve(minority_rows.size());
        for (size_t r : minority_rows) points.push_back(table.row(r));
        auto neighbors = nearest_neighbors(points);

        std::vector<std::vector<double>> columns(table.cols());
        for (size_t c = 0; c < table.cols(); ++c) columns[c] = table.column(c);
        std::vector<int64_t> timestamps = table.timestamps();
        std::vector<int> labels = train.labels;

        std::mt19937 rng(seed_);
        for (size_t s = 0; s < needed; ++s) {
            size_t base = s % points.size();
            const auto& x = points[base];
            const auto& nn = neighbors[base];
            double gap = 0.0;
            const std::vector<double>* other = &x;
            if (!nn.empty()) {
                other = &points[nn[rng() % nn.size()]];
                gap = static_cast<double>(rng()) / 4294967296.0;   // [0, 1)
            }
            for (size_t c = 0; c < columns.size(); ++c) {
                columns[c].push_back(x[c] + gap * ((*other)[c] - x[c]));
            }
            timestamps.push_back(table.timestamps()[minority_rows[base]]);
            labels.push_back(report.minority_label);
        }

        BalancedSegment out;
        out.features = FeatureTable(std::move(timestamps));
        for (size_t c = 0; c < columns.size(); ++c) {
            out.features.add_column(table.column_names()[c], std::move(columns[c]));
        }
        out.synthetic.assign(labels.size(), false);
        std::fill(out.synthetic.begin() + static_cast<std::ptrdiff_t>(train.labels.size()),
                  out.synthetic.end(), true);
        out.weights.assign(labels.size(), 1.0);
        out.labels = std::move(labels);

        spdlog::info("ClassBalancer: oversampled label {} with {} synthetic rows ({} -> {})",
                     label_name(report.minority_label), needed, train.rows(), out.rows());
        return out;
    }

    // Applies `strategy` only when the segment is flagged as imbalanced.
    BalancedSegment rebalance(const LabeledTable& train, BalanceStrategy strategy) const {
        auto report = inspect(train.labels);
        if (!report.is_imbalanced || strategy == BalanceStrategy::None) {
            spdlog::info("ClassBalancer: minority proportion {:.4f} (threshold {:.2f}), "
                         "strategy {}; segment left unchanged",
                         report.minority_proportion, imbalance_threshold_,
                         strategy_name(strategy));
            return unchanged(train);
        }
        spdlog::warn("ClassBalancer: imbalance detected, minority '{}' at {:.4f} < {:.2f}",
                     label_name(report.minority_label), report.minority_proportion,
                     imbalance_threshold_);
        if (strategy == BalanceStrategy::Oversample) return oversample(train);
        return weight(train);
    }

private:
    double imbalance_threshold_;
    int neighbors_;
    uint32_t seed_;

    static BalancedSegment unchanged(const LabeledTable& train) {
        BalancedSegment out;
        out.features = train.table;
        out.labels = train.labels;
        out.weights.assign(train.labels.size(), 1.0);
        out.synthetic.assign(train.labels.size(), false);
        return out;
    }

    // k nearest other points for each point; ties resolved by lower index.
    std::vector<std::vector<size_t>> nearest_neighbors(
        const std::vector<std::vector<double>>& points) const {
        size_t k = std::min(static_cast<size_t>(neighbors_),
                            points.empty() ? size_t{0} : points.size() - 1);
        std::vector<std::vector<size_t>> out(points.size());
        for (size_t i = 0; i < points.size(); ++i) {
            std::vector<std::pair<double, size_t>> dist;
            dist.reserve(points.size() - 1);
            for (size_t j = 0; j < points.size(); ++j) {
                if (j == i) continue;
                double d2 = 0.0;
                for (size_t c = 0; c < points[i].size(); ++c) {
                    double d = points[i][c] - points[j][c];
                    d2 += d * d;
                }
                dist.emplace_back(d2, j);
            }
            std::partial_sort(dist.begin(), dist.begin() + static_cast<std::ptrdiff_t>(k),
                              dist.end());
            for (size_t m = 0; m < k; ++m) out[i].push_back(dist[m].second);
        }
        return out;
    }
};
