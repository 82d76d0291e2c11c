#pragma once

#include "features/class_balancer.hpp"
#include "features/data_splitter.hpp"
#include "features/feature_table.hpp"
#include "features/label_creator.hpp"
#include "features/normalizer.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DatasetSegment — normalized feature columns, labels and per-row weights
// ---------------------------------------------------------------------------
struct DatasetSegment {
    FeatureTable features;
    std::vector<int> labels;
    std::vector<double> weights;
    std::vector<bool> synthetic;

    size_t rows() const { return labels.size(); }
};

// ---------------------------------------------------------------------------
// EngineeringMetadata — summary of one feature-preparation run
// ---------------------------------------------------------------------------
struct EngineeringMetadata {
    size_t n_features = 0;
    std::vector<std::string> feature_names;
    size_t n_samples = 0;       // labeled rows before splitting
    size_t n_train = 0;         // original training rows (before synthesis)
    size_t n_val = 0;
    size_t n_test = 0;
    size_t n_synthetic = 0;
    ImbalanceReport imbalance;
    std::map<int, double> class_weights;
    std::vector<std::string> degenerate_columns;
    BalanceStrategy balance_strategy = BalanceStrategy::None;
    bool rebalanced = false;
};

struct EngineeredDataset {
    DatasetSegment train;
    DatasetSegment validation;
    DatasetSegment test;
    NormalizationState normalization;
    EngineeringMetadata metadata;
};

// ---------------------------------------------------------------------------
// FeatureEngineer — label, split, normalize and rebalance a feature table
//
// Order of operations:
//   1. label every row from its close (last row dropped)
//   2. compute temporal split boundaries
//   3. fit normalization on training rows only, transform all rows
//   4. cut the three segments
//   5. inspect and optionally rebalance the training segment
// ---------------------------------------------------------------------------
class FeatureEngineer {
public:
    explicit FeatureEngineer(std::vector<std::string> feature_columns,
                             const FeatureConfig& config = FeatureConfig{})
        : feature_columns_(std::move(feature_columns)),
          config_(config),
          labeler_(config.label_threshold),
          splitter_(config.split_ratios),
          balancer_(config.imbalance_threshold, config.oversample_neighbors, config.seed) {
        if (feature_columns_.empty()) {
            throw std::invalid_argument("No indicator columns specified");
        }
        validate_config(config_);
    }

    const std::vector<std::string>& feature_columns() const { return feature_columns_; }
    const FeatureConfig& config() const { return config_; }

    EngineeredDataset prepare(const FeatureTable& table) const {
        for (const auto& name : feature_columns_) {
            if (!table.has_column(name)) {
                throw std::invalid_argument("feature table is missing column '" + name + "'");
            }
        }
        if (table.has_nan()) {
            throw std::invalid_argument("feature table still contains NaN; apply a "
                                        "missing-value policy first");
        }

        LabeledTable labeled = labeler_.label(table);
        SplitBounds bounds = splitter_.boundaries(labeled.rows());

        EngineeredDataset out;
        out.normalization = FeatureNormalizer::fit(labeled.table, RowRange{0, bounds.train_end},
                                                   feature_columns_);
        LabeledTable normalized{
            FeatureNormalizer::transform(labeled.table.select(feature_columns_),
                                         out.normalization),
            labeled.labels};

        LabeledTable train = normalized.slice(0, bounds.train_end);
        LabeledTable validation = normalized.slice(bounds.train_end, bounds.validation_end);
        LabeledTable test = normalized.slice(bounds.validation_end, bounds.total);
        if (!verify_temporal_integrity(train.table, validation.table, test.table)) {
            throw FeaturePipelineError("split segments are not strictly time-ordered");
        }

        // Throws SingleClassLabelsError before any rebalancing is attempted.
        ImbalanceReport report = balancer_.inspect(train.labels);
        BalancedSegment balanced = balancer_.rebalance(train, config_.balance_strategy);

        out.train = {std::move(balanced.features), std::move(balanced.labels),
                     std::move(balanced.weights), std::move(balanced.synthetic)};
        out.validation = unit_weighted(std::move(validation));
        out.test = unit_weighted(std::move(test));

        auto& meta = out.metadata;
        meta.n_features = feature_columns_.size();
        meta.feature_names = feature_columns_;
        meta.n_samples = labeled.rows();
        meta.n_train = bounds.train_rows();
        meta.n_val = bounds.validation_rows();
        meta.n_test = bounds.test_rows();
        meta.n_synthetic = out.train.rows() - bounds.train_rows();
        meta.imbalance = report;
        meta.class_weights = balancer_.compute_class_weights(train.labels);
        meta.degenerate_columns = out.normalization.degenerate_columns();
        meta.balance_strategy = config_.balance_strategy;
        meta.rebalanced = report.is_imbalanced &&
                          config_.balance_strategy != BalanceStrategy::None;

        spdlog::info("FeatureEngineer: {} features, {} labeled rows -> train {} (+{} synthetic), "
                     "validation {}, test {}",
                     meta.n_features, meta.n_samples, meta.n_train, meta.n_synthetic,
                     meta.n_val, meta.n_test);
        if (!meta.degenerate_columns.empty()) {
            spdlog::warn("FeatureEngineer: {} degenerate column(s) in training segment",
                         meta.degenerate_columns.size());
        }
        return out;
    }

private:
    std::vector<std::string> feature_columns_;
    FeatureConfig config_;
    LabelCreator labeler_;
    DataSplitter splitter_;
    ClassBalancer balancer_;

    static DatasetSegment unit_weighted(LabeledTable&& seg) {
        DatasetSegment out;
        size_t n = seg.labels.size();
        out.features = std::move(seg.table);
        out.labels = std::move(seg.labels);
        out.weights.assign(n, 1.0);
        out.synthetic.assign(n, false);
        return out;
    }
};
