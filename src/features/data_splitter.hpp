#pragma once

#include "features/feature_table.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

// ---------------------------------------------------------------------------
// SplitBounds — row boundaries of the three contiguous segments
//
//   train      = [0, train_end)
//   validation = [train_end, validation_end)
//   test       = [validation_end, total)
// ---------------------------------------------------------------------------
struct SplitBounds {
    size_t train_end = 0;
    size_t validation_end = 0;
    size_t total = 0;

    size_t train_rows() const { return train_end; }
    size_t validation_rows() const { return validation_end - train_end; }
    size_t test_rows() const { return total - validation_end; }
};

struct DataSplit {
    LabeledTable train;
    LabeledTable validation;
    LabeledTable test;
};

// ---------------------------------------------------------------------------
// DataSplitter — temporal, order-preserving three-way split
//
// Train and validation sizes are floor(n * ratio); test takes the remainder.
// No shuffling. An empty segment raises SplitUnderflowError.
// ---------------------------------------------------------------------------
class DataSplitter {
public:
    DataSplitter() : DataSplitter(SplitRatios{}) {}
    explicit DataSplitter(const SplitRatios& ratios) : ratios_(ratios) {
        validate_split_ratios(ratios_);
    }

    const SplitRatios& ratios() const { return ratios_; }

    SplitBounds boundaries(size_t total_rows) const {
        SplitBounds b;
        b.total = total_rows;
        size_t n_train = floor_count(total_rows, ratios_.train);
        size_t n_val = floor_count(total_rows, ratios_.validation);
        b.train_end = std::min(n_train, total_rows);
        b.validation_end = std::min(b.train_end + n_val, total_rows);
        if (b.train_rows() == 0 || b.validation_rows() == 0 || b.test_rows() == 0) {
            throw SplitUnderflowError(ratios_.train, ratios_.validation, ratios_.test,
                                      total_rows);
        }
        return b;
    }

    DataSplit split(const LabeledTable& data) const {
        auto b = boundaries(data.rows());
        return {data.slice(0, b.train_end),
                data.slice(b.train_end, b.validation_end),
                data.slice(b.validation_end, b.total)};
    }

private:
    SplitRatios ratios_;

    // Plain floor of the double product: 100 * 0.29 is 28.999... and gives 28.
    static size_t floor_count(size_t n, double ratio) {
        return static_cast<size_t>(std::floor(static_cast<double>(n) * ratio));
    }
};

// ---------------------------------------------------------------------------
// verify_temporal_integrity — max(train) < min(validation) <= max(validation)
// < min(test), and each segment strictly increasing.
// ---------------------------------------------------------------------------
inline bool is_strictly_increasing(const std::vector<int64_t>& ts) {
    for (size_t i = 1; i < ts.size(); ++i) {
        if (ts[i] <= ts[i - 1]) return false;
    }
    return true;
}

inline bool verify_temporal_integrity(const FeatureTable& train,
                                      const FeatureTable& validation,
                                      const FeatureTable& test) {
    if (train.empty() || validation.empty() || test.empty()) return false;
    const auto& tr = train.timestamps();
    const auto& va = validation.timestamps();
    const auto& te = test.timestamps();
    if (!is_strictly_increasing(tr) || !is_strictly_increasing(va) ||
        !is_strictly_increasing(te)) {
        return false;
    }
    return tr.back() < va.front() && va.back() < te.front();
}
