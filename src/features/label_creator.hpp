#pragma once

#include "features/feature_table.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LabelCreator — binary next-bar direction label
//
// label[i] = UP iff close[i + 1] > close[i] * (1 + threshold), else DOWN.
// The last row has no following close and is excluded from the output.
// ---------------------------------------------------------------------------
class LabelCreator {
public:
    explicit LabelCreator(double threshold = 0.005) : threshold_(threshold) {
        if (!(threshold_ >= 0.0)) {
            throw std::invalid_argument("label threshold must be non-negative");
        }
    }

    double threshold() const { return threshold_; }

    // One label per close except the last.
    std::vector<int> create_labels(const std::vector<double>& close) const {
        std::vector<int> labels;
        if (close.size() < 2) return labels;
        labels.reserve(close.size() - 1);
        double factor = 1.0 + threshold_;
        for (size_t i = 0; i + 1 < close.size(); ++i) {
            labels.push_back(close[i + 1] > close[i] * factor ? LABEL_UP : LABEL_DOWN);
        }
        return labels;
    }

    std::vector<std::string> create_label_names(const std::vector<double>& close) const {
        std::vector<std::string> names;
        for (int l : create_labels(close)) names.push_back(label_name(l));
        return names;
    }

    // Attaches labels to `table` using its close column; the last row is dropped.
    LabeledTable label(const FeatureTable& table,
                       const std::string& close_column = "Close") const {
        LabeledTable out;
        out.labels = create_labels(table.column(close_column));
        out.table = table.slice(0, out.labels.size());
        return out;
    }

private:
    double threshold_;
};
