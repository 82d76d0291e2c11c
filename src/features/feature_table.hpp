#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// FeatureTable — column-major table aligned by row index
//
// Columns are owned by the table and never shared with calculators; every
// transform builds a new table.
// ---------------------------------------------------------------------------
class FeatureTable {
public:
    FeatureTable() = default;
    explicit FeatureTable(std::vector<int64_t> timestamps)
        : timestamps_(std::move(timestamps)) {}

    size_t rows() const { return timestamps_.size(); }
    size_t cols() const { return columns_.size(); }
    bool empty() const { return timestamps_.empty(); }

    const std::vector<int64_t>& timestamps() const { return timestamps_; }
    const std::vector<std::string>& column_names() const { return names_; }

    void add_column(const std::string& name, std::vector<double> values) {
        if (values.size() != rows()) {
            throw std::invalid_argument("column '" + name + "' has " +
                                        std::to_string(values.size()) + " rows, table has " +
                                        std::to_string(rows()));
        }
        if (has_column(name)) {
            throw std::invalid_argument("duplicate column '" + name + "'");
        }
        names_.push_back(name);
        columns_.push_back(std::move(values));
    }

    bool has_column(const std::string& name) const {
        for (const auto& n : names_) {
            if (n == name) return true;
        }
        return false;
    }

    size_t column_index(const std::string& name) const {
        for (size_t i = 0; i < names_.size(); ++i) {
            if (names_[i] == name) return i;
        }
        throw std::invalid_argument("unknown column '" + name + "'");
    }

    const std::vector<double>& column(size_t idx) const { return columns_.at(idx); }
    const std::vector<double>& column(const std::string& name) const {
        return columns_[column_index(name)];
    }

    double at(size_t row, size_t col) const { return columns_.at(col).at(row); }

    // Row-major view of one row across all columns.
    std::vector<double> row(size_t r) const {
        std::vector<double> out;
        out.reserve(columns_.size());
        for (const auto& c : columns_) out.push_back(c.at(r));
        return out;
    }

    // Rows [begin, end), order preserved.
    FeatureTable slice(size_t begin, size_t end) const {
        if (begin > end || end > rows()) {
            throw std::out_of_range("slice [" + std::to_string(begin) + ", " +
                                    std::to_string(end) + ") outside table of " +
                                    std::to_string(rows()) + " rows");
        }
        FeatureTable out(std::vector<int64_t>(timestamps_.begin() + begin,
                                              timestamps_.begin() + end));
        for (size_t c = 0; c < columns_.size(); ++c) {
            out.add_column(names_[c], std::vector<double>(columns_[c].begin() + begin,
                                                          columns_[c].begin() + end));
        }
        return out;
    }

    // Subset of columns, in the order given.
    FeatureTable select(const std::vector<std::string>& names) const {
        FeatureTable out(timestamps_);
        for (const auto& n : names) out.add_column(n, column(n));
        return out;
    }

    bool has_nan() const {
        for (const auto& c : columns_) {
            for (double v : c) {
                if (std::isnan(v)) return true;
            }
        }
        return false;
    }

    // Exact equality including column order; NaN never compares equal.
    bool operator==(const FeatureTable& other) const {
        return timestamps_ == other.timestamps_ && names_ == other.names_ &&
               columns_ == other.columns_;
    }

private:
    std::vector<int64_t> timestamps_;
    std::vector<std::string> names_;
    std::vector<std::vector<double>> columns_;
};

// ---------------------------------------------------------------------------
// LabeledTable — a feature table plus one binary label per row
// ---------------------------------------------------------------------------
constexpr int LABEL_DOWN = 0;
constexpr int LABEL_UP = 1;

inline std::string label_name(int label) { return label == LABEL_UP ? "up" : "down"; }

struct LabeledTable {
    FeatureTable table;
    std::vector<int> labels;

    size_t rows() const { return labels.size(); }

    LabeledTable slice(size_t begin, size_t end) const {
        return {table.slice(begin, end),
                std::vector<int>(labels.begin() + begin, labels.begin() + end)};
    }
};
