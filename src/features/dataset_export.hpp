#pragma once

#include "features/feature_engineer.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SegmentExporter — one engineered segment per CSV file
//
// Columns: timestamp, <features...>, label, weight, synthetic
// ---------------------------------------------------------------------------
class SegmentExporter {
public:
    static std::string header_line(const DatasetSegment& seg) {
        std::ostringstream ss;
        ss << "timestamp";
        for (const auto& name : seg.features.column_names()) ss << "," << name;
        ss << ",label,weight,synthetic";
        return ss.str();
    }

    static std::string format_row(const DatasetSegment& seg, size_t r) {
        std::ostringstream ss;
        ss << std::setprecision(17);
        ss << seg.features.timestamps()[r];
        for (size_t c = 0; c < seg.features.cols(); ++c) {
            ss << "," << format_double(seg.features.at(r, c));
        }
        ss << "," << seg.labels[r];
        ss << "," << seg.weights[r];
        ss << "," << (seg.synthetic[r] ? "true" : "false");
        return ss.str();
    }

    static void write(std::ostream& os, const DatasetSegment& seg) {
        os << header_line(seg) << "\n";
        for (size_t r = 0; r < seg.rows(); ++r) os << format_row(seg, r) << "\n";
    }

    static void export_csv(const std::string& path, const DatasetSegment& seg) {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        write(file, seg);
    }

    // Writes train.csv, validation.csv and test.csv under `dir`.
    static std::vector<std::string> export_dataset(const std::string& dir,
                                                   const EngineeredDataset& data) {
        std::filesystem::path base(dir);
        std::vector<std::string> paths = {(base / "train.csv").string(),
                                          (base / "validation.csv").string(),
                                          (base / "test.csv").string()};
        export_csv(paths[0], data.train);
        export_csv(paths[1], data.validation);
        export_csv(paths[2], data.test);
        return paths;
    }

private:
    static std::string format_double(double v) {
        if (std::isnan(v)) return "NaN";
        if (std::isinf(v)) return v > 0 ? "Inf" : "-Inf";
        std::ostringstream ss;
        ss << std::setprecision(17) << v;
        return ss.str();
    }
};

// ---------------------------------------------------------------------------
// Run metadata as key=value lines
// ---------------------------------------------------------------------------
inline void write_metadata(std::ostream& os, const EngineeringMetadata& m) {
    os << std::setprecision(17);
    os << "n_features=" << m.n_features << "\n";
    os << "feature_names=";
    for (size_t i = 0; i < m.feature_names.size(); ++i) {
        os << (i ? "," : "") << m.feature_names[i];
    }
    os << "\n";
    os << "n_samples=" << m.n_samples << "\n";
    os << "n_train=" << m.n_train << "\n";
    os << "n_val=" << m.n_val << "\n";
    os << "n_test=" << m.n_test << "\n";
    os << "n_synthetic=" << m.n_synthetic << "\n";
    for (const auto& [label, count] : m.imbalance.counts) {
        os << "count_" << label_name(label) << "=" << count << "\n";
    }
    os << "minority_label=" << label_name(m.imbalance.minority_label) << "\n";
    os << "minority_proportion=" << m.imbalance.minority_proportion << "\n";
    os << "imbalance_ratio=" << m.imbalance.imbalance_ratio << "\n";
    os << "is_imbalanced=" << (m.imbalance.is_imbalanced ? "true" : "false") << "\n";
    for (const auto& [label, w] : m.class_weights) {
        os << "class_weight_" << label_name(label) << "=" << w << "\n";
    }
    os << "balance_strategy=" << strategy_name(m.balance_strategy) << "\n";
    os << "rebalanced=" << (m.rebalanced ? "true" : "false") << "\n";
    os << "degenerate_columns=";
    for (size_t i = 0; i < m.degenerate_columns.size(); ++i) {
        os << (i ? "," : "") << m.degenerate_columns[i];
    }
    os << "\n";
}
