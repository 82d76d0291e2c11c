#pragma once

#include "features/normalizer.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Normalization state persistence — CSV `column,mean,std,degenerate`
//
// Values are written with 17 significant digits so a reloaded state
// reproduces transform() bit for bit.
// ---------------------------------------------------------------------------
inline constexpr const char* NORMALIZATION_HEADER = "column,mean,std,degenerate";

inline void write_normalization_state(std::ostream& os, const NormalizationState& state) {
    os << NORMALIZATION_HEADER << "\n";
    os << std::setprecision(17);
    for (const auto& c : state.columns) {
        os << c.name << "," << c.mean << "," << c.stddev << "," << (c.degenerate ? 1 : 0)
           << "\n";
    }
}

inline void save_normalization_state(const std::string& path, const NormalizationState& state) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    write_normalization_state(file, state);
    if (!file) {
        throw std::runtime_error("Failed writing normalization state: " + path);
    }
}

inline NormalizationState read_normalization_state(std::istream& is) {
    std::string line;
    if (!std::getline(is, line) || line != NORMALIZATION_HEADER) {
        throw std::runtime_error("normalization state: expected header '" +
                                 std::string(NORMALIZATION_HEADER) + "'");
    }

    NormalizationState state;
    size_t line_no = 1;
    while (std::getline(is, line)) {
        ++line_no;
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) fields.push_back(field);
        if (fields.size() != 4) {
            throw std::runtime_error("normalization state line " + std::to_string(line_no) +
                                     ": expected 4 fields, got " +
                                     std::to_string(fields.size()));
        }

        ColumnStats stats;
        stats.name = fields[0];
        try {
            stats.mean = std::stod(fields[1]);
            stats.stddev = std::stod(fields[2]);
        } catch (const std::exception&) {
            throw std::runtime_error("normalization state line " + std::to_string(line_no) +
                                     ": malformed number");
        }
        if (fields[3] != "0" && fields[3] != "1") {
            throw std::runtime_error("normalization state line " + std::to_string(line_no) +
                                     ": degenerate flag must be 0 or 1");
        }
        stats.degenerate = fields[3] == "1";
        if (state.find(stats.name)) {
            throw std::runtime_error("normalization state: duplicate column '" + stats.name +
                                     "'");
        }
        state.columns.push_back(std::move(stats));
    }
    return state;
}

inline NormalizationState load_normalization_state(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open normalization state: " + path);
    }
    return read_normalization_state(file);
}
