#pragma once

#include "bars/bar.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Bar CSV — `timestamp,open,high,low,close,volume`, one bar per line
//
// The header is required (case-insensitive column names). Timestamps must
// be strictly increasing and every bar must satisfy the OHLC envelope.
// ---------------------------------------------------------------------------
namespace bar_csv_detail {

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

inline std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) fields.push_back(trim(field));
    return fields;
}

inline std::runtime_error field_error(size_t line_no, const std::string& what) {
    return std::runtime_error("bar CSV line " + std::to_string(line_no) + ": " + what);
}

// The std::sto* family stops at the first unparsable character; every field
// must be consumed in full.
inline int64_t parse_timestamp(const std::string& field, size_t line_no) {
    size_t pos = 0;
    long long v = std::stoll(field, &pos);
    if (pos != field.size()) throw field_error(line_no, "timestamp must be an integer");
    return static_cast<int64_t>(v);
}

inline double parse_price(const std::string& field, size_t line_no) {
    size_t pos = 0;
    double v = std::stod(field, &pos);
    if (pos != field.size()) throw std::invalid_argument(field);
    if (!std::isfinite(v)) throw field_error(line_no, "price must be finite");
    return v;
}

inline uint64_t parse_volume(const std::string& field, size_t line_no) {
    // stoull accepts a leading '-' and wraps it around.
    if (!field.empty() && field[0] == '-') throw field_error(line_no, "negative volume");
    size_t pos = 0;
    unsigned long long v = std::stoull(field, &pos);
    if (pos != field.size()) {
        throw field_error(line_no, "volume must be a non-negative integer");
    }
    return static_cast<uint64_t>(v);
}

}  // namespace bar_csv_detail

inline const std::vector<std::string>& bar_csv_columns() {
    static const std::vector<std::string> cols = {
        "timestamp", "open", "high", "low", "close", "volume"};
    return cols;
}

inline BarSequence read_bars_csv(std::istream& is) {
    using namespace bar_csv_detail;

    std::string line;
    if (!std::getline(is, line)) {
        throw std::runtime_error("bar CSV is empty");
    }
    auto header = split_fields(line);
    for (auto& h : header) h = lower(h);
    if (header != bar_csv_columns()) {
        throw std::runtime_error("bar CSV header must be timestamp,open,high,low,close,volume");
    }

    BarSequence bars;
    size_t line_no = 1;
    while (std::getline(is, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto f = split_fields(line);
        if (f.size() != 6) {
            throw std::runtime_error("bar CSV line " + std::to_string(line_no) +
                                     ": expected 6 fields, got " + std::to_string(f.size()));
        }

        Bar bar;
        try {
            bar.timestamp = parse_timestamp(f[0], line_no);
            bar.open = parse_price(f[1], line_no);
            bar.high = parse_price(f[2], line_no);
            bar.low = parse_price(f[3], line_no);
            bar.close = parse_price(f[4], line_no);
            bar.volume = parse_volume(f[5], line_no);
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("bar CSV line " + std::to_string(line_no) +
                                     ": malformed number");
        } catch (const std::out_of_range&) {
            throw std::runtime_error("bar CSV line " + std::to_string(line_no) +
                                     ": number out of range");
        }

        if (!has_valid_envelope(bar)) {
            throw std::runtime_error("bar CSV line " + std::to_string(line_no) +
                                     ": prices violate low <= open,close <= high");
        }
        if (!bars.empty() && bar.timestamp <= bars.back().timestamp) {
            throw std::runtime_error("bar CSV line " + std::to_string(line_no) +
                                     ": timestamp not strictly increasing");
        }
        bars.push_back(bar);
    }
    return bars;
}

inline BarSequence load_bars_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open bar file: " + path);
    }
    auto bars = read_bars_csv(file);
    spdlog::info("Loaded {} bars from {}", bars.size(), path);
    return bars;
}
