#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// FeaturePipelineError — structural failures that abort a run
// ---------------------------------------------------------------------------
class FeaturePipelineError : public std::runtime_error {
public:
    explicit FeaturePipelineError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// InsufficientHistoryError — a calculator needs more bars than were given
//
// Every short calculator is listed, not just the first one found.
// ---------------------------------------------------------------------------
struct HistoryShortfall {
    std::string indicator;
    size_t required = 0;
};

class InsufficientHistoryError : public FeaturePipelineError {
public:
    InsufficientHistoryError(std::vector<HistoryShortfall> shortfalls, size_t actual)
        : FeaturePipelineError(format(shortfalls, actual)),
          shortfalls_(std::move(shortfalls)),
          actual_(actual) {}

    const std::vector<HistoryShortfall>& shortfalls() const { return shortfalls_; }
    size_t actual() const { return actual_; }

    // Required length for `indicator`, or 0 if it was not short.
    size_t required_for(const std::string& indicator) const {
        for (const auto& s : shortfalls_) {
            if (s.indicator == indicator) return s.required;
        }
        return 0;
    }

private:
    std::vector<HistoryShortfall> shortfalls_;
    size_t actual_;

    static std::string format(const std::vector<HistoryShortfall>& shortfalls,
                              size_t actual) {
        std::ostringstream ss;
        ss << "Insufficient history (" << actual << " bars):";
        for (const auto& s : shortfalls) {
            ss << " " << s.indicator << " requires " << s.required << ";";
        }
        return ss.str();
    }
};

// ---------------------------------------------------------------------------
// SplitUnderflowError — a split ratio leaves a segment empty
// ---------------------------------------------------------------------------
class SplitUnderflowError : public FeaturePipelineError {
public:
    SplitUnderflowError(double train, double validation, double test, size_t total_rows)
        : FeaturePipelineError(format(train, validation, test, total_rows)),
          total_rows_(total_rows) {}

    size_t total_rows() const { return total_rows_; }

private:
    size_t total_rows_;

    static std::string format(double train, double validation, double test,
                              size_t total_rows) {
        std::ostringstream ss;
        ss << "Split ratios (" << train << ", " << validation << ", " << test
           << ") over " << total_rows << " rows leave an empty segment";
        return ss.str();
    }
};

// ---------------------------------------------------------------------------
// SingleClassLabelsError — training labels carry only one class
// ---------------------------------------------------------------------------
class SingleClassLabelsError : public FeaturePipelineError {
public:
    SingleClassLabelsError(int label, size_t count)
        : FeaturePipelineError("Training segment contains only label " +
                               std::to_string(label) + " (" +
                               std::to_string(count) + " rows)"),
          label_(label),
          count_(count) {}

    int label() const { return label_; }
    size_t count() const { return count_; }

private:
    int label_;
    size_t count_;
};
