#pragma once

#include "features/feature_table.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ConfusionMatrix — rows are true labels, columns predicted (down, up)
// ---------------------------------------------------------------------------
struct ConfusionMatrix {
    size_t true_down = 0;   // true down, predicted down
    size_t false_up = 0;    // true down, predicted up
    size_t false_down = 0;  // true up, predicted down
    size_t true_up = 0;     // true up, predicted up

    size_t total() const { return true_down + false_up + false_down + true_up; }

    // [[true_down, false_up], [false_down, true_up]]
    std::vector<std::vector<size_t>> rows() const {
        return {{true_down, false_up}, {false_down, true_up}};
    }
};

struct PrecisionRecallF1 {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
};

// ---------------------------------------------------------------------------
// RocCurve — one point per distinct score, highest threshold first
//
// The first point is (0, 0) at threshold +inf; the last is (1, 1).
// ---------------------------------------------------------------------------
struct RocCurve {
    double auc = 0.0;
    std::vector<double> fpr;
    std::vector<double> tpr;
    std::vector<double> thresholds;
};

struct ClassificationMetrics {
    double accuracy = 0.0;
    double precision = 0.0;   // support-weighted over both classes
    double recall = 0.0;
    double f1 = 0.0;
    ConfusionMatrix confusion;
    std::optional<RocCurve> roc;   // present when scores were supplied
};

// ---------------------------------------------------------------------------
// ClassificationMetricsCalculator — held-out evaluation of a binary classifier
//
// Labels and predictions use LABEL_DOWN / LABEL_UP. Scores are the
// classifier's probability of LABEL_UP. Per-class ratios with an empty
// denominator count as 0.
// ---------------------------------------------------------------------------
class ClassificationMetricsCalculator {
public:
    static double accuracy(const std::vector<int>& y_true, const std::vector<int>& y_pred) {
        auto cm = confusion_matrix(y_true, y_pred);
        return static_cast<double>(cm.true_down + cm.true_up) /
               static_cast<double>(cm.total());
    }

    static ConfusionMatrix confusion_matrix(const std::vector<int>& y_true,
                                            const std::vector<int>& y_pred) {
        check_lengths(y_true.size(), y_pred.size(), "predictions");
        ConfusionMatrix cm;
        for (size_t i = 0; i < y_true.size(); ++i) {
            bool actual_up = is_up(y_true[i]);
            bool predicted_up = is_up(y_pred[i]);
            if (actual_up) {
                (predicted_up ? cm.true_up : cm.false_down)++;
            } else {
                (predicted_up ? cm.false_up : cm.true_down)++;
            }
        }
        return cm;
    }

    // Per-class precision, recall and F1 averaged with weights support / n.
    static PrecisionRecallF1 precision_recall_f1(const std::vector<int>& y_true,
                                                 const std::vector<int>& y_pred) {
        auto cm = confusion_matrix(y_true, y_pred);
        double n = static_cast<double>(cm.total());

        auto per_class = [](size_t hits, size_t predicted, size_t support) {
            PrecisionRecallF1 r;
            r.precision = ratio(hits, predicted);
            r.recall = ratio(hits, support);
            double denom = r.precision + r.recall;
            r.f1 = denom > 0.0 ? 2.0 * r.precision * r.recall / denom : 0.0;
            return r;
        };
        size_t support_down = cm.true_down + cm.false_up;
        size_t support_up = cm.false_down + cm.true_up;
        auto down = per_class(cm.true_down, cm.true_down + cm.false_down, support_down);
        auto up = per_class(cm.true_up, cm.true_up + cm.false_up, support_up);

        double w_down = static_cast<double>(support_down) / n;
        double w_up = static_cast<double>(support_up) / n;
        return {w_down * down.precision + w_up * up.precision,
                w_down * down.recall + w_up * up.recall,
                w_down * down.f1 + w_up * up.f1};
    }

    // Throws std::invalid_argument unless both classes are present.
    static RocCurve roc(const std::vector<int>& y_true, const std::vector<double>& scores) {
        check_lengths(y_true.size(), scores.size(), "scores");
        size_t positives = 0;
        for (size_t i = 0; i < y_true.size(); ++i) {
            if (!std::isfinite(scores[i])) {
                throw std::invalid_argument("score at row " + std::to_string(i) +
                                            " is not finite");
            }
            if (is_up(y_true[i])) ++positives;
        }
        size_t negatives = y_true.size() - positives;
        if (positives == 0 || negatives == 0) {
            throw std::invalid_argument("ROC needs both labels present in y_true");
        }

        std::vector<size_t> order(scores.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&](size_t a, size_t b) { return scores[a] > scores[b]; });

        RocCurve curve;
        curve.fpr.push_back(0.0);
        curve.tpr.push_back(0.0);
        curve.thresholds.push_back(std::numeric_limits<double>::infinity());

        size_t tp = 0, fp = 0;
        for (size_t k = 0; k < order.size(); ++k) {
            size_t i = order[k];
            (is_up(y_true[i]) ? tp : fp)++;
            // Tied scores form a single point.
            if (k + 1 < order.size() && scores[order[k + 1]] == scores[i]) continue;
            curve.fpr.push_back(ratio(fp, negatives));
            curve.tpr.push_back(ratio(tp, positives));
            curve.thresholds.push_back(scores[i]);
        }

        for (size_t k = 1; k < curve.fpr.size(); ++k) {
            curve.auc += (curve.fpr[k] - curve.fpr[k - 1]) *
                         (curve.tpr[k] + curve.tpr[k - 1]) / 2.0;
        }
        return curve;
    }

    static ClassificationMetrics compute_all(
        const std::vector<int>& y_true, const std::vector<int>& y_pred,
        const std::optional<std::vector<double>>& scores = std::nullopt) {
        ClassificationMetrics m;
        m.confusion = confusion_matrix(y_true, y_pred);
        m.accuracy = accuracy(y_true, y_pred);
        auto prf = precision_recall_f1(y_true, y_pred);
        m.precision = prf.precision;
        m.recall = prf.recall;
        m.f1 = prf.f1;
        if (scores) m.roc = roc(y_true, *scores);
        return m;
    }

private:
    static bool is_up(int label) {
        if (label != LABEL_DOWN && label != LABEL_UP) {
            throw std::invalid_argument("label values must be 0 or 1, got " +
                                        std::to_string(label));
        }
        return label == LABEL_UP;
    }

    static double ratio(size_t num, size_t den) {
        return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
    }

    static void check_lengths(size_t n_true, size_t n_other, const char* what) {
        if (n_true == 0) throw std::invalid_argument("no labels to evaluate");
        if (n_true != n_other) {
            throw std::invalid_argument(std::string(what) + " have " + std::to_string(n_other) +
                                        " rows, labels have " + std::to_string(n_true));
        }
    }
};
