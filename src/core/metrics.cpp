/**
 * FixTree Metrics Implementation
 */

#include "fixtree/metrics.hpp"
#include <iomanip>
#include <limits>
#include <ostream>

namespace fixtree {

namespace {

struct LabelCounts {
    std::vector<Float> labels;
    std::vector<Index> support;        // true occurrences per label
    std::vector<Index> predicted;      // predicted occurrences per label
    std::vector<Index> true_positive;
};

size_t label_position(const std::vector<Float>& labels, Float label) {
    return static_cast<size_t>(std::lower_bound(labels.begin(), labels.end(), label) - labels.begin());
}

void write_metric(std::ostream& out, MetricType metric, Float value) {
    out << Metrics::metric_name(metric) << ": " << value << "\n";
}

LabelCounts count_labels(const std::vector<Float>& y_true, const std::vector<Float>& y_pred) {
    LabelCounts counts;
    counts.labels = Metrics::class_labels(y_true, y_pred);
    const size_t n_labels = counts.labels.size();
    counts.support.assign(n_labels, 0);
    counts.predicted.assign(n_labels, 0);
    counts.true_positive.assign(n_labels, 0);

    for (size_t i = 0; i < y_true.size(); ++i) {
        size_t t = label_position(counts.labels, y_true[i]);
        size_t p = label_position(counts.labels, y_pred[i]);
        counts.support[t]++;
        counts.predicted[p]++;
        if (t == p) counts.true_positive[t]++;
    }
    return counts;
}

// Per-label scores averaged with support weights
template <typename Score>
Float weighted_average(const LabelCounts& counts, Score score) {
    Double total = 0.0;
    Double weighted = 0.0;
    for (size_t l = 0; l < counts.labels.size(); ++l) {
        weighted += score(l) * counts.support[l];
        total += counts.support[l];
    }
    return total > 0.0 ? static_cast<Float>(weighted / total) : 0.0f;
}

Double label_precision(const LabelCounts& c, size_t l) {
    return c.predicted[l] > 0 ? static_cast<Double>(c.true_positive[l]) / c.predicted[l] : 0.0;
}

Double label_recall(const LabelCounts& c, size_t l) {
    return c.support[l] > 0 ? static_cast<Double>(c.true_positive[l]) / c.support[l] : 0.0;
}

Double label_f1(const LabelCounts& c, size_t l) {
    Double p = label_precision(c, l);
    Double r = label_recall(c, l);
    return p + r > 0.0 ? 2.0 * p * r / (p + r) : 0.0;
}

Double mean(const std::vector<Double>& values) {
    if (values.empty()) return 0.0;
    Double sum = 0.0;
    for (Double v : values) sum += v;
    return sum / values.size();
}

Double variance(const std::vector<Double>& values) {
    Double m = mean(values);
    Double sum = 0.0;
    for (Double v : values) sum += (v - m) * (v - m);
    return values.empty() ? 0.0 : sum / values.size();
}

// 1 - residual / total, with the constant-target convention
Float explained_ratio(Double residual, Double total) {
    if (total == 0.0) return residual == 0.0 ? 1.0f : 0.0f;
    return static_cast<Float>(1.0 - residual / total);
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

std::vector<Float> Metrics::class_labels(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    std::vector<Float> labels(y_true);
    labels.insert(labels.end(), y_pred.begin(), y_pred.end());
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
    return labels;
}

Float Metrics::precision_weighted(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    LabelCounts counts = count_labels(y_true, y_pred);
    return weighted_average(counts, [&](size_t l) { return label_precision(counts, l); });
}

Float Metrics::recall_weighted(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    LabelCounts counts = count_labels(y_true, y_pred);
    return weighted_average(counts, [&](size_t l) { return label_recall(counts, l); });
}

Float Metrics::f1_weighted(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    LabelCounts counts = count_labels(y_true, y_pred);
    return weighted_average(counts, [&](size_t l) { return label_f1(counts, l); });
}

std::vector<std::vector<Double>> Metrics::confusion_matrix_percent(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    const std::vector<Float> labels = class_labels(y_true, y_pred);
    const size_t n_labels = labels.size();

    std::vector<std::vector<Double>> matrix(n_labels, std::vector<Double>(n_labels, 0.0));
    std::vector<Index> support(n_labels, 0);
    for (size_t i = 0; i < y_true.size(); ++i) {
        size_t t = label_position(labels, y_true[i]);
        matrix[t][label_position(labels, y_pred[i])] += 1.0;
        support[t]++;
    }

    for (size_t t = 0; t < n_labels; ++t) {
        if (support[t] == 0) continue;
        for (Double& cell : matrix[t]) cell = 100.0 * cell / support[t];
    }
    return matrix;
}

ClassificationScores Metrics::classification_scores(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    LabelCounts counts = count_labels(y_true, y_pred);

    ClassificationScores scores;
    scores.accuracy = accuracy(y_true, y_pred);
    scores.precision = weighted_average(counts, [&](size_t l) { return label_precision(counts, l); });
    scores.recall = weighted_average(counts, [&](size_t l) { return label_recall(counts, l); });
    scores.f1 = weighted_average(counts, [&](size_t l) { return label_f1(counts, l); });
    scores.labels = counts.labels;
    scores.confusion_percent = confusion_matrix_percent(y_true, y_pred);
    return scores;
}

// ============================================================================
// Regression
// ============================================================================

Float Metrics::r2_score(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    if (y_true.empty()) return 0.0f;

    Double y_mean = 0.0;
    for (Float y : y_true) y_mean += y;
    y_mean /= y_true.size();

    Double ss_res = 0.0;
    Double ss_tot = 0.0;
    for (size_t i = 0; i < y_true.size(); ++i) {
        Double res = static_cast<Double>(y_true[i]) - y_pred[i];
        Double dev = static_cast<Double>(y_true[i]) - y_mean;
        ss_res += res * res;
        ss_tot += dev * dev;
    }
    return explained_ratio(ss_res, ss_tot);
}

Float Metrics::explained_variance(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    check_sizes(y_true, y_pred);
    if (y_true.empty()) return 0.0f;

    std::vector<Double> truth(y_true.begin(), y_true.end());
    std::vector<Double> residual(y_true.size());
    for (size_t i = 0; i < y_true.size(); ++i) {
        residual[i] = static_cast<Double>(y_true[i]) - y_pred[i];
    }
    return explained_ratio(variance(residual), variance(truth));
}

RegressionScores Metrics::regression_scores(
    const std::vector<Float>& y_true,
    const std::vector<Float>& y_pred
) {
    RegressionScores scores;
    scores.mae = mae(y_true, y_pred);
    scores.mse = mse(y_true, y_pred);
    scores.rmse = std::sqrt(scores.mse);
    scores.r2 = r2_score(y_true, y_pred);
    scores.explained_variance = explained_variance(y_true, y_pred);
    return scores;
}

// ============================================================================
// Reports
// ============================================================================

void Metrics::write_classification_report(std::ostream& out, const std::string& variant,
                                          const ClassificationScores& scores) {
    out << std::setprecision(6);
    out << "variant: " << variant << "\n";
    write_metric(out, MetricType::Accuracy, scores.accuracy);
    write_metric(out, MetricType::Precision, scores.precision);
    write_metric(out, MetricType::Recall, scores.recall);
    write_metric(out, MetricType::F1, scores.f1);
    out << "confusion_matrix_percent:\n";
    for (size_t t = 0; t < scores.labels.size(); ++t) {
        out << "  " << scores.labels[t] << ":";
        for (Double cell : scores.confusion_percent[t]) out << " " << cell;
        out << "\n";
    }
    out << "\n";
}

void Metrics::write_regression_report(std::ostream& out, const std::string& variant,
                                      const RegressionScores& scores) {
    out << std::setprecision(6);
    out << "variant: " << variant << "\n";
    write_metric(out, MetricType::MAE, scores.mae);
    write_metric(out, MetricType::MSE, scores.mse);
    write_metric(out, MetricType::RMSE, scores.rmse);
    write_metric(out, MetricType::R2, scores.r2);
    write_metric(out, MetricType::ExplainedVariance, scores.explained_variance);
    out << "\n";
}

} // namespace fixtree
