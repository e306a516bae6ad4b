#pragma once

/**
 * FixTree: Performance Metrics
 *
 * Scores each prediction variant against the ground truth:
 * - Classification: accuracy, support-weighted precision / recall / F1,
 *   row-normalised confusion matrix in percent
 * - Regression: MAE, MSE, RMSE, R2, explained variance
 *
 * Class labels are compared exactly; every label seen in either y_true or
 * y_pred is a class.
 */

#include "types.hpp"
#include <vector>
#include <algorithm>
#include <cmath>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace fixtree {

// ============================================================================
// Metric Types
// ============================================================================

enum class MetricType : uint8_t {
    Accuracy = 0,
    Precision = 1,
    Recall = 2,
    F1 = 3,
    MAE = 4,
    MSE = 5,
    RMSE = 6,
    R2 = 7,
    ExplainedVariance = 8
};

// ============================================================================
// Score Sets
// ============================================================================

struct ClassificationScores {
    Float accuracy = 0.0f;
    Float precision = 0.0f;     // Support-weighted
    Float recall = 0.0f;        // Support-weighted
    Float f1 = 0.0f;            // Support-weighted
    std::vector<Float> labels;
    std::vector<std::vector<Double>> confusion_percent;  // [true label][predicted label]
};

struct RegressionScores {
    Float mae = 0.0f;
    Float mse = 0.0f;
    Float rmse = 0.0f;
    Float r2 = 0.0f;
    Float explained_variance = 0.0f;
};

// ============================================================================
// Metrics Class
// ============================================================================

class Metrics {
public:
    // ========================================================================
    // Classification Metrics
    // ========================================================================

    static Float accuracy(
        const Float* y_true,
        const Float* y_pred,
        Index n_samples
    );

    static Float accuracy(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    ) {
        check_sizes(y_true, y_pred);
        return accuracy(y_true.data(), y_pred.data(), static_cast<Index>(y_true.size()));
    }

    /**
     * Sorted union of the labels in y_true and y_pred
     */
    static std::vector<Float> class_labels(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    static Float precision_weighted(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    static Float recall_weighted(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    static Float f1_weighted(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    /**
     * Confusion matrix over class_labels(), each row normalised to percent of
     * that true label's support. Rows of labels never seen in y_true are zero.
     */
    static std::vector<std::vector<Double>> confusion_matrix_percent(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    static ClassificationScores classification_scores(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    // ========================================================================
    // Regression Metrics
    // ========================================================================

    /**
     * Mean Squared Error
     */
    static Float mse(
        const Float* y_true,
        const Float* y_pred,
        Index n_samples
    );

    static Float mse(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    ) {
        check_sizes(y_true, y_pred);
        return mse(y_true.data(), y_pred.data(), static_cast<Index>(y_true.size()));
    }

    static Float rmse(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    ) {
        return std::sqrt(mse(y_true, y_pred));
    }

    /**
     * Mean Absolute Error
     */
    static Float mae(
        const Float* y_true,
        const Float* y_pred,
        Index n_samples
    );

    static Float mae(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    ) {
        check_sizes(y_true, y_pred);
        return mae(y_true.data(), y_pred.data(), static_cast<Index>(y_true.size()));
    }

    /**
     * R-squared (coefficient of determination). A constant y_true scores 1
     * when predicted exactly, else 0.
     */
    static Float r2_score(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    static Float explained_variance(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    static RegressionScores regression_scores(
        const std::vector<Float>& y_true,
        const std::vector<Float>& y_pred
    );

    // ========================================================================
    // Reports (appended to score.txt)
    // ========================================================================

    static void write_classification_report(std::ostream& out, const std::string& variant,
                                            const ClassificationScores& scores);

    static void write_regression_report(std::ostream& out, const std::string& variant,
                                        const RegressionScores& scores);

    // Key a metric is written under in score.txt
    static const char* metric_name(MetricType metric);

private:
    static void check_sizes(const std::vector<Float>& y_true, const std::vector<Float>& y_pred) {
        if (y_true.size() != y_pred.size()) {
            throw std::invalid_argument("y_true and y_pred must have same size");
        }
    }
};

// ============================================================================
// Inline Implementations
// ============================================================================

inline Float Metrics::accuracy(
    const Float* y_true,
    const Float* y_pred,
    Index n_samples
) {
    if (n_samples == 0) return 0.0f;
    Index correct = 0;
    for (Index i = 0; i < n_samples; ++i) {
        if (y_true[i] == y_pred[i]) correct++;
    }
    return static_cast<Float>(correct) / n_samples;
}

inline Float Metrics::mse(
    const Float* y_true,
    const Float* y_pred,
    Index n_samples
) {
    if (n_samples == 0) return 0.0f;
    Double sum = 0.0;
    for (Index i = 0; i < n_samples; ++i) {
        Double diff = static_cast<Double>(y_true[i]) - y_pred[i];
        sum += diff * diff;
    }
    return static_cast<Float>(sum / n_samples);
}

inline Float Metrics::mae(
    const Float* y_true,
    const Float* y_pred,
    Index n_samples
) {
    if (n_samples == 0) return 0.0f;
    Double sum = 0.0;
    for (Index i = 0; i < n_samples; ++i) {
        sum += std::abs(static_cast<Double>(y_true[i]) - y_pred[i]);
    }
    return static_cast<Float>(sum / n_samples);
}

inline const char* Metrics::metric_name(MetricType metric) {
    switch (metric) {
        case MetricType::Accuracy: return "accuracy";
        case MetricType::Precision: return "precision";
        case MetricType::Recall: return "recall";
        case MetricType::F1: return "f1";
        case MetricType::MAE: return "mae";
        case MetricType::MSE: return "mse";
        case MetricType::RMSE: return "rmse";
        case MetricType::R2: return "r2";
        case MetricType::ExplainedVariance: return "explained_variance";
        default: return "unknown";
    }
}

} // namespace fixtree
