#pragma once

/**
 * FixTree Dataset
 *
 * Aligned train/test partitions as handed over by the dataset provider:
 * - Row-major feature matrices (Eigen)
 * - One target per row
 * - Same number of columns in both partitions
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace fixtree {

// ============================================================================
// Labeled Partition
// ============================================================================

struct LabeledData {
    FeatureMatrix features;
    std::vector<Float> targets;

    Index n_samples() const { return static_cast<Index>(features.rows()); }
    FeatureIndex n_features() const { return static_cast<FeatureIndex>(features.cols()); }

    /**
     * Read a CSV file: numeric columns, target in the last column.
     * Lines starting with '#' and empty lines are skipped. With has_header the
     * first non-comment line is dropped.
     */
    static LabeledData from_csv(const std::string& path, bool has_header = false);
};

// ============================================================================
// Dataset Class
// ============================================================================

class Dataset {
public:
    Dataset() = default;
    Dataset(LabeledData train, LabeledData test);

    /**
     * Create dataset from dense row-major buffers
     * @param train Pointer to [n_train x n_features] training features
     * @param train_labels n_train training targets
     * @param test Pointer to [n_test x n_features] test features
     * @param test_labels n_test test targets
     */
    void from_dense(
        const Float* train, const Float* train_labels, Index n_train,
        const Float* test, const Float* test_labels, Index n_test,
        FeatureIndex n_features
    );

    static Dataset from_csv(const std::string& train_path, const std::string& test_path,
                            bool has_header = false);

    /**
     * Check the provider contract: same column count across partitions,
     * same row count between features and targets, non-empty training part.
     */
    void validate() const;

    const LabeledData& train() const { return train_; }
    const LabeledData& test() const { return test_; }
    const FeatureMatrix& train_features() const { return train_.features; }
    const FeatureMatrix& test_features() const { return test_.features; }
    const std::vector<Float>& train_targets() const { return train_.targets; }
    const std::vector<Float>& test_targets() const { return test_.targets; }

    FeatureIndex n_features() const { return train_.n_features(); }

private:
    LabeledData train_;
    LabeledData test_;
};

} // namespace fixtree
