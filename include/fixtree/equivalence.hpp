#pragma once

/**
 * FixTree Equivalence Validation
 *
 * Compares named prediction variants (floating reference, reference on
 * quantized inputs, fixed-point) against the ground truth and against each
 * other. Disagreements are recorded, never fatal.
 */

#include "types.hpp"
#include "config.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace fixtree {

// Canonical variant names used by the pipeline
constexpr const char* VARIANT_REFERENCE = "reference";
constexpr const char* VARIANT_REFERENCE_QUANTIZED = "reference_quantized";
constexpr const char* VARIANT_FIXED_POINT = "fixed_point";

struct PredictionSet {
    std::string name;
    std::vector<Float> values;
};

/**
 * A sample on which at least two variants disagree.
 * predictions[v] belongs to variant_names()[v].
 */
struct Disagreement {
    size_t sample = 0;
    Float ground_truth = 0.0f;
    std::vector<Float> predictions;
};

// ============================================================================
// Comparison Report
// ============================================================================

class ComparisonReport {
public:
    size_t n_samples() const { return n_samples_; }
    const std::vector<std::string>& variant_names() const { return names_; }

    // Samples where the variant differs from the ground truth
    size_t mismatch_count(const std::string& variant) const;
    size_t matches(const std::string& variant) const { return n_samples_ - mismatch_count(variant); }

    // Samples where two variants differ from each other
    size_t pair_disagreements(const std::string& a, const std::string& b) const;

    const std::vector<Disagreement>& disagreements() const { return disagreements_; }
    bool all_agree() const { return disagreements_.empty(); }

    /**
     * Acceptance criterion: the two variants never disagree.
     */
    bool acceptable(const std::string& a, const std::string& b) const {
        return pair_disagreements(a, b) == 0;
    }

    // Per-sample "Difference between versions!" blocks
    void write_details(std::ostream& out) const;
    void write_details(const std::string& path) const;

    void write_summary(std::ostream& out) const;

private:
    friend class EquivalenceValidator;

    size_t variant_index(const std::string& name) const;

    size_t n_samples_ = 0;
    std::vector<std::string> names_;
    std::vector<size_t> mismatches_;
    std::vector<std::vector<size_t>> pair_counts_;   // [a][b], symmetric
    std::vector<Disagreement> disagreements_;
};

// ============================================================================
// Validator
// ============================================================================

class EquivalenceValidator {
public:
    EquivalenceValidator() = default;
    explicit EquivalenceValidator(const ValidationConfig& config) : config_(config) {}

    /**
     * @throws std::invalid_argument when a variant's length differs from the
     *         ground truth, or when two variants share a name
     */
    ComparisonReport compare(const std::vector<Float>& ground_truth,
                             const std::vector<PredictionSet>& variants) const;

    // Equal within the configured tolerance (exact when tolerance is 0)
    bool same(Float a, Float b) const;

    const ValidationConfig& config() const { return config_; }

private:
    ValidationConfig config_;
};

} // namespace fixtree
