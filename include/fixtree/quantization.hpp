#pragma once

/**
 * FixTree Quantization
 *
 * Per-feature affine mapping from continuous values to fixed-width codes:
 *
 *   code = round((v - min) / (max - min) * (2^B - 1)),  clamped to [0, 2^B - 1]
 *
 * min/max come from the training partition only. The same profile is applied
 * to the test partition, where out-of-range values saturate. A feature with
 * min == max is degenerate and always maps to code 0.
 */

#include "types.hpp"
#include "config.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace fixtree {

// ============================================================================
// Feature Range
// ============================================================================

struct FeatureRange {
    Float min_value = 0.0f;
    Float max_value = 0.0f;

    bool is_degenerate() const { return !(max_value > min_value); }
};

// ============================================================================
// Quantization Profile (immutable after construction)
// ============================================================================

class QuantizationProfile {
public:
    QuantizationProfile() = default;
    QuantizationProfile(std::vector<FeatureRange> ranges, uint32_t bit_width,
                        RoundingPolicy rounding = RoundingPolicy::HalfUp);

    uint32_t bit_width() const { return bit_width_; }
    uint32_t threshold_bits() const { return bit_width_ + 1; }
    Code max_code() const { return fixtree::max_code(bit_width_); }
    Code max_threshold() const { return fixtree::max_code(bit_width_ + 1); }
    RoundingPolicy rounding() const { return rounding_; }

    FeatureIndex n_features() const { return static_cast<FeatureIndex>(ranges_.size()); }
    const std::vector<FeatureRange>& ranges() const { return ranges_; }
    const FeatureRange& range(FeatureIndex f) const { return ranges_[f]; }
    bool is_degenerate(FeatureIndex f) const { return ranges_[f].is_degenerate(); }

    /**
     * Codes per raw unit; 0 for a degenerate feature.
     */
    Double scale(FeatureIndex f) const;

    /**
     * Unrounded, unclamped position of a raw value on the code axis.
     * Used to carry raw-domain thresholds into the integer domain.
     */
    Double to_code_domain(FeatureIndex f, Double value) const;

    /**
     * Map one raw value to its code. Sets *clamped when the value fell
     * outside [min, max] and was saturated.
     */
    Code quantize(FeatureIndex f, Float value, bool* clamped = nullptr) const;

    /**
     * Raw value represented by a code (min for a degenerate feature).
     */
    Float dequantize(FeatureIndex f, Code code) const;

    // Persistence (line-oriented key:value text)
    void save(std::ostream& out) const;
    void save(const std::string& path) const;
    static QuantizationProfile load(std::istream& in);
    static QuantizationProfile load(const std::string& path);

    bool operator==(const QuantizationProfile& other) const;

private:
    std::vector<FeatureRange> ranges_;
    uint32_t bit_width_ = 8;
    RoundingPolicy rounding_ = RoundingPolicy::HalfUp;
};

// ============================================================================
// Quantization Statistics
// ============================================================================

struct QuantizationStats {
    std::vector<FeatureIndex> degenerate_features;  // min == max in training data
    std::vector<Index> overflow_counts;             // Clamped values per feature

    Index total_overflows() const {
        Index total = 0;
        for (Index c : overflow_counts) total += c;
        return total;
    }
};

struct QuantizationResult {
    CodeMatrix train;
    CodeMatrix test;
    QuantizationProfile profile;
    QuantizationStats train_stats;
    QuantizationStats test_stats;
};

// ============================================================================
// Quantization Engine
// ============================================================================

class QuantizationEngine {
public:
    QuantizationEngine() = default;
    explicit QuantizationEngine(const Config& config);

    /**
     * Learn per-feature min/max from the training partition.
     * Throws std::invalid_argument on an empty matrix or NaN values.
     */
    QuantizationProfile fit(const FeatureMatrix& train) const;

    /**
     * Apply a profile. Out-of-range values saturate and are counted in stats.
     */
    CodeMatrix transform(const FeatureMatrix& features,
                         const QuantizationProfile& profile,
                         QuantizationStats* stats = nullptr) const;

    QuantizationResult fit_and_transform(const FeatureMatrix& train,
                                         const FeatureMatrix& test) const;

    QuantizationResult fit_and_transform(const FeatureMatrix& train,
                                         const FeatureMatrix& test,
                                         uint32_t bit_width) const;

    /**
     * Codes back to raw values, for evaluating a raw-domain reference model
     * on quantized inputs.
     */
    FeatureMatrix dequantize(const CodeMatrix& codes, const QuantizationProfile& profile) const;

    const QuantizationConfig& config() const { return config_; }

private:
    QuantizationConfig config_;
    int n_threads_ = 1;
    int32_t verbosity_ = 0;
};

} // namespace fixtree
