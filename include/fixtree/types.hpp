#pragma once

/**
 * FixTree: Fixed-point decision tree emulation
 *
 * Core type definitions shared by the quantization, reference model,
 * fixed-point and validation layers:
 * - Scalar and index types
 * - Row-major Eigen containers for raw features and integer codes
 * - Model kind tags resolved once by the adapter
 */

#include <cstdint>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace fixtree {

// ============================================================================
// Basic Types
// ============================================================================

using Float = float;                    // Features, targets and predictions
using Double = double;                  // Reference thresholds (float64 in the source library)
using Index = uint32_t;                 // Row indices
using FeatureIndex = uint16_t;          // Feature index (up to 65k features)
using NodeIndex = uint32_t;             // Node index inside one tree
using ClassIndex = uint32_t;            // Position in the class label table
using Code = uint32_t;                  // Quantized feature / threshold code

constexpr NodeIndex NO_NODE = std::numeric_limits<NodeIndex>::max();

// Widest supported feature code, so that a threshold (one extra bit) fits in Code
constexpr uint32_t MAX_BIT_WIDTH = 31;

// Largest code representable with the given number of bits
inline Code max_code(uint32_t bits) {
    return bits >= 32 ? std::numeric_limits<Code>::max()
                      : static_cast<Code>((uint64_t{1} << bits) - 1);
}

// ============================================================================
// Containers
// ============================================================================

using FeatureMatrix = Eigen::Matrix<Float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using CodeMatrix = Eigen::Matrix<Code, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// ============================================================================
// Model Tags
// ============================================================================

enum class ModelKind : uint8_t {
    SingleTree = 0,
    Ensemble = 1
};

enum class TaskType : uint8_t {
    Classification = 0,
    Regression = 1
};

enum class Aggregation : uint8_t {
    MajorityVote = 0,      // Lowest class index wins ties
    Mean = 1,
    MeanProbability = 2    // Mean of normalized leaf distributions, then argmax
};

// Split operator of the reference library: go left when x <= t (LessEqual) or x < t (Less)
enum class Comparison : uint8_t {
    LessEqual = 0,
    Less = 1
};

// Domain the reference thresholds were learned in
enum class ThresholdDomain : uint8_t {
    Raw = 0,               // Trained on continuous features
    Code = 1               // Trained on quantized codes
};

enum class RoundingPolicy : uint8_t {
    HalfUp = 0,            // floor(x + 0.5)
    Floor = 1
};

inline const char* to_string(ModelKind kind) {
    return kind == ModelKind::SingleTree ? "tree" : "ensemble";
}

inline const char* to_string(TaskType task) {
    return task == TaskType::Classification ? "classification" : "regression";
}

inline const char* to_string(Aggregation aggregation) {
    switch (aggregation) {
        case Aggregation::MajorityVote: return "majority_vote";
        case Aggregation::Mean: return "mean";
        case Aggregation::MeanProbability: return "mean_probability";
    }
    return "unknown";
}

inline const char* to_string(Comparison comparison) {
    return comparison == Comparison::LessEqual ? "le" : "lt";
}

inline const char* to_string(ThresholdDomain domain) {
    return domain == ThresholdDomain::Raw ? "raw" : "code";
}

inline const char* to_string(RoundingPolicy rounding) {
    return rounding == RoundingPolicy::HalfUp ? "half_up" : "floor";
}

// ============================================================================
// Errors
// ============================================================================

/**
 * Raised when a trained model is neither a supported single tree nor a
 * supported ensemble of trees. Nothing is built from such a model.
 */
class UnsupportedModelKind : public std::invalid_argument {
public:
    explicit UnsupportedModelKind(const std::string& what)
        : std::invalid_argument("Unsupported model kind: " + what) {}
};

} // namespace fixtree
