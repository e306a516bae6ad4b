#pragma once

/**
 * FixTree Fixed-Point Model
 *
 * Structural copy of a reference tree / ensemble that only uses integer
 * thresholds and integer comparisons, as the generated hardware does.
 *
 * Threshold domain:
 *   features are B-bit codes, thresholds are (B+1)-bit integers T with one
 *   fractional bit. A sample goes left iff (code << 1) < T. T is odd except
 *   at the clamp bounds, so a shifted code never ties with a threshold and
 *   both reference operators (x <= t, x < t) are reproduced exactly:
 *
 *     x <= t  ->  T = 2 * floor(t_code) + 1
 *     x <  t  ->  T = 2 * ceil(t_code) - 1
 *
 *   clamped to [0, 2^(B+1) - 1]. These hold for code-domain thresholds.
 *
 *   Raw-domain thresholds are placed against the reference comparator on
 *   dequantized codes instead: with c the first code whose dequantized value
 *   goes right, T = 2c - 1 (0 if c = 0, 2^(B+1) - 1 if no code goes right).
 *   Float rounding of a grid point can then never split the two variants.
 *
 * Classification ensembles aggregate by majority vote, lowest class index on
 * ties, regardless of how the reference library combines its trees.
 */

#include "types.hpp"
#include "quantization.hpp"
#include "reference_model.hpp"
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace fixtree {

// ============================================================================
// Fixed-Point Node / Tree
// ============================================================================

struct FixedPointNode {
    bool is_leaf = true;
    FeatureIndex feature = 0;
    Code threshold = 0;            // (B+1)-bit threshold
    NodeIndex left = NO_NODE;
    NodeIndex right = NO_NODE;
    ClassIndex class_index = 0;
    Float value = 0.0f;
};

class FixedPointTree {
public:
    FixedPointTree() = default;

    const FixedPointNode& node(NodeIndex idx) const { return nodes_[idx]; }
    const std::vector<FixedPointNode>& nodes() const { return nodes_; }
    NodeIndex n_nodes() const { return static_cast<NodeIndex>(nodes_.size()); }
    uint32_t depth() const { return depth_; }

    inline NodeIndex find_leaf(const Code* codes) const;

private:
    friend class FixedPointModel;

    FixedPointTree(std::vector<FixedPointNode> nodes, uint32_t depth)
        : nodes_(std::move(nodes)), depth_(depth) {}

    std::vector<FixedPointNode> nodes_;
    uint32_t depth_ = 0;
};

// Only built from a validated DecisionTree, so the walk always ends at a leaf
inline NodeIndex FixedPointTree::find_leaf(const Code* codes) const {
    NodeIndex idx = 0;
    while (!nodes_[idx].is_leaf) {
        const FixedPointNode& node = nodes_[idx];
        const uint64_t shifted = static_cast<uint64_t>(codes[node.feature]) << 1;
        idx = shifted < node.threshold ? node.left : node.right;
    }
    return idx;
}

// ============================================================================
// Routing Audit
// ============================================================================

/**
 * One internal node where the integer comparator sends a code the other way
 * from the reference comparator.
 */
struct NodeRoutingMismatch {
    size_t tree_index = 0;
    NodeIndex node = 0;
    FeatureIndex feature = 0;
    Code code = 0;
    Double reference_threshold = 0.0;
    Code fixed_threshold = 0;
    bool reference_left = false;
    bool fixed_left = false;
};

// ============================================================================
// Hardware Topology
// ============================================================================

struct HardwareNode {
    NodeIndex id = 0;
    bool is_leaf = true;
    FeatureIndex feature = 0;
    Code threshold = 0;
    NodeIndex left = NO_NODE;
    NodeIndex right = NO_NODE;
    ClassIndex class_index = 0;
    Float value = 0.0f;
};

struct HardwareTree {
    std::vector<HardwareNode> nodes;   // node-id order, root at 0
};

/**
 * Everything a hardware-description generator needs to emit the circuit.
 */
struct HardwareTopology {
    uint32_t feature_bits = 0;
    uint32_t threshold_bits = 0;
    ModelKind kind = ModelKind::SingleTree;
    TaskType task = TaskType::Classification;
    Aggregation aggregation = Aggregation::MajorityVote;
    FeatureIndex n_features = 0;
    uint32_t n_classes = 0;
    std::vector<Float> classes;
    std::vector<HardwareTree> trees;
};

// ============================================================================
// Fixed-Point Model
// ============================================================================

class FixedPointModel {
public:
    FixedPointModel() = default;

    /**
     * Build from a model trained on quantized codes (threshold domain Code).
     * @throws std::invalid_argument for a raw-domain model or a bad bit width
     */
    static FixedPointModel build(const ReferenceModel& reference, uint32_t feature_bit_width);

    /**
     * Build from a raw-domain or code-domain model. Raw thresholds are placed
     * where the reference, fed the profile's dequantized codes, changes side.
     */
    static FixedPointModel build(const ReferenceModel& reference, const QuantizationProfile& profile);

    /**
     * Integer threshold for a threshold already expressed on the code axis.
     */
    static Code requantize_threshold(Double t_code, Comparison comparison, uint32_t feature_bits);

    // Prediction on one row of B-bit codes
    Float predict(const Code* codes) const;

    std::vector<Float> predict_batch(const CodeMatrix& codes, int n_threads = 1) const;

    /**
     * Compare the reference comparator against the integer comparator at the
     * codes bracketing every split threshold. Empty when routing is identical.
     */
    std::vector<NodeRoutingMismatch> audit(const ReferenceModel& reference,
                                           const QuantizationProfile& profile) const;

    HardwareTopology topology() const;

    // Human-readable parameter dump (fixed_point_parameters.txt)
    void describe(std::ostream& out) const;
    void save_description(const std::string& path) const;

    // Accessors
    ModelKind kind() const { return kind_; }
    TaskType task() const { return task_; }
    Aggregation aggregation() const { return aggregation_; }
    uint32_t feature_bits() const { return feature_bits_; }
    uint32_t threshold_bits() const { return feature_bits_ + 1; }
    FeatureIndex n_features() const { return n_features_; }
    uint32_t n_classes() const { return static_cast<uint32_t>(classes_.size()); }
    const std::vector<Float>& classes() const { return classes_; }
    size_t n_trees() const { return trees_.size(); }
    const FixedPointTree& tree(size_t idx) const { return trees_[idx]; }

private:
    static FixedPointModel build_impl(const ReferenceModel& reference, uint32_t feature_bits,
                                      const QuantizationProfile* profile);

    ModelKind kind_ = ModelKind::SingleTree;
    TaskType task_ = TaskType::Classification;
    Aggregation aggregation_ = Aggregation::MajorityVote;
    uint32_t feature_bits_ = 0;
    FeatureIndex n_features_ = 0;
    std::vector<Float> classes_;
    std::vector<FixedPointTree> trees_;
};

} // namespace fixtree
