#pragma once

/**
 * FixTree Reference Model
 *
 * Uniform read-only view of an externally trained floating-point model:
 * - DecisionTree: flat node array, root at index 0
 * - ReferenceModel: one tree or an ensemble, plus its aggregation rule
 * - ReferenceModelAdapter: builds the view from a ModelDump and rejects
 *   anything that is not a supported tree or tree ensemble
 *
 * The model kind is resolved once by the adapter. Downstream code only uses
 * the traversal interface below.
 */

#include "types.hpp"
#include "model_dump.hpp"
#include <string>
#include <vector>

namespace fixtree {

// ============================================================================
// Decision Node
// ============================================================================

struct DecisionNode {
    bool is_leaf = true;

    // Internal nodes
    FeatureIndex feature = 0;
    Double threshold = 0.0;
    NodeIndex left = NO_NODE;
    NodeIndex right = NO_NODE;

    // Leaves
    ClassIndex class_index = 0;          // Classification: argmax of distribution
    Float value = 0.0f;                  // Regression: predicted target
    std::vector<Float> distribution;     // Classification: per-class weight
};

// ============================================================================
// Decision Tree
// ============================================================================

class DecisionTree {
public:
    DecisionTree() = default;
    explicit DecisionTree(std::vector<DecisionNode> nodes);

    NodeIndex root() const { return 0; }
    const DecisionNode& node(NodeIndex idx) const { return nodes_[idx]; }
    const std::vector<DecisionNode>& nodes() const { return nodes_; }

    NodeIndex n_nodes() const { return static_cast<NodeIndex>(nodes_.size()); }
    NodeIndex n_leaves() const { return n_leaves_; }
    uint32_t depth() const { return depth_; }

    /**
     * Leaf reached by a sample when splits are evaluated with `comparison`
     */
    NodeIndex find_leaf(const Float* features, Comparison comparison) const;

private:
    std::vector<DecisionNode> nodes_;
    NodeIndex n_leaves_ = 0;
    uint32_t depth_ = 0;
};

// ============================================================================
// Reference Model
// ============================================================================

class ReferenceModel {
public:
    ReferenceModel() = default;

    ModelKind kind() const { return kind_; }
    TaskType task() const { return task_; }
    Aggregation aggregation() const { return aggregation_; }
    Comparison comparison() const { return comparison_; }
    ThresholdDomain threshold_domain() const { return threshold_domain_; }
    const std::string& model_type() const { return model_type_; }

    FeatureIndex n_features() const { return n_features_; }
    uint32_t n_classes() const { return static_cast<uint32_t>(classes_.size()); }
    const std::vector<Float>& classes() const { return classes_; }
    Float class_label(ClassIndex idx) const { return classes_[idx]; }

    size_t n_trees() const { return trees_.size(); }
    const DecisionTree& tree(size_t idx) const { return trees_[idx]; }
    const std::vector<DecisionTree>& trees() const { return trees_; }
    uint32_t max_depth() const;

    /**
     * Prediction for one row of raw (or, for code-domain models, code-valued)
     * features: class label for classifiers, target value for regressors.
     * Classifiers average the trees' normalized leaf distributions, as the
     * library's own predict does; regressors average the leaf values.
     */
    Float predict(const Float* features) const;

    std::vector<Float> predict_batch(const FeatureMatrix& features, int n_threads = 1) const;

private:
    friend class ReferenceModelAdapter;

    ModelKind kind_ = ModelKind::SingleTree;
    TaskType task_ = TaskType::Classification;
    Aggregation aggregation_ = Aggregation::MeanProbability;
    Comparison comparison_ = Comparison::LessEqual;
    ThresholdDomain threshold_domain_ = ThresholdDomain::Raw;
    std::string model_type_;
    FeatureIndex n_features_ = 0;
    std::vector<Float> classes_;
    std::vector<DecisionTree> trees_;
};

// ============================================================================
// Adapter
// ============================================================================

class ReferenceModelAdapter {
public:
    /**
     * Build the traversal view.
     * @throws UnsupportedModelKind for an unknown model type, a single-tree type
     *         with more or fewer than one estimator, or an empty ensemble
     * @throws std::invalid_argument for a malformed tree (bad child index,
     *         shared child, cycle, unreachable node, bad feature, bad value width)
     */
    static ReferenceModel adapt(const ModelDump& dump);

    static bool is_supported(const std::string& model_type);

private:
    static DecisionTree adapt_tree(const TreeDump& tree, size_t tree_idx, TaskType task,
                                   FeatureIndex n_features, uint32_t n_classes);
};

} // namespace fixtree
