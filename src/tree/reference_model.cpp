/**
 * FixTree Reference Model Implementation
 */

#include "fixtree/reference_model.hpp"
#include "fixtree/aggregation.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fixtree {

namespace {

struct SupportedModel {
    const char* name;
    ModelKind kind;
    TaskType task;
};

// Estimator types whose structure is a plain axis-aligned binary tree
const SupportedModel SUPPORTED_MODELS[] = {
    {"DecisionTreeClassifier", ModelKind::SingleTree, TaskType::Classification},
    {"DecisionTreeRegressor",  ModelKind::SingleTree, TaskType::Regression},
    {"ExtraTreeClassifier",    ModelKind::SingleTree, TaskType::Classification},
    {"ExtraTreeRegressor",     ModelKind::SingleTree, TaskType::Regression},
    {"RandomForestClassifier", ModelKind::Ensemble,   TaskType::Classification},
    {"RandomForestRegressor",  ModelKind::Ensemble,   TaskType::Regression},
    {"ExtraTreesClassifier",   ModelKind::Ensemble,   TaskType::Classification},
    {"ExtraTreesRegressor",    ModelKind::Ensemble,   TaskType::Regression},
    {"BaggingClassifier",      ModelKind::Ensemble,   TaskType::Classification},
    {"BaggingRegressor",       ModelKind::Ensemble,   TaskType::Regression},
};

const SupportedModel* find_model(const std::string& name) {
    for (const auto& m : SUPPORTED_MODELS) {
        if (name == m.name) return &m;
    }
    return nullptr;
}

std::string node_context(size_t tree_idx, size_t node_idx) {
    return "tree " + std::to_string(tree_idx) + ", node " + std::to_string(node_idx);
}

} // namespace

// ============================================================================
// DecisionTree
// ============================================================================

DecisionTree::DecisionTree(std::vector<DecisionNode> nodes) : nodes_(std::move(nodes)) {
    if (nodes_.empty()) {
        throw std::invalid_argument("decision tree needs at least one node");
    }
    const size_t n = nodes_.size();

    // Every node except the root has exactly one parent
    std::vector<uint8_t> has_parent(n, 0);
    for (size_t i = 0; i < n; ++i) {
        const DecisionNode& node = nodes_[i];
        if (node.is_leaf) continue;
        for (NodeIndex child : {node.left, node.right}) {
            if (child >= n) {
                throw std::invalid_argument("node " + std::to_string(i) + ": child index out of range");
            }
            if (child == 0) {
                throw std::invalid_argument("node " + std::to_string(i) + ": root used as a child");
            }
            if (has_parent[child]) {
                throw std::invalid_argument("node " + std::to_string(child) + " has more than one parent");
            }
            has_parent[child] = 1;
        }
    }

    // Walk from the root; with single parents this visits each node once
    std::vector<std::pair<NodeIndex, uint32_t>> stack;
    stack.emplace_back(0, 0);
    size_t visited = 0;
    while (!stack.empty()) {
        auto [idx, level] = stack.back();
        stack.pop_back();
        ++visited;
        depth_ = std::max(depth_, level);

        const DecisionNode& node = nodes_[idx];
        if (node.is_leaf) {
            ++n_leaves_;
        } else {
            stack.emplace_back(node.left, level + 1);
            stack.emplace_back(node.right, level + 1);
        }
    }
    if (visited != n) {
        throw std::invalid_argument("decision tree has " + std::to_string(n - visited) +
                                    " node(s) unreachable from the root");
    }
}

NodeIndex DecisionTree::find_leaf(const Float* features, Comparison comparison) const {
    if (nodes_.empty()) {
        throw std::logic_error("find_leaf on an empty tree");
    }

    NodeIndex node_idx = 0;
    while (!nodes_[node_idx].is_leaf) {
        const DecisionNode& node = nodes_[node_idx];
        const Double x = features[node.feature];
        const bool go_left = comparison == Comparison::LessEqual
            ? x <= node.threshold
            : x < node.threshold;
        node_idx = go_left ? node.left : node.right;
    }
    return node_idx;
}

// ============================================================================
// ReferenceModel
// ============================================================================

uint32_t ReferenceModel::max_depth() const {
    uint32_t depth = 0;
    for (const auto& tree : trees_) depth = std::max(depth, tree.depth());
    return depth;
}

Float ReferenceModel::predict(const Float* features) const {
    if (trees_.empty()) {
        throw std::logic_error("reference model has no trees");
    }

    if (task_ == TaskType::Classification) {
        std::vector<Double> proba(n_classes(), 0.0);
        for (const auto& tree : trees_) {
            accumulate_probability(tree.node(tree.find_leaf(features, comparison_)).distribution, proba);
        }
        return classes_[mean_probability_vote(proba, trees_.size())];
    }

    std::vector<Float> outputs;
    outputs.reserve(trees_.size());
    for (const auto& tree : trees_) {
        outputs.push_back(tree.node(tree.find_leaf(features, comparison_)).value);
    }
    return mean_value(outputs.data(), outputs.size());
}

std::vector<Float> ReferenceModel::predict_batch(const FeatureMatrix& features, int n_threads) const {
    if (features.cols() != n_features_) {
        throw std::invalid_argument("expected " + std::to_string(n_features_) +
                                    " features, got " + std::to_string(features.cols()));
    }

    const int64_t n_samples = features.rows();
    std::vector<Float> output(static_cast<size_t>(n_samples));
    const int num_threads = n_threads > 0 ? n_threads : 1;

    #pragma omp parallel for schedule(static) num_threads(num_threads)
    for (int64_t i = 0; i < n_samples; ++i) {
        output[i] = predict(features.row(i).data());
    }
    return output;
}

// ============================================================================
// ReferenceModelAdapter
// ============================================================================

bool ReferenceModelAdapter::is_supported(const std::string& model_type) {
    return find_model(model_type) != nullptr;
}

ReferenceModel ReferenceModelAdapter::adapt(const ModelDump& dump) {
    const SupportedModel* info = find_model(dump.model_type);
    if (!info) {
        throw UnsupportedModelKind("'" + dump.model_type + "' is neither a decision tree nor a tree ensemble");
    }
    if (info->kind == ModelKind::SingleTree && dump.estimators.size() != 1) {
        throw UnsupportedModelKind(dump.model_type + " with " + std::to_string(dump.estimators.size()) +
                                   " estimators (expected exactly one tree)");
    }
    if (info->kind == ModelKind::Ensemble && dump.estimators.empty()) {
        throw UnsupportedModelKind(dump.model_type + " with no member trees");
    }
    if (dump.n_features == 0) {
        throw std::invalid_argument("model declares zero features");
    }

    ReferenceModel model;
    model.kind_ = info->kind;
    model.task_ = info->task;
    model.aggregation_ = info->task == TaskType::Classification
        ? Aggregation::MeanProbability : Aggregation::Mean;
    model.comparison_ = dump.comparison;
    model.threshold_domain_ = dump.threshold_domain;
    model.model_type_ = dump.model_type;
    model.n_features_ = dump.n_features;

    uint32_t n_classes = 1;
    if (info->task == TaskType::Classification) {
        if (!dump.classes.empty()) {
            model.classes_ = dump.classes;
        } else {
            // No label table: class indices are the labels
            const auto& root_value = dump.estimators[0].value;
            size_t width = root_value.empty() ? 0 : root_value[0].size();
            if (width == 0) {
                throw std::invalid_argument("cannot infer class count: root node has no value");
            }
            for (size_t c = 0; c < width; ++c) model.classes_.push_back(static_cast<Float>(c));
        }
        n_classes = static_cast<uint32_t>(model.classes_.size());
    } else if (!dump.classes.empty()) {
        throw std::invalid_argument(dump.model_type + " is a regressor but declares class labels");
    }

    model.trees_.reserve(dump.estimators.size());
    for (size_t t = 0; t < dump.estimators.size(); ++t) {
        model.trees_.push_back(adapt_tree(dump.estimators[t], t, info->task, dump.n_features, n_classes));
    }
    return model;
}

DecisionTree ReferenceModelAdapter::adapt_tree(const TreeDump& tree, size_t tree_idx, TaskType task,
                                               FeatureIndex n_features, uint32_t n_classes) {
    const size_t n = tree.n_nodes();
    if (tree.children_right.size() != n || tree.feature.size() != n ||
        tree.threshold.size() != n || tree.value.size() != n) {
        throw std::invalid_argument("tree " + std::to_string(tree_idx) + ": node arrays differ in length");
    }

    std::vector<DecisionNode> nodes(n);
    for (size_t i = 0; i < n; ++i) {
        const int32_t left = tree.children_left[i];
        const int32_t right = tree.children_right[i];
        DecisionNode& node = nodes[i];

        if (left == -1 && right == -1) {
            node.is_leaf = true;
            const auto& value = tree.value[i];

            if (task == TaskType::Classification) {
                if (value.size() != n_classes) {
                    throw std::invalid_argument(node_context(tree_idx, i) + ": expected " +
                                                std::to_string(n_classes) + " class weights, got " +
                                                std::to_string(value.size()));
                }
                node.distribution.reserve(n_classes);
                for (Double v : value) {
                    if (!std::isfinite(v) || v < 0.0) {
                        throw std::invalid_argument(node_context(tree_idx, i) + ": invalid class weight");
                    }
                    node.distribution.push_back(static_cast<Float>(v));
                }
                node.class_index = argmax_class(node.distribution);
            } else {
                if (value.size() != 1 || !std::isfinite(value[0])) {
                    throw std::invalid_argument(node_context(tree_idx, i) +
                                                ": regression leaf needs one finite value");
                }
                node.value = static_cast<Float>(value[0]);
            }
            continue;
        }

        if (left < 0 || right < 0 || static_cast<size_t>(left) >= n || static_cast<size_t>(right) >= n) {
            throw std::invalid_argument(node_context(tree_idx, i) + ": child index out of range");
        }
        if (tree.feature[i] < 0 || tree.feature[i] >= static_cast<int32_t>(n_features)) {
            throw std::invalid_argument(node_context(tree_idx, i) + ": feature index " +
                                        std::to_string(tree.feature[i]) + " out of range");
        }
        if (!std::isfinite(tree.threshold[i])) {
            throw std::invalid_argument(node_context(tree_idx, i) + ": threshold is not finite");
        }

        node.is_leaf = false;
        node.feature = static_cast<FeatureIndex>(tree.feature[i]);
        node.threshold = tree.threshold[i];
        node.left = static_cast<NodeIndex>(left);
        node.right = static_cast<NodeIndex>(right);
    }

    try {
        return DecisionTree(std::move(nodes));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("tree " + std::to_string(tree_idx) + ": " + e.what());
    }
}

} // namespace fixtree
