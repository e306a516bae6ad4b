#pragma once

/**
 * Small hand-built models shared by the FixTree tests
 */

#include "fixtree/model_dump.hpp"
#include <vector>

namespace fixtree {
namespace test_models {

// One split on feature 0: left -> class index 0, right -> class index 1
inline ModelDump single_split_classifier(Double threshold, Comparison comparison,
                                         ThresholdDomain domain = ThresholdDomain::Raw) {
    ModelDump dump;
    dump.model_type = "DecisionTreeClassifier";
    dump.n_features = 1;
    dump.classes = {0.0f, 1.0f};
    dump.comparison = comparison;
    dump.threshold_domain = domain;

    TreeDump tree;
    tree.add_split(1, 2, 0, threshold, {5.0, 5.0});
    tree.add_leaf({5.0, 0.0});
    tree.add_leaf({0.0, 5.0});
    dump.estimators.push_back(tree);
    return dump;
}

// Tree made of a single leaf voting for one class
inline TreeDump constant_vote(uint32_t class_index, uint32_t n_classes) {
    TreeDump tree;
    std::vector<Double> counts(n_classes, 0.0);
    counts[class_index] = 3.0;
    tree.add_leaf(counts);
    return tree;
}

inline ModelDump voting_forest(const std::vector<uint32_t>& votes, const std::vector<Float>& classes) {
    ModelDump dump;
    dump.model_type = "RandomForestClassifier";
    dump.n_features = 1;
    dump.classes = classes;
    for (uint32_t v : votes) {
        dump.estimators.push_back(constant_vote(v, static_cast<uint32_t>(classes.size())));
    }
    return dump;
}

// Forest of single-leaf trees with the given class weights
inline ModelDump leaf_forest(const std::vector<std::vector<Double>>& leaves, const std::vector<Float>& classes) {
    ModelDump dump;
    dump.model_type = "RandomForestClassifier";
    dump.n_features = 1;
    dump.classes = classes;
    for (const auto& weights : leaves) {
        TreeDump tree;
        tree.add_leaf(weights);
        dump.estimators.push_back(tree);
    }
    return dump;
}

// Two-level regressor over two features
inline ModelDump small_regressor(const char* model_type = "DecisionTreeRegressor") {
    ModelDump dump;
    dump.model_type = model_type;
    dump.n_features = 2;

    TreeDump tree;
    tree.add_split(1, 2, 0, 0.5, {0.0});
    tree.add_split(3, 4, 1, 2.5, {0.0});
    tree.add_leaf({10.0});
    tree.add_leaf({-1.0});
    tree.add_leaf({2.0});
    dump.estimators.push_back(tree);
    return dump;
}

} // namespace test_models
} // namespace fixtree
