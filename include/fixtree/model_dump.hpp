#pragma once

/**
 * FixTree Model Dump
 *
 * Trained model as exported by the external ML library: one set of
 * parallel node arrays per estimator (scikit-learn `tree_` layout).
 *
 * Text format:
 *   model_type: RandomForestClassifier
 *   n_features: 2
 *   classes: 0 1 2
 *   comparison: le
 *   threshold_domain: raw
 *   n_estimators: 1
 *   tree: 3
 *   0 1 2 0 5.0 4 3 1        <- left right feature threshold value...
 *   -1 -1 -2 -2 4 0 0
 *   -1 -1 -2 -2 0 3 1
 */

#include "types.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace fixtree {

struct TreeDump {
    std::vector<int32_t> children_left;    // -1 for leaves
    std::vector<int32_t> children_right;   // -1 for leaves
    std::vector<int32_t> feature;          // ignored for leaves
    std::vector<Double> threshold;         // ignored for leaves
    std::vector<std::vector<Double>> value;  // per node: class counts/fractions, or [target]

    size_t n_nodes() const { return children_left.size(); }

    void add_split(int32_t left, int32_t right, int32_t feat, Double thr,
                   std::vector<Double> node_value = {});
    void add_leaf(std::vector<Double> node_value);
};

struct ModelDump {
    std::string model_type;
    FeatureIndex n_features = 0;
    std::vector<Float> classes;            // classifier label table (empty for regressors)
    Comparison comparison = Comparison::LessEqual;
    ThresholdDomain threshold_domain = ThresholdDomain::Raw;
    std::vector<TreeDump> estimators;

    void write(std::ostream& out) const;
    void save(const std::string& path) const;
    static ModelDump read(std::istream& in);
    static ModelDump load(const std::string& path);
};

} // namespace fixtree
