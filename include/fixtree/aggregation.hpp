#pragma once

/**
 * FixTree Ensemble Aggregation
 *
 * Tie-breaking is the same everywhere: the lowest class index wins.
 *
 * The fixed-point model counts one hard vote per tree. The floating reference
 * combines classifier trees the way scikit-learn forests do, by averaging the
 * normalized leaf distributions.
 */

#include "types.hpp"
#include <vector>

namespace fixtree {

/**
 * Majority vote over per-class counts. Ties go to the lowest class index.
 */
inline ClassIndex majority_vote(const uint32_t* counts, uint32_t n_classes) {
    ClassIndex best = 0;
    uint32_t best_count = 0;
    for (ClassIndex c = 0; c < n_classes; ++c) {
        if (counts[c] > best_count) {  // strict: earlier class keeps a tie
            best_count = counts[c];
            best = c;
        }
    }
    return best;
}

inline ClassIndex majority_vote(const std::vector<ClassIndex>& votes, uint32_t n_classes) {
    std::vector<uint32_t> counts(n_classes, 0);
    for (ClassIndex v : votes) {
        if (v < n_classes) counts[v]++;
    }
    return majority_vote(counts.data(), n_classes);
}

inline Float mean_value(const Float* values, size_t n) {
    if (n == 0) return 0.0f;
    Double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += values[i];
    return static_cast<Float>(sum / static_cast<Double>(n));
}

// Argmax of a class distribution, lowest index on ties
inline ClassIndex argmax_class(const std::vector<Float>& distribution) {
    ClassIndex best = 0;
    for (ClassIndex c = 1; c < distribution.size(); ++c) {
        if (distribution[c] > distribution[best]) best = c;
    }
    return best;
}

/**
 * Adds one leaf distribution, scaled to sum to 1, into `proba`.
 * An all-zero distribution adds nothing.
 */
inline void accumulate_probability(const std::vector<Float>& distribution, std::vector<Double>& proba) {
    Double total = 0.0;
    for (Float w : distribution) total += w;
    if (total <= 0.0) return;
    for (size_t c = 0; c < distribution.size() && c < proba.size(); ++c) {
        proba[c] += static_cast<Double>(distribution[c]) / total;
    }
}

// Mean of accumulated probabilities over n_trees, argmax with lowest index on ties
inline ClassIndex mean_probability_vote(std::vector<Double>& proba, size_t n_trees) {
    ClassIndex best = 0;
    for (ClassIndex c = 0; c < proba.size(); ++c) {
        proba[c] /= static_cast<Double>(n_trees > 0 ? n_trees : 1);
        if (proba[c] > proba[best]) best = c;
    }
    return best;
}

} // namespace fixtree
