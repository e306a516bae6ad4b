#pragma once

/**
 * FixTree: Fixed-point emulation of decision trees and tree ensembles
 *
 * Checks that a trained floating-point tree model keeps its predictions when
 * inputs and split thresholds are reduced to fixed-width integers, before the
 * model is turned into a hardware classifier.
 *
 * Usage:
 * ```cpp
 * #include <fixtree/fixtree.hpp>
 *
 * fixtree::Config config = fixtree::Config::with_bits(8);
 * fixtree::Dataset data = fixtree::Dataset::from_csv("train.csv", "test.csv");
 * fixtree::ModelDump model = fixtree::ModelDump::load("forest.txt");
 *
 * fixtree::Pipeline pipeline(config);
 * fixtree::RunResult result = pipeline.run(data, model);
 * if (!result.accepted) { ... }
 * ```
 *
 * Lower level:
 * ```cpp
 * fixtree::ReferenceModel ref = fixtree::ReferenceModelAdapter::adapt(model);
 * fixtree::QuantizationEngine engine(config);
 * auto q = engine.fit_and_transform(X_train, X_test);
 * auto fixed = fixtree::FixedPointModel::build(ref, q.profile);
 * std::vector<float> y = fixed.predict_batch(q.test);
 * ```
 */

#define FIXTREE_VERSION_MAJOR 0
#define FIXTREE_VERSION_MINOR 1
#define FIXTREE_VERSION_PATCH 0
#define FIXTREE_VERSION_STRING "0.1.0"

#include "fixtree/types.hpp"
#include "fixtree/config.hpp"
#include "fixtree/dataset.hpp"
#include "fixtree/quantization.hpp"
#include "fixtree/model_dump.hpp"
#include "fixtree/reference_model.hpp"
#include "fixtree/aggregation.hpp"
#include "fixtree/fixed_point.hpp"
#include "fixtree/equivalence.hpp"
#include "fixtree/metrics.hpp"
#include "fixtree/pipeline.hpp"
#include <cstdio>

namespace fixtree {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = FIXTREE_VERSION_MAJOR;
    static constexpr int minor = FIXTREE_VERSION_MINOR;
    static constexpr int patch = FIXTREE_VERSION_PATCH;
    static constexpr const char* string = FIXTREE_VERSION_STRING;
};

/**
 * Get compile-time feature flags
 */
struct CompileFeatures {
    static constexpr bool has_openmp =
        #ifdef _OPENMP
            true;
        #else
            false;
        #endif
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("FixTree v%s\n", Version::string);
    std::printf("  OpenMP: %s\n", CompileFeatures::has_openmp ? "Yes" : "No");
    std::printf("  Max feature bits: %u\n", MAX_BIT_WIDTH);
}

} // namespace fixtree
