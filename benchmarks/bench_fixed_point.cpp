/**
 * FixTree Fixed-Point Prediction Benchmarks
 */

#include <benchmark/benchmark.h>
#include "fixtree/fixed_point.hpp"
#include "fixtree/quantization.hpp"
#include "fixtree/reference_model.hpp"
#include <random>

using namespace fixtree;

namespace {

constexpr FeatureIndex N_FEATURES = 16;
constexpr uint32_t N_CLASSES = 3;

// Complete binary tree with random splits over [0, 1)
TreeDump random_tree(uint32_t depth, std::mt19937& rng) {
    std::uniform_int_distribution<int32_t> feature(0, N_FEATURES - 1);
    std::uniform_real_distribution<Double> threshold(0.0, 1.0);
    std::uniform_int_distribution<uint32_t> label(0, N_CLASSES - 1);

    TreeDump tree;
    const int32_t n_internal = (1 << depth) - 1;
    const int32_t n_nodes = (1 << (depth + 1)) - 1;
    for (int32_t n = 0; n < n_nodes; ++n) {
        if (n < n_internal) {
            tree.add_split(2 * n + 1, 2 * n + 2, feature(rng), threshold(rng));
        } else {
            std::vector<Double> counts(N_CLASSES, 0.0);
            counts[label(rng)] = 1.0;
            tree.add_leaf(counts);
        }
    }
    return tree;
}

ModelDump random_forest(size_t n_trees, uint32_t depth) {
    std::mt19937 rng(42);
    ModelDump dump;
    dump.model_type = "RandomForestClassifier";
    dump.n_features = N_FEATURES;
    dump.classes = {0.0f, 1.0f, 2.0f};
    for (size_t t = 0; t < n_trees; ++t) {
        dump.estimators.push_back(random_tree(depth, rng));
    }
    return dump;
}

FeatureMatrix random_features(Index n_samples) {
    FeatureMatrix features(n_samples, N_FEATURES);
    std::mt19937 rng(123);
    std::uniform_real_distribution<Float> dist(0.0f, 1.0f);
    for (Index i = 0; i < n_samples; ++i) {
        for (FeatureIndex f = 0; f < N_FEATURES; ++f) {
            features(i, f) = dist(rng);
        }
    }
    return features;
}

} // namespace

// Benchmark floating reference on raw features
static void BM_ReferencePredict(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    ReferenceModel reference = ReferenceModelAdapter::adapt(random_forest(100, 8));
    FeatureMatrix features = random_features(n_samples);

    for (auto _ : state) {
        std::vector<Float> output = reference.predict_batch(features);
        benchmark::DoNotOptimize(output);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_ReferencePredict)->Range(100, 10000);

// Benchmark integer-only ensemble on codes
static void BM_FixedPointPredict(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    ReferenceModel reference = ReferenceModelAdapter::adapt(random_forest(100, 8));
    FeatureMatrix features = random_features(n_samples);

    QuantizationEngine engine(Config::silent());
    QuantizationProfile profile = engine.fit(features);
    CodeMatrix codes = engine.transform(features, profile);
    FixedPointModel fixed = FixedPointModel::build(reference, profile);

    for (auto _ : state) {
        std::vector<Float> output = fixed.predict_batch(codes);
        benchmark::DoNotOptimize(output);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_FixedPointPredict)->Range(100, 10000);

// Benchmark threshold conversion for a whole forest
static void BM_FixedPointBuild(benchmark::State& state) {
    size_t n_trees = static_cast<size_t>(state.range(0));
    ReferenceModel reference = ReferenceModelAdapter::adapt(random_forest(n_trees, 8));
    FeatureMatrix features = random_features(1000);

    QuantizationEngine engine(Config::silent());
    QuantizationProfile profile = engine.fit(features);

    for (auto _ : state) {
        FixedPointModel fixed = FixedPointModel::build(reference, profile);
        benchmark::DoNotOptimize(fixed);
    }

    state.SetItemsProcessed(state.iterations() * n_trees);
}
BENCHMARK(BM_FixedPointBuild)->Range(10, 500);

BENCHMARK_MAIN();
