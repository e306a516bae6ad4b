/**
 * FixTree Quantization Benchmarks
 */

#include <benchmark/benchmark.h>
#include "fixtree/quantization.hpp"
#include <random>

using namespace fixtree;

static FeatureMatrix random_features(Index n_samples, FeatureIndex n_features, uint32_t seed) {
    FeatureMatrix features(n_samples, n_features);
    std::mt19937 rng(seed);
    std::uniform_real_distribution<Float> dist(-10.0f, 10.0f);
    for (Index i = 0; i < n_samples; ++i) {
        for (FeatureIndex f = 0; f < n_features; ++f) {
            features(i, f) = dist(rng);
        }
    }
    return features;
}

// Benchmark fitting per-feature ranges
static void BM_QuantizationFit(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    FeatureMatrix train = random_features(n_samples, 32, 42);

    Config config = Config::silent();
    QuantizationEngine engine(config);

    for (auto _ : state) {
        QuantizationProfile profile = engine.fit(train);
        benchmark::DoNotOptimize(profile);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_QuantizationFit)->Range(1000, 100000);

// Benchmark applying a profile (the parallel per-feature path)
static void BM_QuantizationTransform(benchmark::State& state) {
    Index n_samples = static_cast<Index>(state.range(0));
    FeatureMatrix train = random_features(n_samples, 32, 42);
    FeatureMatrix test = random_features(n_samples, 32, 7);

    Config config = Config::silent();
    QuantizationEngine engine(config);
    QuantizationProfile profile = engine.fit(train);

    for (auto _ : state) {
        QuantizationStats stats;
        CodeMatrix codes = engine.transform(test, profile, &stats);
        benchmark::DoNotOptimize(codes);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_QuantizationTransform)->Range(1000, 100000);

BENCHMARK_MAIN();
