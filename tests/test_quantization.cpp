/**
 * FixTree Quantization Tests
 */

#include <gtest/gtest.h>
#include "fixtree/quantization.hpp"
#include <cmath>
#include <limits>
#include <random>
#include <sstream>

using namespace fixtree;

namespace {

// Single feature spanning [0, 10]
FeatureMatrix zero_to_ten() {
    FeatureMatrix train(3, 1);
    train << 0.0f, 10.0f, 3.0f;
    return train;
}

QuantizationEngine engine_with_bits(uint32_t bits) {
    Config config = Config::silent();
    config.quantization.bit_width = bits;
    config.device.n_threads = 2;
    return QuantizationEngine(config);
}

} // namespace

// ============================================================================
// Affine Mapping
// ============================================================================

TEST(QuantizationTest, FourBitMidpointRoundsUp) {
    auto engine = engine_with_bits(4);
    QuantizationProfile profile = engine.fit(zero_to_ten());

    EXPECT_EQ(profile.max_code(), 15u);
    EXPECT_EQ(profile.max_threshold(), 31u);
    EXPECT_DOUBLE_EQ(profile.to_code_domain(0, 5.0), 7.5);

    EXPECT_EQ(profile.quantize(0, 0.0f), 0u);
    EXPECT_EQ(profile.quantize(0, 5.0f), 8u);
    EXPECT_EQ(profile.quantize(0, 4.9f), 7u);
    EXPECT_EQ(profile.quantize(0, 10.0f), 15u);
}

TEST(QuantizationTest, FloorPolicy) {
    QuantizationProfile profile({{0.0f, 10.0f}}, 4, RoundingPolicy::Floor);
    EXPECT_EQ(profile.quantize(0, 5.0f), 7u);
    EXPECT_EQ(profile.quantize(0, 10.0f), 15u);
}

TEST(QuantizationTest, RangeInvariant) {
    FeatureMatrix train(200, 3);
    FeatureMatrix test(200, 3);
    std::mt19937 rng(7);
    std::uniform_real_distribution<Float> dist(-50.0f, 50.0f);
    std::uniform_real_distribution<Float> wide(-80.0f, 80.0f);
    for (int i = 0; i < 200; ++i) {
        for (int f = 0; f < 3; ++f) {
            train(i, f) = dist(rng);
            test(i, f) = wide(rng);
        }
    }

    for (uint32_t bits : {1u, 3u, 8u, 16u}) {
        auto engine = engine_with_bits(bits);
        QuantizationResult result = engine.fit_and_transform(train, test);
        EXPECT_LE(result.train.maxCoeff(), max_code(bits));
        EXPECT_LE(result.test.maxCoeff(), max_code(bits));
        EXPECT_EQ(result.train_stats.total_overflows(), 0u);
    }
}

TEST(QuantizationTest, DeterministicAndIdempotent) {
    auto engine = engine_with_bits(6);
    FeatureMatrix train(4, 2);
    train << 0.0f, -1.0f,
             1.5f,  2.0f,
             3.0f,  0.5f,
             2.2f,  1.0f;

    QuantizationProfile profile = engine.fit(train);
    CodeMatrix first = engine.transform(train, profile);
    CodeMatrix second = engine.transform(train, profile);
    EXPECT_TRUE(first == second);

    // A code maps back onto itself
    FeatureMatrix restored = engine.dequantize(first, profile);
    CodeMatrix again = engine.transform(restored, profile);
    EXPECT_TRUE(first == again);
}

TEST(QuantizationTest, TestValuesSaturate) {
    auto engine = engine_with_bits(4);
    FeatureMatrix test(3, 1);
    test << -2.0f, 12.0f, 5.0f;

    QuantizationResult result = engine.fit_and_transform(zero_to_ten(), test);

    EXPECT_EQ(result.test(0, 0), 0u);
    EXPECT_EQ(result.test(1, 0), 15u);
    EXPECT_EQ(result.test(2, 0), 8u);
    ASSERT_EQ(result.test_stats.overflow_counts.size(), 1u);
    EXPECT_EQ(result.test_stats.overflow_counts[0], 2u);
}

TEST(QuantizationTest, DegenerateFeature) {
    auto engine = engine_with_bits(8);
    FeatureMatrix train(3, 2);
    train << 1.0f, 4.0f,
             2.0f, 4.0f,
             3.0f, 4.0f;
    FeatureMatrix test(2, 2);
    test << 1.0f, 4.0f,
            2.0f, 9.0f;

    QuantizationResult result = engine.fit_and_transform(train, test);

    EXPECT_TRUE(result.profile.is_degenerate(1));
    EXPECT_FALSE(result.profile.is_degenerate(0));
    EXPECT_DOUBLE_EQ(result.profile.scale(1), 0.0);
    EXPECT_EQ(result.train(0, 1), 0u);
    EXPECT_EQ(result.test(1, 1), 0u);
    ASSERT_EQ(result.train_stats.degenerate_features.size(), 1u);
    EXPECT_EQ(result.train_stats.degenerate_features[0], 1);
    EXPECT_FLOAT_EQ(result.profile.dequantize(1, 0), 4.0f);
}

// ============================================================================
// Input Errors
// ============================================================================

TEST(QuantizationTest, RejectsNaN) {
    auto engine = engine_with_bits(8);
    FeatureMatrix train = zero_to_ten();
    train(1, 0) = std::numeric_limits<Float>::quiet_NaN();
    EXPECT_THROW(engine.fit(train), std::invalid_argument);

    QuantizationProfile profile = engine.fit(zero_to_ten());
    FeatureMatrix test(1, 1);
    test << std::numeric_limits<Float>::quiet_NaN();
    EXPECT_THROW(engine.transform(test, profile), std::invalid_argument);
}

TEST(QuantizationTest, RejectsShapeMismatch) {
    auto engine = engine_with_bits(8);
    QuantizationProfile profile = engine.fit(zero_to_ten());
    FeatureMatrix test = FeatureMatrix::Zero(2, 3);
    EXPECT_THROW(engine.transform(test, profile), std::invalid_argument);
    EXPECT_THROW(engine.fit(FeatureMatrix()), std::invalid_argument);
}

TEST(QuantizationTest, RejectsBadBitWidth) {
    EXPECT_THROW(QuantizationProfile({{0.0f, 1.0f}}, 0), std::invalid_argument);
    EXPECT_THROW(QuantizationProfile({{0.0f, 1.0f}}, 32), std::invalid_argument);

    auto engine = engine_with_bits(8);
    EXPECT_THROW(engine.fit_and_transform(zero_to_ten(), zero_to_ten(), 40), std::invalid_argument);
}

// ============================================================================
// Persistence
// ============================================================================

TEST(QuantizationTest, ProfileSaveLoad) {
    QuantizationProfile profile({{0.0f, 10.0f}, {-1.0f / 3.0f, 2.7182817f}, {4.0f, 4.0f}}, 5);

    std::stringstream ss;
    profile.save(ss);
    EXPECT_NE(ss.str().find("threshold_bits: 6"), std::string::npos);

    QuantizationProfile loaded = QuantizationProfile::load(ss);
    EXPECT_TRUE(loaded == profile);
    EXPECT_EQ(loaded.bit_width(), 5u);
    EXPECT_TRUE(loaded.is_degenerate(2));
}

TEST(QuantizationTest, ProfileLoadErrors) {
    std::stringstream missing("bit_width: 4\n");
    EXPECT_THROW(QuantizationProfile::load(missing), std::runtime_error);

    std::stringstream bad_bits("bit_width: 4\nthreshold_bits: 7\nrounding: half_up\nn_features: 0\n");
    EXPECT_THROW(QuantizationProfile::load(bad_bits), std::runtime_error);

    std::stringstream bad_rounding("bit_width: 4\nthreshold_bits: 5\nrounding: nearest\nn_features: 0\n");
    EXPECT_THROW(QuantizationProfile::load(bad_rounding), std::runtime_error);
}
