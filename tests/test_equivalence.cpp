/**
 * FixTree Equivalence Validation Tests
 */

#include <gtest/gtest.h>
#include "fixtree/equivalence.hpp"
#include <sstream>

using namespace fixtree;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

} // namespace

TEST(EquivalenceTest, AllAgree) {
    std::vector<Float> truth = {0.0f, 1.0f, 1.0f};
    std::vector<PredictionSet> variants = {
        {VARIANT_REFERENCE, {0.0f, 1.0f, 0.0f}},
        {VARIANT_REFERENCE_QUANTIZED, {0.0f, 1.0f, 0.0f}},
        {VARIANT_FIXED_POINT, {0.0f, 1.0f, 0.0f}},
    };

    ComparisonReport report = EquivalenceValidator().compare(truth, variants);
    EXPECT_TRUE(report.all_agree());
    EXPECT_EQ(report.n_samples(), 3u);
    EXPECT_EQ(report.mismatch_count(VARIANT_FIXED_POINT), 1u);
    EXPECT_EQ(report.matches(VARIANT_REFERENCE), 2u);
    EXPECT_TRUE(report.acceptable(VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT));

    std::ostringstream summary;
    report.write_summary(summary);
    EXPECT_NE(summary.str().find("All results were the same"), std::string::npos);
    EXPECT_NE(summary.str().find("errors_fixed_point: 1\n"), std::string::npos);

    std::ostringstream details;
    report.write_details(details);
    EXPECT_TRUE(details.str().empty());
}

TEST(EquivalenceTest, EveryDisagreementIsReported) {
    std::vector<Float> truth = {0.0f, 1.0f, 2.0f, 2.0f, 1.0f};
    std::vector<PredictionSet> variants = {
        {VARIANT_REFERENCE, {0.0f, 1.0f, 2.0f, 1.0f, 1.0f}},
        {VARIANT_REFERENCE_QUANTIZED, {0.0f, 2.0f, 2.0f, 1.0f, 1.0f}},
        {VARIANT_FIXED_POINT, {0.0f, 2.0f, 2.0f, 1.0f, 0.0f}},
    };

    ComparisonReport report = EquivalenceValidator().compare(truth, variants);
    EXPECT_FALSE(report.all_agree());
    ASSERT_EQ(report.disagreements().size(), 2u);
    EXPECT_EQ(report.disagreements()[0].sample, 1u);
    EXPECT_EQ(report.disagreements()[1].sample, 4u);
    EXPECT_FLOAT_EQ(report.disagreements()[1].predictions[2], 0.0f);

    EXPECT_EQ(report.pair_disagreements(VARIANT_REFERENCE, VARIANT_REFERENCE_QUANTIZED), 1u);
    EXPECT_EQ(report.pair_disagreements(VARIANT_FIXED_POINT, VARIANT_REFERENCE), 2u);
    EXPECT_EQ(report.pair_disagreements(VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT), 1u);
    EXPECT_FALSE(report.acceptable(VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT));

    EXPECT_EQ(report.mismatch_count(VARIANT_REFERENCE), 1u);
    EXPECT_EQ(report.mismatch_count(VARIANT_FIXED_POINT), 3u);

    std::ostringstream details;
    report.write_details(details);
    EXPECT_EQ(count_occurrences(details.str(), "Difference between versions!"),
              report.disagreements().size());
    EXPECT_NE(details.str().find("sample: 4\nground_truth: 1\nreference: 1\n"
                                 "reference_quantized: 1\nfixed_point: 0\n"), std::string::npos);

    std::ostringstream summary;
    report.write_summary(summary);
    EXPECT_NE(summary.str().find("disagreeing_samples: 2\n"), std::string::npos);
    EXPECT_NE(summary.str().find("disagreements_reference_vs_fixed_point: 2\n"), std::string::npos);
}

TEST(EquivalenceTest, Tolerance) {
    ValidationConfig config;
    config.tolerance = 0.01f;
    EquivalenceValidator validator(config);

    EXPECT_TRUE(validator.same(1.0f, 1.005f));
    EXPECT_FALSE(validator.same(1.0f, 1.1f));
    EXPECT_FALSE(EquivalenceValidator().same(1.0f, 1.005f));

    std::vector<Float> truth = {1.0f, 2.0f};
    std::vector<PredictionSet> variants = {
        {VARIANT_REFERENCE, {1.004f, 2.0f}},
        {VARIANT_FIXED_POINT, {1.0f, 2.003f}},
    };
    ComparisonReport report = validator.compare(truth, variants);
    EXPECT_TRUE(report.all_agree());
    EXPECT_EQ(report.mismatch_count(VARIANT_REFERENCE), 0u);
}

TEST(EquivalenceTest, InputErrors) {
    std::vector<Float> truth = {1.0f, 2.0f};
    EquivalenceValidator validator;

    EXPECT_THROW(validator.compare(truth, {{VARIANT_REFERENCE, {1.0f}}}), std::invalid_argument);
    EXPECT_THROW(validator.compare(truth, {{"a", {1.0f, 2.0f}}, {"a", {1.0f, 2.0f}}}),
                 std::invalid_argument);

    ComparisonReport report = validator.compare(truth, {{VARIANT_REFERENCE, {1.0f, 2.0f}}});
    EXPECT_THROW(report.mismatch_count("missing"), std::out_of_range);
}
