/**
 * FixTree Model Dump Tests
 */

#include <gtest/gtest.h>
#include "fixtree/model_dump.hpp"
#include "test_models.hpp"
#include <sstream>

using namespace fixtree;

namespace {

const char* FOREST_TEXT =
    "# exported forest\n"
    "model_type: RandomForestClassifier\n"
    "n_features: 2\n"
    "threshold_domain: raw\n"
    "classes: 3 7\n"
    "comparison: lt\n"
    "n_estimators: 2\n"
    "tree: 3\n"
    "1 2 0 0.25 4 4\n"
    "-1 -1 -2 -2 4 0   # left leaf\n"
    "-1 -1 -2 -2 0 4\n"
    "\n"
    "tree: 1\n"
    "-1 -1 -2 -2 1 2\n";

std::string parse_error(const std::string& text) {
    std::istringstream in(text);
    try {
        ModelDump::read(in);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(ModelDumpTest, ReadForest) {
    std::istringstream in(FOREST_TEXT);
    ModelDump dump = ModelDump::read(in);

    EXPECT_EQ(dump.model_type, "RandomForestClassifier");
    EXPECT_EQ(dump.n_features, 2);
    ASSERT_EQ(dump.classes.size(), 2u);
    EXPECT_FLOAT_EQ(dump.classes[1], 7.0f);
    EXPECT_EQ(dump.comparison, Comparison::Less);
    EXPECT_EQ(dump.threshold_domain, ThresholdDomain::Raw);

    ASSERT_EQ(dump.estimators.size(), 2u);
    const TreeDump& first = dump.estimators[0];
    ASSERT_EQ(first.n_nodes(), 3u);
    EXPECT_EQ(first.children_left[0], 1);
    EXPECT_EQ(first.children_right[0], 2);
    EXPECT_DOUBLE_EQ(first.threshold[0], 0.25);
    EXPECT_EQ(first.children_left[1], -1);
    ASSERT_EQ(first.value[1].size(), 2u);
    EXPECT_DOUBLE_EQ(first.value[1][0], 4.0);
    EXPECT_EQ(dump.estimators[1].n_nodes(), 1u);
}

TEST(ModelDumpTest, DefaultsWhenOptionalKeysMissing) {
    std::istringstream in(
        "model_type: DecisionTreeRegressor\n"
        "n_features: 1\n"
        "n_estimators: 1\n"
        "tree: 1\n"
        "-1 -1 -2 -2 3.5\n");
    ModelDump dump = ModelDump::read(in);

    EXPECT_TRUE(dump.classes.empty());
    EXPECT_EQ(dump.comparison, Comparison::LessEqual);
    EXPECT_EQ(dump.threshold_domain, ThresholdDomain::Raw);
}

TEST(ModelDumpTest, WriteThenRead) {
    ModelDump original = test_models::single_split_classifier(0.1234567890123, Comparison::Less,
                                                              ThresholdDomain::Code);
    std::stringstream ss;
    original.write(ss);

    ModelDump loaded = ModelDump::read(ss);
    EXPECT_EQ(loaded.model_type, original.model_type);
    EXPECT_EQ(loaded.comparison, Comparison::Less);
    EXPECT_EQ(loaded.threshold_domain, ThresholdDomain::Code);
    EXPECT_EQ(loaded.classes, original.classes);
    ASSERT_EQ(loaded.estimators.size(), 1u);
    EXPECT_EQ(loaded.estimators[0].threshold[0], original.estimators[0].threshold[0]);
    EXPECT_EQ(loaded.estimators[0].value, original.estimators[0].value);
}

TEST(ModelDumpTest, ErrorsCarryLineNumbers) {
    EXPECT_NE(parse_error("model_type: X\nn_features: 2\ncolor: red\n").find("line 3"),
              std::string::npos);
    EXPECT_NE(parse_error("model_type: X\nn_features: 0\nn_estimators: 0\n").find("line 2"),
              std::string::npos);
    EXPECT_NE(parse_error("model_type: X\nn_features: 1\ncomparison: ge\nn_estimators: 0\n").find("line 3"),
              std::string::npos);
}

TEST(ModelDumpTest, TruncatedInput) {
    EXPECT_FALSE(parse_error("").empty());
    EXPECT_FALSE(parse_error("model_type: X\nn_features: 1\n").empty());
    EXPECT_FALSE(parse_error("model_type: X\nn_features: 1\nn_estimators: 1\ntree: 2\n-1 -1 -2 -2 1\n").empty());
    EXPECT_FALSE(parse_error("model_type: X\nn_features: 1\nn_estimators: 1\ntree: 1\n-1 -1 -2\n").empty());
}

TEST(ModelDumpTest, RejectsTrailingContent) {
    std::string text = "model_type: X\nn_features: 1\nn_estimators: 1\ntree: 1\n-1 -1 -2 -2 1\ntree: 1\n";
    EXPECT_NE(parse_error(text).find("unexpected content"), std::string::npos);
}

TEST(ModelDumpTest, MissingFile) {
    EXPECT_THROW(ModelDump::load("/nonexistent/model.txt"), std::runtime_error);
}
