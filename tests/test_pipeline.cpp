/**
 * FixTree Pipeline Tests
 */

#include <gtest/gtest.h>
#include "fixtree/pipeline.hpp"
#include "test_models.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace fixtree;
using namespace fixtree::test_models;

namespace fs = std::filesystem;

namespace {

// Feature on [0, 10], label is 1 from 5.0 upwards
Dataset threshold_dataset() {
    LabeledData train;
    train.features.resize(5, 1);
    train.features << 0.0f, 2.5f, 5.0f, 7.5f, 10.0f;
    train.targets = {0.0f, 0.0f, 1.0f, 1.0f, 1.0f};

    LabeledData test;
    const int n = 41;
    test.features.resize(n, 1);
    for (int i = 0; i < n; ++i) {
        const Float x = 0.25f * i;
        test.features(i, 0) = x;
        test.targets.push_back(x < 5.0f ? 0.0f : 1.0f);
    }
    return Dataset(train, test);
}

Dataset regression_dataset() {
    LabeledData train;
    train.features.resize(4, 2);
    train.features << 0.0f, 0.0f,
                      1.0f, 4.0f,
                      0.2f, 1.0f,
                      0.8f, 3.0f;
    train.targets = {-1.0f, 10.0f, -1.0f, 10.0f};

    LabeledData test;
    test.features.resize(3, 2);
    test.features << 0.0f, 1.0f,
                     0.0f, 3.0f,
                     1.0f, 0.0f;
    test.targets = {1.5f, 3.0f, 7.0f};
    return Dataset(train, test);
}

Config scenario_config(const fs::path& output_dir) {
    Config config = Config::silent();
    config.quantization.bit_width = 4;
    config.device.n_threads = 2;
    config.output_dir = output_dir.string();
    config.run_name = "scenario";
    return config;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "fixtree_pipeline_test";
        fs::remove_all(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
};

} // namespace

TEST(PipelineNamingTest, RunDirectoryName) {
    EXPECT_EQ(run_directory_name("iris", 8, ModelKind::Ensemble, 5, 100), "iris_8_ensemble_5_100");
    EXPECT_EQ(run_directory_name("iris", 4, ModelKind::SingleTree, 3, 1), "iris_4_tree_3_1");
}

// ============================================================================
// End to End
// ============================================================================

TEST_F(PipelineTest, SingleSplitScenario) {
    Pipeline pipeline(scenario_config(dir_));
    RunResult result = pipeline.run(threshold_dataset(), single_split_classifier(5.0, Comparison::Less));

    EXPECT_EQ(result.kind, ModelKind::SingleTree);
    EXPECT_EQ(result.max_depth, 1u);
    EXPECT_EQ(result.n_estimators, 1u);
    EXPECT_EQ(result.fixed_point.tree(0).node(0).threshold, 15u);
    EXPECT_TRUE(result.routing_mismatches.empty());

    ASSERT_EQ(result.predictions.size(), 3u);
    EXPECT_EQ(result.predictions[0].name, VARIANT_REFERENCE);
    EXPECT_EQ(result.predictions[2].name, VARIANT_FIXED_POINT);
    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.report.all_agree());
    EXPECT_EQ(result.report.mismatch_count(VARIANT_FIXED_POINT), 0u);

    // x = 5.0 quantizes to code 8 and goes right
    EXPECT_FLOAT_EQ(result.predictions[2].values[20], 1.0f);
    EXPECT_FLOAT_EQ(result.predictions[2].values[19], 0.0f);

    const fs::path run_dir = dir_ / "scenario_4_tree_1_1";
    EXPECT_EQ(result.run_directory, run_dir.string());
    EXPECT_TRUE(fs::exists(run_dir / "quantization_profile.txt"));
    EXPECT_TRUE(fs::exists(run_dir / "comparison_details.txt"));
    EXPECT_TRUE(fs::exists(run_dir / "fixed_point_parameters.txt"));

    const std::string score = read_file(run_dir / "score.txt");
    EXPECT_NE(score.find("variant: reference_quantized\n"), std::string::npos);
    EXPECT_NE(score.find("accuracy: 1\n"), std::string::npos);
    EXPECT_NE(score.find("All results were the same"), std::string::npos);

    EXPECT_TRUE(read_file(run_dir / "comparison_details.txt").empty());
    EXPECT_TRUE(QuantizationProfile::load((run_dir / "quantization_profile.txt").string()) == result.profile);
    EXPECT_NE(read_file(run_dir / "fixed_point_parameters.txt").find("threshold: 15"), std::string::npos);
}

TEST_F(PipelineTest, ScoresAreAppended) {
    Pipeline pipeline(scenario_config(dir_));
    RunResult result = pipeline.evaluate(threshold_dataset(), single_split_classifier(5.0, Comparison::Less));
    pipeline.write_artifacts(result);
    pipeline.write_artifacts(result);

    const std::string score = read_file(fs::path(result.run_directory) / "score.txt");
    EXPECT_EQ(count_occurrences(score, "variant: reference\n"), 2u);
}

TEST_F(PipelineTest, NoOutputDirectoryWritesNothing) {
    Config config = scenario_config(dir_);
    config.output_dir.clear();

    RunResult result = Pipeline(config).run(threshold_dataset(), single_split_classifier(5.0, Comparison::Less));
    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.run_directory.empty());
    EXPECT_FALSE(fs::exists(dir_));
}

TEST_F(PipelineTest, ModelTrainedOnCodes) {
    Config config = scenario_config(dir_);
    config.output_dir.clear();

    ModelDump quantized = single_split_classifier(7.5, Comparison::LessEqual, ThresholdDomain::Code);
    RunResult result = Pipeline(config).evaluate(threshold_dataset(),
                                                 single_split_classifier(5.0, Comparison::Less),
                                                 &quantized);

    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.report.all_agree());
    EXPECT_EQ(result.fixed_point.tree(0).node(0).threshold, 15u);
}

TEST_F(PipelineTest, RegressionEnsemble) {
    ModelDump dump = small_regressor("RandomForestRegressor");
    TreeDump constant;
    constant.add_leaf({4.0});
    dump.estimators.push_back(constant);

    Config config = scenario_config(dir_);
    config.run_name = "reg";
    RunResult result = Pipeline(config).run(regression_dataset(), dump);

    EXPECT_EQ(result.task, TaskType::Regression);
    EXPECT_EQ(result.kind, ModelKind::Ensemble);
    EXPECT_TRUE(result.accepted);
    ASSERT_EQ(result.predictions[0].values.size(), 3u);
    EXPECT_FLOAT_EQ(result.predictions[0].values[0], 1.5f);
    EXPECT_FLOAT_EQ(result.predictions[0].values[2], 7.0f);

    const fs::path run_dir = dir_ / "reg_4_ensemble_2_2";
    const std::string score = read_file(run_dir / "score.txt");
    EXPECT_NE(score.find("variant: fixed_point\n"), std::string::npos);
    EXPECT_NE(score.find("mae: "), std::string::npos);
}

TEST_F(PipelineTest, HardVoteAgainstAveragedForestIsRejected) {
    Config config = scenario_config(dir_);
    config.output_dir.clear();

    // The library averages to [0.4, 0.6], the hardware counts 2 votes to 1
    ModelDump forest = leaf_forest({{0.6, 0.4}, {0.6, 0.4}, {0.0, 1.0}}, {0.0f, 1.0f});
    RunResult result = Pipeline(config).evaluate(threshold_dataset(), forest);

    EXPECT_EQ(result.fixed_point.aggregation(), Aggregation::MajorityVote);
    EXPECT_FLOAT_EQ(result.predictions[1].values[0], 1.0f);
    EXPECT_FLOAT_EQ(result.predictions[2].values[0], 0.0f);
    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(result.report.all_agree());
}

// ============================================================================
// Input Errors
// ============================================================================

TEST_F(PipelineTest, RejectsBadInputs) {
    Config config = scenario_config(dir_);
    config.output_dir.clear();
    Pipeline pipeline(config);
    Dataset data = threshold_dataset();

    ModelDump code_reference = single_split_classifier(7.5, Comparison::LessEqual, ThresholdDomain::Code);
    EXPECT_THROW(pipeline.evaluate(data, code_reference), std::invalid_argument);

    EXPECT_THROW(pipeline.evaluate(data, small_regressor()), std::invalid_argument);

    ModelDump unsupported = single_split_classifier(5.0, Comparison::Less);
    unsupported.model_type = "SVC";
    EXPECT_THROW(pipeline.evaluate(data, unsupported), UnsupportedModelKind);

    ModelDump raw_quantized = single_split_classifier(7.5, Comparison::LessEqual);
    EXPECT_THROW(pipeline.evaluate(data, single_split_classifier(5.0, Comparison::Less), &raw_quantized),
                 std::invalid_argument);

    // Quantized model of another kind or with other labels than the floating one
    ModelDump code_forest = voting_forest({0, 1, 1}, {0.0f, 1.0f});
    code_forest.threshold_domain = ThresholdDomain::Code;
    EXPECT_THROW(pipeline.evaluate(data, single_split_classifier(5.0, Comparison::Less), &code_forest),
                 std::invalid_argument);

    ModelDump relabeled = single_split_classifier(7.5, Comparison::LessEqual, ThresholdDomain::Code);
    relabeled.classes = {0.0f, 2.0f};
    EXPECT_THROW(pipeline.evaluate(data, single_split_classifier(5.0, Comparison::Less), &relabeled),
                 std::invalid_argument);

    Config bad = Config::silent();
    bad.quantization.bit_width = 0;
    EXPECT_THROW(Pipeline{bad}, std::invalid_argument);
}
