#pragma once

/**
 * FixTree Verification Pipeline
 *
 * One run of the equivalence experiment:
 *   dataset + floating reference (+ optional model trained on codes)
 *   -> quantization -> fixed-point model -> three prediction variants
 *   -> comparison report and run artifacts
 *
 * Artifacts (under <output_dir>/<run directory>):
 *   quantization_profile.txt, comparison_details.txt,
 *   score.txt (appended), fixed_point_parameters.txt
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "model_dump.hpp"
#include "quantization.hpp"
#include "reference_model.hpp"
#include "fixed_point.hpp"
#include "equivalence.hpp"
#include <string>
#include <vector>

namespace fixtree {

struct RunResult {
    ModelKind kind = ModelKind::SingleTree;
    TaskType task = TaskType::Classification;
    uint32_t max_depth = 0;
    size_t n_estimators = 0;

    QuantizationProfile profile;
    QuantizationStats train_stats;
    QuantizationStats test_stats;

    FixedPointModel fixed_point;
    std::vector<NodeRoutingMismatch> routing_mismatches;

    std::vector<Float> ground_truth;
    std::vector<PredictionSet> predictions;   // reference, reference_quantized, fixed_point
    ComparisonReport report;

    // reference_quantized and fixed_point never disagree
    bool accepted = false;

    // Set by write_artifacts; empty when nothing was written
    std::string run_directory;
};

/**
 * <name>_<bits>_<kind>_<max_depth>_<n_estimators>
 */
std::string run_directory_name(const std::string& name, uint32_t bits, ModelKind kind,
                               uint32_t max_depth, size_t n_estimators);

class Pipeline {
public:
    Pipeline() : Pipeline(Config()) {}
    explicit Pipeline(const Config& config);

    /**
     * Compute everything in memory.
     * @param reference   floating model trained on raw features (threshold domain Raw)
     * @param quantized   optional model trained on the quantized training codes
     *                    (threshold domain Code); when absent the reference is
     *                    evaluated on dequantized codes and drives the fixed-point build
     * @throws UnsupportedModelKind, std::invalid_argument
     */
    RunResult evaluate(const Dataset& dataset, const ModelDump& reference,
                       const ModelDump* quantized = nullptr) const;

    /**
     * Persist the artifacts of an evaluated run. No-op when output_dir is empty.
     * @throws std::runtime_error on I/O failure; `result` keeps its contents
     */
    void write_artifacts(RunResult& result) const;

    // evaluate() followed by write_artifacts()
    RunResult run(const Dataset& dataset, const ModelDump& reference,
                  const ModelDump* quantized = nullptr) const;

    const Config& config() const { return config_; }

private:
    void log_summary(const RunResult& result) const;

    Config config_;
};

} // namespace fixtree
