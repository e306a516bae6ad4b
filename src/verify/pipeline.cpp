/**
 * FixTree Verification Pipeline Implementation
 */

#include "fixtree/pipeline.hpp"
#include "fixtree/metrics.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fixtree {

namespace fs = std::filesystem;

std::string run_directory_name(const std::string& name, uint32_t bits, ModelKind kind,
                               uint32_t max_depth, size_t n_estimators) {
    return name + "_" + std::to_string(bits) + "_" + to_string(kind) + "_" +
           std::to_string(max_depth) + "_" + std::to_string(n_estimators);
}

Pipeline::Pipeline(const Config& config) : config_(config) {
    config_.validate();
}

// ============================================================================
// Evaluation
// ============================================================================

RunResult Pipeline::evaluate(const Dataset& dataset, const ModelDump& reference_dump,
                             const ModelDump* quantized_dump) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    const int n_threads = config_.device.resolved_threads();

    dataset.validate();

    // Floating reference on raw features
    ReferenceModel reference = ReferenceModelAdapter::adapt(reference_dump);
    if (reference.threshold_domain() != ThresholdDomain::Raw) {
        throw std::invalid_argument("the floating reference must have raw-domain thresholds");
    }
    if (reference.n_features() != dataset.n_features()) {
        throw std::invalid_argument("model expects " + std::to_string(reference.n_features()) +
                                    " features, dataset has " + std::to_string(dataset.n_features()));
    }

    if (config_.verbosity > 0) {
        std::printf("[pipeline] %s (%s, %s): %zu tree(s), max depth %u, %u-bit features\n",
                    reference.model_type().c_str(), to_string(reference.kind()),
                    to_string(reference.task()), reference.n_trees(), reference.max_depth(),
                    config_.quantization.bit_width);
    }

    RunResult result;
    result.kind = reference.kind();
    result.task = reference.task();
    result.max_depth = reference.max_depth();
    result.n_estimators = reference.n_trees();
    result.ground_truth = dataset.test_targets();

    PredictionSet ref_predictions;
    ref_predictions.name = VARIANT_REFERENCE;
    ref_predictions.values = reference.predict_batch(dataset.test_features(), n_threads);

    // Quantize both partitions with the training ranges
    QuantizationEngine engine(config_);
    QuantizationResult quantized = engine.fit_and_transform(dataset.train_features(),
                                                            dataset.test_features());
    result.profile = quantized.profile;
    result.train_stats = quantized.train_stats;
    result.test_stats = quantized.test_stats;

    // Model whose splits the hardware reproduces
    ReferenceModel code_model;
    const ReferenceModel* source = &reference;
    if (quantized_dump) {
        code_model = ReferenceModelAdapter::adapt(*quantized_dump);
        if (code_model.threshold_domain() != ThresholdDomain::Code) {
            throw std::invalid_argument("the quantized model must have code-domain thresholds");
        }
        if (code_model.task() != reference.task() || code_model.kind() != reference.kind() ||
            code_model.n_features() != reference.n_features() || code_model.classes() != reference.classes()) {
            throw std::invalid_argument("the quantized model (" + code_model.model_type() +
                                        ") does not match the floating reference (" +
                                        reference.model_type() + ")");
        }
        source = &code_model;
    }

    PredictionSet quantized_predictions;
    quantized_predictions.name = VARIANT_REFERENCE_QUANTIZED;
    if (quantized_dump) {
        const FeatureMatrix code_values = quantized.test.cast<Float>();
        quantized_predictions.values = code_model.predict_batch(code_values, n_threads);
    } else {
        const FeatureMatrix dequantized = engine.dequantize(quantized.test, quantized.profile);
        quantized_predictions.values = reference.predict_batch(dequantized, n_threads);
    }

    result.fixed_point = FixedPointModel::build(*source, result.profile);
    result.routing_mismatches = result.fixed_point.audit(*source, result.profile);
    if (config_.verbosity > 0 && source->kind() == ModelKind::Ensemble &&
        source->aggregation() != result.fixed_point.aggregation()) {
        std::printf("[pipeline] reference aggregates by %s, fixed-point by %s\n",
                    to_string(source->aggregation()), to_string(result.fixed_point.aggregation()));
    }

    PredictionSet fixed_predictions;
    fixed_predictions.name = VARIANT_FIXED_POINT;
    fixed_predictions.values = result.fixed_point.predict_batch(quantized.test, n_threads);

    result.predictions = {ref_predictions, quantized_predictions, fixed_predictions};

    EquivalenceValidator validator(config_.validation);
    result.report = validator.compare(result.ground_truth, result.predictions);
    result.accepted = result.report.acceptable(VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT);

    if (config_.verbosity > 0) {
        auto end_time = std::chrono::high_resolution_clock::now();
        double total_time = std::chrono::duration<double>(end_time - start_time).count();
        log_summary(result);
        std::printf("[pipeline] evaluated %zu samples in %.2fs\n",
                    result.ground_truth.size(), total_time);
    }

    return result;
}

// ============================================================================
// Artifacts
// ============================================================================

void Pipeline::write_artifacts(RunResult& result) const {
    if (config_.output_dir.empty()) return;

    const fs::path dir = fs::path(config_.output_dir) /
        run_directory_name(config_.run_name, result.profile.bit_width(), result.kind,
                           result.max_depth, result.n_estimators);
    fs::create_directories(dir);

    result.profile.save((dir / "quantization_profile.txt").string());

    if (config_.validation.write_details) {
        result.report.write_details((dir / "comparison_details.txt").string());
    }

    const std::string score_path = (dir / "score.txt").string();
    std::ofstream score(score_path, std::ios::app);
    if (!score) {
        throw std::runtime_error("Cannot open file for writing: " + score_path);
    }
    for (const PredictionSet& variant : result.predictions) {
        if (result.task == TaskType::Classification) {
            Metrics::write_classification_report(
                score, variant.name, Metrics::classification_scores(result.ground_truth, variant.values));
        } else {
            Metrics::write_regression_report(
                score, variant.name, Metrics::regression_scores(result.ground_truth, variant.values));
        }
    }
    result.report.write_summary(score);
    score << "\n";
    if (!score) {
        throw std::runtime_error("Failed writing scores: " + score_path);
    }

    result.fixed_point.save_description((dir / "fixed_point_parameters.txt").string());

    result.run_directory = dir.string();
    if (config_.verbosity > 0) {
        std::printf("[pipeline] artifacts written to %s\n", result.run_directory.c_str());
    }
}

RunResult Pipeline::run(const Dataset& dataset, const ModelDump& reference,
                        const ModelDump* quantized) const {
    RunResult result = evaluate(dataset, reference, quantized);
    write_artifacts(result);
    return result;
}

// ============================================================================
// Logging
// ============================================================================

void Pipeline::log_summary(const RunResult& result) const {
    if (!result.routing_mismatches.empty()) {
        std::printf("[pipeline] WARNING: %zu node routing mismatch(es) between reference and fixed-point splits\n",
                    result.routing_mismatches.size());
        if (config_.verbosity > 1) {
            for (const auto& m : result.routing_mismatches) {
                std::printf("[DEBUG] tree %zu node %u feature %u code %u: reference %s, fixed-point %s "
                            "(t=%.9g, T=%u)\n",
                            m.tree_index, m.node, static_cast<unsigned>(m.feature), m.code,
                            m.reference_left ? "left" : "right", m.fixed_left ? "left" : "right",
                            m.reference_threshold, m.fixed_threshold);
            }
        }
    }

    for (const auto& name : result.report.variant_names()) {
        std::printf("[pipeline] %-20s %zu / %zu match ground truth\n", name.c_str(),
                    result.report.matches(name), result.report.n_samples());
    }

    if (result.report.all_agree()) {
        std::printf("All results were the same\n");
    } else {
        std::printf("[pipeline] %zu sample(s) differ between variants; %s vs %s: %zu\n",
                    result.report.disagreements().size(),
                    VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT,
                    result.report.pair_disagreements(VARIANT_REFERENCE_QUANTIZED, VARIANT_FIXED_POINT));
    }
}

} // namespace fixtree
