/**
 * FixTree Python Bindings
 *
 * Lets a scikit-learn session hand its fitted trees straight to the
 * fixed-point emulator, without writing a model dump first.
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <limits>

#include "fixtree/fixtree.hpp"

namespace py = pybind11;
using namespace fixtree;

// ============================================================================
// NumPy Conversion Utilities
// ============================================================================

template<typename T>
py::array_t<T> vector_to_numpy(const std::vector<T>& vec) {
    auto result = py::array_t<T>(vec.size());
    auto buf = result.request();
    std::memcpy(buf.ptr, vec.data(), vec.size() * sizeof(T));
    return result;
}

FeatureMatrix numpy_to_features(py::array_t<float, py::array::c_style | py::array::forcecast> X) {
    auto buf = X.request();
    if (buf.ndim != 2) {
        throw std::runtime_error("X must be 2-dimensional");
    }
    FeatureMatrix features(buf.shape[0], buf.shape[1]);
    std::memcpy(features.data(), buf.ptr, features.size() * sizeof(Float));
    return features;
}

CodeMatrix numpy_to_codes(py::array_t<uint32_t, py::array::c_style | py::array::forcecast> codes) {
    auto buf = codes.request();
    if (buf.ndim != 2) {
        throw std::runtime_error("codes must be 2-dimensional");
    }
    CodeMatrix matrix(buf.shape[0], buf.shape[1]);
    std::memcpy(matrix.data(), buf.ptr, matrix.size() * sizeof(Code));
    return matrix;
}

py::array_t<uint32_t> codes_to_numpy(const CodeMatrix& codes) {
    py::array_t<uint32_t> result({codes.rows(), codes.cols()});
    auto buf = result.request();
    std::memcpy(buf.ptr, codes.data(), codes.size() * sizeof(Code));
    return result;
}

template<typename T>
std::vector<T> numpy_to_vector(const py::object& obj) {
    auto arr = py::array_t<T, py::array::c_style | py::array::forcecast>::ensure(obj);
    if (!arr) {
        throw std::runtime_error("expected a numeric array");
    }
    auto buf = arr.request();
    const T* ptr = static_cast<const T*>(buf.ptr);
    return std::vector<T>(ptr, ptr + buf.size);
}

// ============================================================================
// scikit-learn Adapter
// ============================================================================

/**
 * One estimator from a fitted `tree_`: children_left, children_right, feature,
 * threshold and value (n_nodes x n_outputs x n_classes).
 */
TreeDump tree_from_sklearn(const py::dict& tree) {
    TreeDump dump;
    auto left = numpy_to_vector<int64_t>(tree["children_left"]);
    auto right = numpy_to_vector<int64_t>(tree["children_right"]);
    auto feature = numpy_to_vector<int64_t>(tree["feature"]);
    dump.threshold = numpy_to_vector<double>(tree["threshold"]);

    dump.children_left.assign(left.begin(), left.end());
    dump.children_right.assign(right.begin(), right.end());
    dump.feature.assign(feature.begin(), feature.end());

    py::object value_obj = tree["value"];
    auto value = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(value_obj);
    if (!value) {
        throw std::runtime_error("value must be a numeric array");
    }
    auto buf = value.request();
    if (buf.ndim < 1 || static_cast<size_t>(buf.shape[0]) != dump.children_left.size()) {
        throw std::runtime_error("value must have one row per node");
    }
    const size_t width = buf.shape[0] > 0 ? static_cast<size_t>(buf.size / buf.shape[0]) : 0;
    const double* ptr = static_cast<const double*>(buf.ptr);
    for (py::ssize_t n = 0; n < buf.shape[0]; ++n) {
        dump.value.emplace_back(ptr + n * width, ptr + (n + 1) * width);
    }
    return dump;
}

ReferenceModel adapt_sklearn(
    const std::string& model_type,
    int n_features,
    const py::list& estimators,
    const std::vector<float>& classes,
    const std::string& comparison,
    const std::string& threshold_domain
) {
    ModelDump dump;
    dump.model_type = model_type;
    if (n_features <= 0 || n_features > std::numeric_limits<FeatureIndex>::max()) {
        throw std::invalid_argument("n_features out of range");
    }
    dump.n_features = static_cast<FeatureIndex>(n_features);
    dump.classes = classes;

    if (comparison == "le") dump.comparison = Comparison::LessEqual;
    else if (comparison == "lt") dump.comparison = Comparison::Less;
    else throw std::invalid_argument("comparison must be 'le' or 'lt'");

    if (threshold_domain == "raw") dump.threshold_domain = ThresholdDomain::Raw;
    else if (threshold_domain == "code") dump.threshold_domain = ThresholdDomain::Code;
    else throw std::invalid_argument("threshold_domain must be 'raw' or 'code'");

    for (const auto& est : estimators) {
        dump.estimators.push_back(tree_from_sklearn(est.cast<py::dict>()));
    }
    return ReferenceModelAdapter::adapt(dump);
}

// ============================================================================
// Python Quantizer Class
// ============================================================================

class FixTreeQuantizer {
public:
    FixTreeQuantizer(int bit_width = 8, const std::string& rounding = "half_up",
                     int n_threads = -1, int verbosity = 0) {
        config_.quantization.bit_width = static_cast<uint32_t>(bit_width);
        if (rounding == "half_up") config_.quantization.rounding = RoundingPolicy::HalfUp;
        else if (rounding == "floor") config_.quantization.rounding = RoundingPolicy::Floor;
        else throw std::invalid_argument("rounding must be 'half_up' or 'floor'");
        config_.device.n_threads = n_threads;
        config_.verbosity = verbosity;
        config_.validate();
    }

    py::tuple fit_and_transform(py::array_t<float> X_train, py::array_t<float> X_test) {
        QuantizationEngine engine(config_);
        QuantizationResult result = engine.fit_and_transform(numpy_to_features(X_train),
                                                             numpy_to_features(X_test));
        return py::make_tuple(codes_to_numpy(result.train), codes_to_numpy(result.test), result.profile);
    }

    py::array_t<uint32_t> transform(py::array_t<float> X, const QuantizationProfile& profile) {
        QuantizationEngine engine(config_);
        return codes_to_numpy(engine.transform(numpy_to_features(X), profile));
    }

private:
    Config config_;
};

// ============================================================================
// Comparison
// ============================================================================

py::dict compare(py::array_t<float> ground_truth, const py::dict& variants, float tolerance) {
    std::vector<PredictionSet> sets;
    for (const auto& item : variants) {
        PredictionSet set;
        set.name = item.first.cast<std::string>();
        set.values = numpy_to_vector<float>(py::reinterpret_borrow<py::object>(item.second));
        sets.push_back(std::move(set));
    }

    ValidationConfig config;
    config.tolerance = tolerance;
    ComparisonReport report = EquivalenceValidator(config).compare(numpy_to_vector<float>(ground_truth), sets);

    py::dict result;
    py::dict mismatches;
    for (const auto& name : report.variant_names()) {
        mismatches[py::str(name)] = report.mismatch_count(name);
    }
    py::list samples;
    for (const auto& d : report.disagreements()) samples.append(d.sample);

    result["n_samples"] = report.n_samples();
    result["mismatches"] = mismatches;
    result["disagreeing_samples"] = samples;
    result["all_agree"] = report.all_agree();
    return result;
}

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_fixtree, m) {
    m.doc() = "FixTree: fixed-point emulation of decision trees and tree ensembles";

    // Version info
    m.attr("__version__") = FIXTREE_VERSION_STRING;

    py::class_<QuantizationProfile>(m, "QuantizationProfile")
        .def_property_readonly("bit_width", &QuantizationProfile::bit_width)
        .def_property_readonly("threshold_bits", &QuantizationProfile::threshold_bits)
        .def_property_readonly("n_features", &QuantizationProfile::n_features)
        .def("is_degenerate", &QuantizationProfile::is_degenerate, py::arg("feature"))
        .def("dequantize", &QuantizationProfile::dequantize, py::arg("feature"), py::arg("code"))
        .def("save", py::overload_cast<const std::string&>(&QuantizationProfile::save, py::const_))
        .def_static("load", py::overload_cast<const std::string&>(&QuantizationProfile::load));

    py::class_<FixTreeQuantizer>(m, "QuantizationEngine")
        .def(py::init<int, const std::string&, int, int>(),
             py::arg("bit_width") = 8,
             py::arg("rounding") = "half_up",
             py::arg("n_threads") = -1,
             py::arg("verbosity") = 0)
        .def("fit_and_transform", &FixTreeQuantizer::fit_and_transform,
             py::arg("X_train"), py::arg("X_test"))
        .def("transform", &FixTreeQuantizer::transform, py::arg("X"), py::arg("profile"));

    py::class_<ReferenceModel>(m, "ReferenceModel")
        .def("predict", [](const ReferenceModel& model, py::array_t<float> X, int n_threads) {
                 return vector_to_numpy(model.predict_batch(numpy_to_features(X), n_threads));
             }, py::arg("X"), py::arg("n_threads") = 1)
        .def_property_readonly("model_type", &ReferenceModel::model_type)
        .def_property_readonly("kind", [](const ReferenceModel& model) { return to_string(model.kind()); })
        .def_property_readonly("task", [](const ReferenceModel& model) { return to_string(model.task()); })
        .def_property_readonly("n_trees", &ReferenceModel::n_trees)
        .def_property_readonly("max_depth", &ReferenceModel::max_depth);

    py::class_<FixedPointModel>(m, "FixedPointModel")
        .def_static("build", py::overload_cast<const ReferenceModel&, const QuantizationProfile&>(
                        &FixedPointModel::build), py::arg("reference"), py::arg("profile"))
        .def_static("build_from_bits", py::overload_cast<const ReferenceModel&, uint32_t>(
                        &FixedPointModel::build), py::arg("reference"), py::arg("bit_width"))
        .def("predict", [](const FixedPointModel& model, py::array_t<uint32_t> codes, int n_threads) {
                 return vector_to_numpy(model.predict_batch(numpy_to_codes(codes), n_threads));
             }, py::arg("codes"), py::arg("n_threads") = 1)
        .def("audit", [](const FixedPointModel& model, const ReferenceModel& reference,
                         const QuantizationProfile& profile) {
                 py::list out;
                 for (const auto& mismatch : model.audit(reference, profile)) {
                     py::dict entry;
                     entry["tree"] = mismatch.tree_index;
                     entry["node"] = mismatch.node;
                     entry["feature"] = mismatch.feature;
                     entry["code"] = mismatch.code;
                     entry["reference_left"] = mismatch.reference_left;
                     entry["fixed_left"] = mismatch.fixed_left;
                     out.append(entry);
                 }
                 return out;
             }, py::arg("reference"), py::arg("profile"))
        .def("save_description", &FixedPointModel::save_description)
        .def_property_readonly("feature_bits", &FixedPointModel::feature_bits)
        .def_property_readonly("threshold_bits", &FixedPointModel::threshold_bits)
        .def_property_readonly("n_trees", &FixedPointModel::n_trees);

    m.def("adapt_sklearn", &adapt_sklearn,
          py::arg("model_type"),
          py::arg("n_features"),
          py::arg("estimators"),
          py::arg("classes") = std::vector<float>(),
          py::arg("comparison") = "le",
          py::arg("threshold_domain") = "raw",
          "Build a ReferenceModel from fitted scikit-learn tree_ arrays");

    m.def("compare", &compare,
          py::arg("ground_truth"),
          py::arg("variants"),
          py::arg("tolerance") = 0.0f,
          "Compare named prediction arrays against the ground truth and each other");

    // Utility functions
    m.def("print_info", &print_info, "Print FixTree library information");
}
