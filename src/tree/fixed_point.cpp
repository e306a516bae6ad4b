/**
 * FixTree Fixed-Point Model Implementation
 */

#include "fixtree/fixed_point.hpp"
#include "fixtree/aggregation.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fixtree {

namespace {

bool reference_goes_left(Double x, Double threshold, Comparison comparison) {
    return comparison == Comparison::LessEqual ? x <= threshold : x < threshold;
}

bool fixed_goes_left(Code code, Code threshold) {
    return (static_cast<uint64_t>(code) << 1) < threshold;
}

Code clamp_code(Double position, Code max) {
    if (position <= 0.0) return 0;
    if (position >= static_cast<Double>(max)) return max;
    return static_cast<Code>(position);
}

// Raw-domain threshold that routes every code the way the reference routes
// its dequantized value. Dequantization is monotone in the code, so the codes
// going left are a prefix [0, c) and T = 2c - 1 separates them.
Code raw_domain_threshold(const QuantizationProfile& profile, FeatureIndex f, Double threshold,
                          Comparison comparison) {
    const Code max = profile.max_code();

    // Smallest code the reference sends right, or max + 1 if there is none
    uint64_t lo = 0;
    uint64_t hi = static_cast<uint64_t>(max) + 1;
    while (lo < hi) {
        const uint64_t mid = lo + (hi - lo) / 2;
        const Double x = profile.dequantize(f, static_cast<Code>(mid));
        if (reference_goes_left(x, threshold, comparison)) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }

    if (lo > max) return profile.max_threshold();
    if (lo == 0) return 0;
    return static_cast<Code>(2 * lo - 1);
}

} // namespace

// ============================================================================
// Threshold Requantization
// ============================================================================

Code FixedPointModel::requantize_threshold(Double t_code, Comparison comparison, uint32_t feature_bits) {
    if (feature_bits < 1 || feature_bits > MAX_BIT_WIDTH) {
        throw std::invalid_argument("bit_width must be in [1, 31]");
    }
    if (std::isnan(t_code)) {
        throw std::invalid_argument("threshold is NaN");
    }

    // code <= t  <=>  code <= floor(t)  <=>  2*code < 2*floor(t) + 1
    // code <  t  <=>  code <  ceil(t)   <=>  2*code < 2*ceil(t) - 1
    const Double odd = comparison == Comparison::LessEqual
        ? 2.0 * std::floor(t_code) + 1.0
        : 2.0 * std::ceil(t_code) - 1.0;

    const Code max_threshold = max_code(feature_bits + 1);
    if (odd <= 0.0) return 0;
    if (odd >= static_cast<Double>(max_threshold)) return max_threshold;
    return static_cast<Code>(odd);
}

// ============================================================================
// Build
// ============================================================================

FixedPointModel FixedPointModel::build(const ReferenceModel& reference, uint32_t feature_bit_width) {
    if (reference.threshold_domain() != ThresholdDomain::Code) {
        throw std::invalid_argument("a model with raw-domain thresholds needs a quantization profile");
    }
    if (feature_bit_width < 1 || feature_bit_width > MAX_BIT_WIDTH) {
        throw std::invalid_argument("bit_width must be in [1, 31]");
    }
    return build_impl(reference, feature_bit_width, nullptr);
}

FixedPointModel FixedPointModel::build(const ReferenceModel& reference, const QuantizationProfile& profile) {
    if (profile.n_features() != reference.n_features()) {
        throw std::invalid_argument("quantization profile has " + std::to_string(profile.n_features()) +
                                    " features, model expects " + std::to_string(reference.n_features()));
    }
    return build_impl(reference, profile.bit_width(), &profile);
}

FixedPointModel FixedPointModel::build_impl(const ReferenceModel& reference, uint32_t feature_bits,
                                            const QuantizationProfile* profile) {
    if (reference.n_trees() == 0) {
        throw std::invalid_argument("reference model has no trees");
    }

    FixedPointModel model;
    model.kind_ = reference.kind();
    model.task_ = reference.task();
    // The hardware counts one vote per tree whatever the library does
    model.aggregation_ = reference.task() == TaskType::Classification
        ? Aggregation::MajorityVote : Aggregation::Mean;
    model.feature_bits_ = feature_bits;
    model.n_features_ = reference.n_features();
    model.classes_ = reference.classes();

    const bool raw_domain = reference.threshold_domain() == ThresholdDomain::Raw;
    const Comparison comparison = reference.comparison();

    model.trees_.reserve(reference.n_trees());
    for (const DecisionTree& tree : reference.trees()) {
        std::vector<FixedPointNode> nodes(tree.n_nodes());

        for (NodeIndex i = 0; i < tree.n_nodes(); ++i) {
            const DecisionNode& src = tree.node(i);
            FixedPointNode& dst = nodes[i];
            dst.is_leaf = src.is_leaf;

            if (src.is_leaf) {
                dst.class_index = src.class_index;
                dst.value = src.value;
                continue;
            }

            dst.feature = src.feature;
            dst.left = src.left;
            dst.right = src.right;

            // A degenerate feature dequantizes every code to its constant,
            // so the whole split goes one way
            dst.threshold = raw_domain
                ? raw_domain_threshold(*profile, src.feature, src.threshold, comparison)
                : requantize_threshold(src.threshold, comparison, feature_bits);
        }

        model.trees_.push_back(FixedPointTree(std::move(nodes), tree.depth()));
    }

    return model;
}

// ============================================================================
// Prediction
// ============================================================================

Float FixedPointModel::predict(const Code* codes) const {
    if (trees_.empty()) {
        throw std::logic_error("fixed-point model has no trees");
    }

    if (task_ == TaskType::Classification) {
        std::vector<uint32_t> counts(n_classes(), 0);
        for (const auto& tree : trees_) {
            counts[tree.node(tree.find_leaf(codes)).class_index]++;
        }
        return classes_[majority_vote(counts.data(), n_classes())];
    }

    std::vector<Float> outputs;
    outputs.reserve(trees_.size());
    for (const auto& tree : trees_) {
        outputs.push_back(tree.node(tree.find_leaf(codes)).value);
    }
    return mean_value(outputs.data(), outputs.size());
}

std::vector<Float> FixedPointModel::predict_batch(const CodeMatrix& codes, int n_threads) const {
    if (codes.cols() != n_features_) {
        throw std::invalid_argument("expected " + std::to_string(n_features_) +
                                    " features, got " + std::to_string(codes.cols()));
    }

    const int64_t n_samples = codes.rows();
    std::vector<Float> output(static_cast<size_t>(n_samples));
    const int num_threads = n_threads > 0 ? n_threads : 1;

    // Every member tree is evaluated for a sample before its votes are aggregated
    #pragma omp parallel for schedule(static) num_threads(num_threads)
    for (int64_t i = 0; i < n_samples; ++i) {
        output[i] = predict(codes.row(i).data());
    }
    return output;
}

// ============================================================================
// Routing Audit
// ============================================================================

std::vector<NodeRoutingMismatch> FixedPointModel::audit(const ReferenceModel& reference,
                                                        const QuantizationProfile& profile) const {
    if (reference.n_trees() != trees_.size() || reference.n_features() != n_features_) {
        throw std::invalid_argument("audit: reference model does not match this fixed-point model");
    }
    if (profile.n_features() != n_features_ || profile.bit_width() != feature_bits_) {
        throw std::invalid_argument("audit: quantization profile does not match this fixed-point model");
    }

    const bool raw_domain = reference.threshold_domain() == ThresholdDomain::Raw;
    const Comparison comparison = reference.comparison();
    const Code max = profile.max_code();
    std::vector<NodeRoutingMismatch> mismatches;

    for (size_t t = 0; t < trees_.size(); ++t) {
        const DecisionTree& ref_tree = reference.tree(t);
        const FixedPointTree& fixed_tree = trees_[t];
        if (ref_tree.n_nodes() != fixed_tree.n_nodes()) {
            throw std::invalid_argument("audit: tree " + std::to_string(t) + " differs in node count");
        }

        for (NodeIndex n = 0; n < fixed_tree.n_nodes(); ++n) {
            const DecisionNode& ref_node = ref_tree.node(n);
            const FixedPointNode& fixed_node = fixed_tree.node(n);
            if (ref_node.is_leaf) continue;

            const FeatureIndex f = ref_node.feature;
            Code lo = 0;
            Code hi = 0;
            if (!(raw_domain && profile.is_degenerate(f))) {
                const Double t_code = raw_domain
                    ? profile.to_code_domain(f, ref_node.threshold)
                    : ref_node.threshold;
                const Double base = std::floor(t_code);
                lo = clamp_code(base - 1.0, max);
                hi = clamp_code(base + 1.0, max);
            }

            for (uint64_t c = lo; c <= hi; ++c) {
                const Code code = static_cast<Code>(c);
                const Double x = raw_domain
                    ? static_cast<Double>(profile.dequantize(f, code))
                    : static_cast<Double>(static_cast<Float>(code));
                const bool ref_left = reference_goes_left(x, ref_node.threshold, comparison);
                const bool fixed_left = fixed_goes_left(code, fixed_node.threshold);

                if (ref_left != fixed_left) {
                    NodeRoutingMismatch m;
                    m.tree_index = t;
                    m.node = n;
                    m.feature = f;
                    m.code = code;
                    m.reference_threshold = ref_node.threshold;
                    m.fixed_threshold = fixed_node.threshold;
                    m.reference_left = ref_left;
                    m.fixed_left = fixed_left;
                    mismatches.push_back(m);
                }
            }
        }
    }

    return mismatches;
}

// ============================================================================
// Hardware Description
// ============================================================================

HardwareTopology FixedPointModel::topology() const {
    HardwareTopology topo;
    topo.feature_bits = feature_bits_;
    topo.threshold_bits = threshold_bits();
    topo.kind = kind_;
    topo.task = task_;
    topo.aggregation = aggregation_;
    topo.n_features = n_features_;
    topo.n_classes = task_ == TaskType::Classification ? n_classes() : 0;
    topo.classes = classes_;

    topo.trees.resize(trees_.size());
    for (size_t t = 0; t < trees_.size(); ++t) {
        const auto& nodes = trees_[t].nodes();
        auto& out = topo.trees[t].nodes;
        out.resize(nodes.size());
        for (NodeIndex n = 0; n < nodes.size(); ++n) {
            out[n].id = n;
            out[n].is_leaf = nodes[n].is_leaf;
            out[n].feature = nodes[n].feature;
            out[n].threshold = nodes[n].threshold;
            out[n].left = nodes[n].left;
            out[n].right = nodes[n].right;
            out[n].class_index = nodes[n].class_index;
            out[n].value = nodes[n].value;
        }
    }
    return topo;
}

void FixedPointModel::describe(std::ostream& out) const {
    out << std::setprecision(std::numeric_limits<Float>::max_digits10);
    out << "model_kind: " << to_string(kind_) << "\n";
    out << "task: " << to_string(task_) << "\n";
    out << "aggregation: " << to_string(aggregation_) << "\n";
    out << "feature_bits: " << feature_bits_ << "\n";
    out << "threshold_bits: " << threshold_bits() << "\n";
    out << "n_features: " << n_features_ << "\n";
    if (task_ == TaskType::Classification) {
        out << "classes:";
        for (Float c : classes_) out << " " << c;
        out << "\n";
    }
    out << "n_trees: " << trees_.size() << "\n";

    for (size_t t = 0; t < trees_.size(); ++t) {
        const FixedPointTree& tree = trees_[t];
        out << "tree: " << t << " n_nodes: " << tree.n_nodes() << " depth: " << tree.depth() << "\n";
        for (NodeIndex n = 0; n < tree.n_nodes(); ++n) {
            const FixedPointNode& node = tree.node(n);
            out << "  node: " << n;
            if (!node.is_leaf) {
                out << " feature: " << node.feature
                    << " threshold: " << node.threshold
                    << " left: " << node.left
                    << " right: " << node.right;
            } else if (task_ == TaskType::Classification) {
                out << " leaf class: " << node.class_index;
            } else {
                out << " leaf value: " << node.value;
            }
            out << "\n";
        }
    }
}

void FixedPointModel::save_description(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    describe(out);
    if (!out) {
        throw std::runtime_error("Failed writing fixed-point parameters: " + path);
    }
}

} // namespace fixtree
