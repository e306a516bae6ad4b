/**
 * FixTree Equivalence Validation Implementation
 */

#include "fixtree/equivalence.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace fixtree {

// ============================================================================
// ComparisonReport
// ============================================================================

size_t ComparisonReport::variant_index(const std::string& name) const {
    for (size_t v = 0; v < names_.size(); ++v) {
        if (names_[v] == name) return v;
    }
    throw std::out_of_range("unknown prediction variant: " + name);
}

size_t ComparisonReport::mismatch_count(const std::string& variant) const {
    return mismatches_[variant_index(variant)];
}

size_t ComparisonReport::pair_disagreements(const std::string& a, const std::string& b) const {
    return pair_counts_[variant_index(a)][variant_index(b)];
}

void ComparisonReport::write_details(std::ostream& out) const {
    out << std::setprecision(std::numeric_limits<Float>::max_digits10);
    for (const Disagreement& d : disagreements_) {
        out << "Difference between versions!\n";
        out << "sample: " << d.sample << "\n";
        out << "ground_truth: " << d.ground_truth << "\n";
        for (size_t v = 0; v < names_.size(); ++v) {
            out << names_[v] << ": " << d.predictions[v] << "\n";
        }
        out << "\n";
    }
}

void ComparisonReport::write_details(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    write_details(out);
    if (!out) {
        throw std::runtime_error("Failed writing comparison details: " + path);
    }
}

void ComparisonReport::write_summary(std::ostream& out) const {
    out << "n_samples: " << n_samples_ << "\n";
    for (size_t v = 0; v < names_.size(); ++v) {
        out << "errors_" << names_[v] << ": " << mismatches_[v] << "\n";
    }

    if (disagreements_.empty()) {
        out << "All results were the same\n";
        return;
    }

    out << "disagreeing_samples: " << disagreements_.size() << "\n";
    for (size_t a = 0; a < names_.size(); ++a) {
        for (size_t b = a + 1; b < names_.size(); ++b) {
            out << "disagreements_" << names_[a] << "_vs_" << names_[b] << ": "
                << pair_counts_[a][b] << "\n";
        }
    }
}

// ============================================================================
// EquivalenceValidator
// ============================================================================

bool EquivalenceValidator::same(Float a, Float b) const {
    if (config_.tolerance <= 0.0f) return a == b;
    return std::abs(static_cast<Double>(a) - static_cast<Double>(b)) <= config_.tolerance;
}

ComparisonReport EquivalenceValidator::compare(const std::vector<Float>& ground_truth,
                                               const std::vector<PredictionSet>& variants) const {
    const size_t n_samples = ground_truth.size();
    const size_t n_variants = variants.size();

    for (size_t v = 0; v < n_variants; ++v) {
        if (variants[v].values.size() != n_samples) {
            throw std::invalid_argument("variant '" + variants[v].name + "' has " +
                                        std::to_string(variants[v].values.size()) +
                                        " predictions, expected " + std::to_string(n_samples));
        }
        for (size_t w = 0; w < v; ++w) {
            if (variants[w].name == variants[v].name) {
                throw std::invalid_argument("duplicate variant name: " + variants[v].name);
            }
        }
    }

    ComparisonReport report;
    report.n_samples_ = n_samples;
    report.mismatches_.assign(n_variants, 0);
    report.pair_counts_.assign(n_variants, std::vector<size_t>(n_variants, 0));
    for (const auto& variant : variants) report.names_.push_back(variant.name);

    for (size_t i = 0; i < n_samples; ++i) {
        bool differs = false;
        for (size_t a = 0; a < n_variants; ++a) {
            const Float pa = variants[a].values[i];
            if (!same(pa, ground_truth[i])) report.mismatches_[a]++;

            for (size_t b = a + 1; b < n_variants; ++b) {
                if (!same(pa, variants[b].values[i])) {
                    report.pair_counts_[a][b]++;
                    report.pair_counts_[b][a]++;
                    differs = true;
                }
            }
        }

        if (differs) {
            Disagreement d;
            d.sample = i;
            d.ground_truth = ground_truth[i];
            d.predictions.reserve(n_variants);
            for (const auto& variant : variants) d.predictions.push_back(variant.values[i]);
            report.disagreements_.push_back(std::move(d));
        }
    }

    return report;
}

} // namespace fixtree
