/**
 * FixTree Quantization Implementation
 */

#include "fixtree/quantization.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fixtree {

namespace {

Code round_code(Double position, Code max, RoundingPolicy rounding, bool* clamped) {
    Double rounded = rounding == RoundingPolicy::HalfUp
        ? std::floor(position + 0.5)
        : std::floor(position);

    bool saturated = false;
    Code code;
    if (rounded < 0.0) {
        code = 0;
        saturated = true;
    } else if (rounded > static_cast<Double>(max)) {
        code = max;
        saturated = true;
    } else {
        code = static_cast<Code>(rounded);
    }
    if (clamped) *clamped = saturated;
    return code;
}

// "key: value" on one line
std::string expect_key(std::istringstream& line, const char* key, size_t line_no) {
    std::string token;
    line >> token;
    if (token != std::string(key) + ":") {
        throw std::runtime_error("quantization profile line " + std::to_string(line_no) +
                                 ": expected '" + key + ":'");
    }
    std::string value;
    line >> value;
    if (value.empty()) {
        throw std::runtime_error("quantization profile line " + std::to_string(line_no) +
                                 ": missing value for '" + key + "'");
    }
    return value;
}

bool next_line(std::istream& in, std::string& line, size_t& line_no) {
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line[0] != '#') return true;
    }
    return false;
}

} // namespace

// ============================================================================
// QuantizationProfile
// ============================================================================

QuantizationProfile::QuantizationProfile(std::vector<FeatureRange> ranges, uint32_t bit_width,
                                         RoundingPolicy rounding)
    : ranges_(std::move(ranges)), bit_width_(bit_width), rounding_(rounding) {
    if (bit_width_ < 1 || bit_width_ > MAX_BIT_WIDTH) {
        throw std::invalid_argument("bit_width must be in [1, 31]");
    }
    for (const auto& r : ranges_) {
        if (!(r.min_value <= r.max_value)) {
            throw std::invalid_argument("feature range requires min <= max");
        }
    }
}

Double QuantizationProfile::scale(FeatureIndex f) const {
    const FeatureRange& r = ranges_[f];
    if (r.is_degenerate()) return 0.0;
    return static_cast<Double>(max_code()) /
           (static_cast<Double>(r.max_value) - static_cast<Double>(r.min_value));
}

Double QuantizationProfile::to_code_domain(FeatureIndex f, Double value) const {
    const FeatureRange& r = ranges_[f];
    if (r.is_degenerate()) return 0.0;
    const Double lo = r.min_value;
    const Double hi = r.max_value;
    return (value - lo) / (hi - lo) * static_cast<Double>(max_code());
}

Code QuantizationProfile::quantize(FeatureIndex f, Float value, bool* clamped) const {
    const FeatureRange& r = ranges_[f];
    if (r.is_degenerate()) {
        if (clamped) *clamped = value != r.min_value;
        return 0;
    }
    return round_code(to_code_domain(f, value), max_code(), rounding_, clamped);
}

Float QuantizationProfile::dequantize(FeatureIndex f, Code code) const {
    const FeatureRange& r = ranges_[f];
    if (r.is_degenerate()) return r.min_value;
    const Double lo = r.min_value;
    const Double hi = r.max_value;
    return static_cast<Float>(lo + static_cast<Double>(code) * (hi - lo) /
                                   static_cast<Double>(max_code()));
}

void QuantizationProfile::save(std::ostream& out) const {
    out << std::setprecision(std::numeric_limits<Float>::max_digits10);
    out << "bit_width: " << bit_width_ << "\n";
    out << "threshold_bits: " << threshold_bits() << "\n";
    out << "rounding: " << to_string(rounding_) << "\n";
    out << "n_features: " << ranges_.size() << "\n";
    for (size_t f = 0; f < ranges_.size(); ++f) {
        out << "feature: " << f
            << " min: " << ranges_[f].min_value
            << " max: " << ranges_[f].max_value << "\n";
    }
}

void QuantizationProfile::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    save(out);
    if (!out) {
        throw std::runtime_error("Failed writing quantization profile: " + path);
    }
}

QuantizationProfile QuantizationProfile::load(std::istream& in) {
    std::string line;
    size_t line_no = 0;

    auto read_value = [&](const char* key) {
        if (!next_line(in, line, line_no)) {
            throw std::runtime_error(std::string("quantization profile: missing '") + key + "'");
        }
        std::istringstream ls(line);
        return expect_key(ls, key, line_no);
    };

    uint32_t bit_width = static_cast<uint32_t>(std::stoul(read_value("bit_width")));
    uint32_t threshold_bits = static_cast<uint32_t>(std::stoul(read_value("threshold_bits")));
    if (threshold_bits != bit_width + 1) {
        throw std::runtime_error("quantization profile: threshold_bits must be bit_width + 1");
    }

    std::string rounding_name = read_value("rounding");
    RoundingPolicy rounding;
    if (rounding_name == "half_up") {
        rounding = RoundingPolicy::HalfUp;
    } else if (rounding_name == "floor") {
        rounding = RoundingPolicy::Floor;
    } else {
        throw std::runtime_error("quantization profile: unknown rounding '" + rounding_name + "'");
    }

    size_t n_features = std::stoul(read_value("n_features"));
    std::vector<FeatureRange> ranges(n_features);

    for (size_t f = 0; f < n_features; ++f) {
        if (!next_line(in, line, line_no)) {
            throw std::runtime_error("quantization profile: expected " + std::to_string(n_features) +
                                     " feature lines");
        }
        std::istringstream ls(line);
        size_t index = std::stoul(expect_key(ls, "feature", line_no));
        if (index != f) {
            throw std::runtime_error("quantization profile line " + std::to_string(line_no) +
                                     ": features out of order");
        }
        ranges[f].min_value = std::stof(expect_key(ls, "min", line_no));
        ranges[f].max_value = std::stof(expect_key(ls, "max", line_no));
    }

    return QuantizationProfile(std::move(ranges), bit_width, rounding);
}

QuantizationProfile QuantizationProfile::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + path);
    }
    return load(in);
}

bool QuantizationProfile::operator==(const QuantizationProfile& other) const {
    if (bit_width_ != other.bit_width_ || rounding_ != other.rounding_ ||
        ranges_.size() != other.ranges_.size()) {
        return false;
    }
    for (size_t f = 0; f < ranges_.size(); ++f) {
        if (ranges_[f].min_value != other.ranges_[f].min_value ||
            ranges_[f].max_value != other.ranges_[f].max_value) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// QuantizationEngine
// ============================================================================

QuantizationEngine::QuantizationEngine(const Config& config)
    : config_(config.quantization),
      n_threads_(config.device.resolved_threads()),
      verbosity_(config.verbosity) {
    if (config_.bit_width < 1 || config_.bit_width > MAX_BIT_WIDTH) {
        throw std::invalid_argument("bit_width must be in [1, 31]");
    }
}

QuantizationProfile QuantizationEngine::fit(const FeatureMatrix& train) const {
    if (train.rows() == 0 || train.cols() == 0) {
        throw std::invalid_argument("cannot fit quantization on an empty training partition");
    }
    if (!train.allFinite()) {
        throw std::invalid_argument("training features contain NaN or infinite values");
    }
    if (train.cols() > std::numeric_limits<FeatureIndex>::max()) {
        throw std::invalid_argument("too many features");
    }

    const Eigen::Matrix<Float, 1, Eigen::Dynamic> mins = train.colwise().minCoeff();
    const Eigen::Matrix<Float, 1, Eigen::Dynamic> maxs = train.colwise().maxCoeff();

    std::vector<FeatureRange> ranges(static_cast<size_t>(train.cols()));
    for (Eigen::Index f = 0; f < train.cols(); ++f) {
        ranges[f].min_value = mins(f);
        ranges[f].max_value = maxs(f);

        if (ranges[f].is_degenerate() && verbosity_ > 0) {
            std::printf("[quantization] feature %ld has a degenerate range [%g, %g], mapped to code 0\n",
                        static_cast<long>(f), static_cast<double>(mins(f)),
                        static_cast<double>(maxs(f)));
        }
    }

    return QuantizationProfile(std::move(ranges), config_.bit_width, config_.rounding);
}

CodeMatrix QuantizationEngine::transform(const FeatureMatrix& features,
                                         const QuantizationProfile& profile,
                                         QuantizationStats* stats) const {
    if (features.cols() != profile.n_features()) {
        throw std::invalid_argument("feature count " + std::to_string(features.cols()) +
                                    " does not match quantization profile (" +
                                    std::to_string(profile.n_features()) + ")");
    }
    if (features.hasNaN()) {
        throw std::invalid_argument("features contain NaN");
    }

    const Index n_rows = static_cast<Index>(features.rows());
    const FeatureIndex n_features = profile.n_features();
    CodeMatrix codes(n_rows, n_features);
    std::vector<Index> overflows(n_features, 0);

    #pragma omp parallel for schedule(dynamic) num_threads(n_threads_) if(n_features > 10)
    for (int f = 0; f < static_cast<int>(n_features); ++f) {
        const FeatureIndex feature = static_cast<FeatureIndex>(f);
        Index clamped_count = 0;
        for (Index i = 0; i < n_rows; ++i) {
            bool clamped = false;
            codes(i, feature) = profile.quantize(feature, features(i, feature), &clamped);
            clamped_count += clamped ? 1 : 0;
        }
        overflows[feature] = clamped_count;
    }

    if (stats) {
        stats->overflow_counts = std::move(overflows);
        stats->degenerate_features.clear();
        for (FeatureIndex f = 0; f < n_features; ++f) {
            if (profile.is_degenerate(f)) stats->degenerate_features.push_back(f);
        }
    }

    return codes;
}

QuantizationResult QuantizationEngine::fit_and_transform(const FeatureMatrix& train,
                                                         const FeatureMatrix& test) const {
    QuantizationResult result;
    result.profile = fit(train);
    result.train = transform(train, result.profile, &result.train_stats);
    result.test = transform(test, result.profile, &result.test_stats);

    if (verbosity_ > 0 && result.test_stats.total_overflows() > 0) {
        std::printf("[quantization] %u test values outside the training range were clamped\n",
                    result.test_stats.total_overflows());
    }
    return result;
}

QuantizationResult QuantizationEngine::fit_and_transform(const FeatureMatrix& train,
                                                         const FeatureMatrix& test,
                                                         uint32_t bit_width) const {
    QuantizationEngine engine(*this);
    engine.config_.bit_width = bit_width;
    if (bit_width < 1 || bit_width > MAX_BIT_WIDTH) {
        throw std::invalid_argument("bit_width must be in [1, 31]");
    }
    return engine.fit_and_transform(train, test);
}

FeatureMatrix QuantizationEngine::dequantize(const CodeMatrix& codes,
                                             const QuantizationProfile& profile) const {
    if (codes.cols() != profile.n_features()) {
        throw std::invalid_argument("code matrix does not match quantization profile");
    }

    FeatureMatrix values(codes.rows(), codes.cols());
    const Index n_rows = static_cast<Index>(codes.rows());

    #pragma omp parallel for schedule(static) num_threads(n_threads_) if(n_rows > 4096)
    for (int64_t i = 0; i < static_cast<int64_t>(n_rows); ++i) {
        for (FeatureIndex f = 0; f < profile.n_features(); ++f) {
            values(i, f) = profile.dequantize(f, codes(i, f));
        }
    }
    return values;
}

} // namespace fixtree
