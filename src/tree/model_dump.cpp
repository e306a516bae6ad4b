/**
 * FixTree Model Dump Reader / Writer
 */

#include "fixtree/model_dump.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fixtree {

namespace {

class DumpReader {
public:
    explicit DumpReader(std::istream& in) : in_(in) {}

    // Next non-empty, non-comment line; false at end of input
    bool next(std::string& line) {
        while (std::getline(in_, line)) {
            ++line_no_;
            size_t hash = line.find('#');
            if (hash != std::string::npos) line.erase(hash);
            if (line.find_first_not_of(" \t\r") != std::string::npos) return true;
        }
        return false;
    }

    // "key: rest of line"
    std::string value(const std::string& key) {
        std::string line;
        if (!next(line)) fail("missing '" + key + ":'");
        std::istringstream ls(line);
        std::string token;
        ls >> token;
        if (token != key + ":") fail("expected '" + key + ":', got '" + token + "'");
        std::string rest;
        std::getline(ls, rest);
        size_t start = rest.find_first_not_of(" \t");
        rest = start == std::string::npos ? std::string() : rest.substr(start);
        while (!rest.empty() && (rest.back() == '\r' || rest.back() == ' ' || rest.back() == '\t')) {
            rest.pop_back();
        }
        return rest;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw std::runtime_error("model dump line " + std::to_string(line_no_) + ": " + message);
    }

private:
    std::istream& in_;
    size_t line_no_ = 0;
};

template <typename T>
T parse_number(DumpReader& reader, const std::string& text) {
    std::istringstream ss(text);
    T value{};
    ss >> value;
    if (ss.fail()) reader.fail("not a number: '" + text + "'");
    std::string extra;
    if (ss >> extra) reader.fail("unexpected trailing text '" + extra + "'");
    return value;
}

} // namespace

// ============================================================================
// TreeDump Builders
// ============================================================================

void TreeDump::add_split(int32_t left, int32_t right, int32_t feat, Double thr,
                         std::vector<Double> node_value) {
    children_left.push_back(left);
    children_right.push_back(right);
    feature.push_back(feat);
    threshold.push_back(thr);
    value.push_back(std::move(node_value));
}

void TreeDump::add_leaf(std::vector<Double> node_value) {
    children_left.push_back(-1);
    children_right.push_back(-1);
    feature.push_back(-2);
    threshold.push_back(-2.0);
    value.push_back(std::move(node_value));
}

// ============================================================================
// Writing
// ============================================================================

void ModelDump::write(std::ostream& out) const {
    out << std::setprecision(std::numeric_limits<Double>::max_digits10);
    out << "model_type: " << model_type << "\n";
    out << "n_features: " << n_features << "\n";
    if (!classes.empty()) {
        out << "classes:";
        for (Float c : classes) out << " " << c;
        out << "\n";
    }
    out << "comparison: " << to_string(comparison) << "\n";
    out << "threshold_domain: " << to_string(threshold_domain) << "\n";
    out << "n_estimators: " << estimators.size() << "\n";

    for (const TreeDump& tree : estimators) {
        out << "tree: " << tree.n_nodes() << "\n";
        for (size_t n = 0; n < tree.n_nodes(); ++n) {
            out << tree.children_left[n] << " " << tree.children_right[n] << " "
                << tree.feature[n] << " " << tree.threshold[n];
            for (Double v : tree.value[n]) out << " " << v;
            out << "\n";
        }
    }
}

void ModelDump::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    write(out);
    if (!out) {
        throw std::runtime_error("Failed writing model dump: " + path);
    }
}

// ============================================================================
// Reading
// ============================================================================

ModelDump ModelDump::read(std::istream& in) {
    DumpReader reader(in);
    ModelDump dump;

    dump.model_type = reader.value("model_type");
    if (dump.model_type.empty()) reader.fail("empty model_type");

    long long n_features = parse_number<long long>(reader, reader.value("n_features"));
    if (n_features <= 0 || n_features > std::numeric_limits<FeatureIndex>::max()) {
        reader.fail("n_features out of range");
    }
    dump.n_features = static_cast<FeatureIndex>(n_features);

    // Optional header keys, in any order, until n_estimators
    std::string line;
    size_t n_estimators = 0;
    while (true) {
        if (!reader.next(line)) reader.fail("missing 'n_estimators:'");
        std::istringstream ls(line);
        std::string key;
        ls >> key;

        if (key == "classes:") {
            Float c;
            while (ls >> c) dump.classes.push_back(c);
            if (!ls.eof()) reader.fail("malformed class label list");
            if (dump.classes.empty()) reader.fail("empty class label list");
        } else if (key == "comparison:") {
            std::string v;
            ls >> v;
            if (v == "le") dump.comparison = Comparison::LessEqual;
            else if (v == "lt") dump.comparison = Comparison::Less;
            else reader.fail("comparison must be 'le' or 'lt'");
        } else if (key == "threshold_domain:") {
            std::string v;
            ls >> v;
            if (v == "raw") dump.threshold_domain = ThresholdDomain::Raw;
            else if (v == "code") dump.threshold_domain = ThresholdDomain::Code;
            else reader.fail("threshold_domain must be 'raw' or 'code'");
        } else if (key == "n_estimators:") {
            std::string v;
            std::getline(ls, v);
            long long count = parse_number<long long>(reader, v);
            if (count < 0) reader.fail("negative n_estimators");
            n_estimators = static_cast<size_t>(count);
            break;
        } else {
            reader.fail("unknown key '" + key + "'");
        }
    }

    dump.estimators.resize(n_estimators);
    for (size_t t = 0; t < n_estimators; ++t) {
        long long count = parse_number<long long>(reader, reader.value("tree"));
        if (count <= 0) reader.fail("tree needs at least one node");
        const size_t n_nodes = static_cast<size_t>(count);

        TreeDump& tree = dump.estimators[t];
        for (size_t n = 0; n < n_nodes; ++n) {
            if (!reader.next(line)) reader.fail("expected " + std::to_string(n_nodes) + " node lines");
            std::istringstream ls(line);
            int32_t left, right, feature;
            Double threshold;
            if (!(ls >> left >> right >> feature >> threshold)) {
                reader.fail("node line needs: left right feature threshold value...");
            }
            std::vector<Double> value;
            Double v;
            while (ls >> v) value.push_back(v);
            if (!ls.eof()) reader.fail("malformed node value list");

            tree.children_left.push_back(left);
            tree.children_right.push_back(right);
            tree.feature.push_back(feature);
            tree.threshold.push_back(threshold);
            tree.value.push_back(std::move(value));
        }
    }

    if (reader.next(line)) reader.fail("unexpected content after last tree");
    return dump;
}

ModelDump ModelDump::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + path);
    }
    return read(in);
}

} // namespace fixtree
