/**
 * FixTree Dataset Implementation
 */

#include "fixtree/dataset.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <cctype>

namespace fixtree {

namespace {

bool parse_row(const std::string& line, std::vector<Float>& row) {
    row.clear();
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        size_t consumed = 0;
        Float value = 0.0f;
        try {
            value = std::stof(cell, &consumed);
        } catch (const std::exception&) {
            return false;
        }
        // Allow trailing whitespace / carriage return only
        for (size_t i = consumed; i < cell.size(); ++i) {
            if (!std::isspace(static_cast<unsigned char>(cell[i]))) return false;
        }
        row.push_back(value);
    }
    return !row.empty();
}

} // namespace

// ============================================================================
// CSV Loading
// ============================================================================

LabeledData LabeledData::from_csv(const std::string& path, bool has_header) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + path);
    }

    std::vector<Float> values;
    std::vector<Float> targets;
    std::vector<Float> row;
    size_t n_columns = 0;
    size_t line_no = 0;
    bool header_pending = has_header;
    std::string line;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#' || line == "\r") continue;
        if (header_pending) {
            header_pending = false;
            continue;
        }

        if (!parse_row(line, row)) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": malformed CSV row");
        }
        if (n_columns == 0) {
            if (row.size() < 2) {
                throw std::runtime_error(path + ": need at least one feature and a target column");
            }
            n_columns = row.size();
        } else if (row.size() != n_columns) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(n_columns) + " columns, got " +
                                     std::to_string(row.size()));
        }

        values.insert(values.end(), row.begin(), row.end() - 1);
        targets.push_back(row.back());
    }

    LabeledData data;
    const Index n_rows = static_cast<Index>(targets.size());
    const Eigen::Index n_features = n_columns > 0 ? static_cast<Eigen::Index>(n_columns - 1) : 0;
    data.features = FeatureMatrix(n_rows, n_features);
    if (!values.empty()) {
        std::memcpy(data.features.data(), values.data(), values.size() * sizeof(Float));
    }
    data.targets = std::move(targets);
    return data;
}

// ============================================================================
// Dataset Construction
// ============================================================================

Dataset::Dataset(LabeledData train, LabeledData test)
    : train_(std::move(train)), test_(std::move(test)) {}

void Dataset::from_dense(
    const Float* train, const Float* train_labels, Index n_train,
    const Float* test, const Float* test_labels, Index n_test,
    FeatureIndex n_features
) {
    train_.features = Eigen::Map<const FeatureMatrix>(train, n_train, n_features);
    train_.targets.assign(train_labels, train_labels + n_train);

    test_.features = Eigen::Map<const FeatureMatrix>(test, n_test, n_features);
    test_.targets.assign(test_labels, test_labels + n_test);
}

Dataset Dataset::from_csv(const std::string& train_path, const std::string& test_path,
                          bool has_header) {
    Dataset dataset(LabeledData::from_csv(train_path, has_header),
                    LabeledData::from_csv(test_path, has_header));
    dataset.validate();
    return dataset;
}

void Dataset::validate() const {
    if (train_.features.rows() == 0) {
        throw std::invalid_argument("training partition is empty");
    }
    if (train_.features.cols() != test_.features.cols()) {
        throw std::invalid_argument("train and test partitions have different column counts (" +
                                    std::to_string(train_.features.cols()) + " vs " +
                                    std::to_string(test_.features.cols()) + ")");
    }
    if (static_cast<size_t>(train_.features.rows()) != train_.targets.size()) {
        throw std::invalid_argument("training features and targets have different row counts");
    }
    if (static_cast<size_t>(test_.features.rows()) != test_.targets.size()) {
        throw std::invalid_argument("test features and targets have different row counts");
    }
}

} // namespace fixtree
