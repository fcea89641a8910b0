#pragma once

#include "errors.hpp"
#include "records/record.hpp"

#include <cmath>
#include <string>
#include <vector>

// Row-major feature matrix, one row per record.
using FeatureMatrix = std::vector<std::vector<float>>;

// ---------------------------------------------------------------------------
// RiskScorer — injected prediction model; one score per feature row
// ---------------------------------------------------------------------------
class RiskScorer {
public:
    virtual ~RiskScorer() = default;
    virtual std::vector<double> predict(const FeatureMatrix& features) const = 0;
};

inline FeatureMatrix feature_matrix(const RecordSet& records,
                                    const std::vector<std::string>& feature_columns) {
    if (feature_columns.empty()) {
        throw ConfigurationError("no feature columns given");
    }
    std::vector<size_t> cols;
    for (const auto& name : feature_columns) cols.push_back(records.require_score(name));

    FeatureMatrix m;
    m.reserve(records.size());
    for (const auto& r : records.records) {
        std::vector<float> row;
        row.reserve(cols.size());
        for (size_t c : cols) row.push_back(static_cast<float>(r.scores[c]));
        m.push_back(std::move(row));
    }
    return m;
}

// Copy of `records` with the scorer's output appended as `output_column`.
inline RecordSet attach_scores(const RecordSet& records, const RiskScorer& scorer,
                               const std::vector<std::string>& feature_columns,
                               const std::string& output_column) {
    if (records.score_index(output_column) >= 0) {
        throw ConfigurationError("score column '" + output_column + "' already exists");
    }
    records.validate();
    auto scores = scorer.predict(feature_matrix(records, feature_columns));
    if (scores.size() != records.size()) {
        throw DataIntegrityError("scorer returned " + std::to_string(scores.size()) +
                                 " scores for " + std::to_string(records.size()) + " records");
    }

    RecordSet out = records;
    out.score_names.push_back(output_column);
    for (size_t i = 0; i < out.records.size(); ++i) {
        if (std::isnan(scores[i])) {
            throw DataIntegrityError("scorer returned NaN for record '" + out.records[i].id + "'");
        }
        out.records[i].scores.push_back(scores[i]);
    }
    return out;
}
