#pragma once

#include "errors.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

// ---------------------------------------------------------------------------
// Record — one unit under test (wafer)
//
// scores and predicates are positional; their names live on the owning
// RecordSet so every record of a set shares one column layout.
// ---------------------------------------------------------------------------
struct Record {
    std::string id;
    double outcome = std::numeric_limits<double>::quiet_NaN();  // yield
    std::vector<double> scores;
    std::vector<bool> predicates;
    std::string predicted_label;
};

// ---------------------------------------------------------------------------
// RecordSet — ordered records plus named score and predicate columns
// ---------------------------------------------------------------------------
struct RecordSet {
    std::string outcome_name = "yield";
    bool has_outcome = true;
    std::vector<std::string> score_names;
    std::vector<std::string> predicate_names;
    std::vector<Record> records;

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }

    // -1 when absent.
    int score_index(const std::string& name) const {
        for (size_t i = 0; i < score_names.size(); ++i) {
            if (score_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    int predicate_index(const std::string& name) const {
        for (size_t i = 0; i < predicate_names.size(); ++i) {
            if (predicate_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    size_t require_score(const std::string& name) const {
        int idx = score_index(name);
        if (idx < 0) {
            throw ConfigurationError("score column '" + name + "' is not present");
        }
        return static_cast<size_t>(idx);
    }

    size_t require_predicate(const std::string& name) const {
        int idx = predicate_index(name);
        if (idx < 0) {
            throw ConfigurationError("mandatory predicate '" + name + "' is not present");
        }
        return static_cast<size_t>(idx);
    }

    std::vector<double> outcomes() const {
        if (!has_outcome) {
            throw ConfigurationError("outcome column '" + outcome_name + "' is not present");
        }
        std::vector<double> out;
        out.reserve(records.size());
        for (const auto& r : records) out.push_back(r.outcome);
        return out;
    }

    std::vector<double> score_column(const std::string& name) const {
        size_t idx = require_score(name);
        std::vector<double> out;
        out.reserve(records.size());
        for (const auto& r : records) out.push_back(r.scores[idx]);
        return out;
    }

    std::vector<std::string> ids() const {
        std::vector<std::string> out;
        out.reserve(records.size());
        for (const auto& r : records) out.push_back(r.id);
        return out;
    }

    // Throws DataIntegrityError on an empty set, duplicate identifiers or a
    // record whose score/predicate arity disagrees with the column names.
    void validate() const {
        if (records.empty()) {
            throw DataIntegrityError("record set is empty");
        }
        std::unordered_set<std::string> seen;
        seen.reserve(records.size());
        for (const auto& r : records) {
            if (!seen.insert(r.id).second) {
                throw DataIntegrityError("duplicate record identifier '" + r.id + "'");
            }
            if (r.scores.size() != score_names.size()) {
                throw DataIntegrityError("record '" + r.id + "' has " +
                                         std::to_string(r.scores.size()) + " scores, expected " +
                                         std::to_string(score_names.size()));
            }
            if (r.predicates.size() != predicate_names.size()) {
                throw DataIntegrityError("record '" + r.id + "' has " +
                                         std::to_string(r.predicates.size()) +
                                         " predicates, expected " +
                                         std::to_string(predicate_names.size()));
            }
        }
    }
};
