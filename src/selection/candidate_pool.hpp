#pragma once

#include "analysis/statistical_tests.hpp"
#include "errors.hpp"
#include "records/record.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Candidate — a record eligible for the budgeted metrology step
// ---------------------------------------------------------------------------
struct Candidate {
    size_t row = 0;
    std::string id;
    double severity = 0.0;
    std::vector<bool> predicates;   // aligned with CandidatePool::predicate_names
    std::string predicted_label;
};

// ---------------------------------------------------------------------------
// CandidatePoolConfig — top-p severity cut and physical-damage routing
// ---------------------------------------------------------------------------
struct CandidatePoolConfig {
    double top_p = 0.10;
    std::string severity_column = "severity";
    std::string physical_damage_label = "Scratch";   // empty disables routing

    void validate() const {
        if (!(top_p > 0.0 && top_p <= 1.0)) {
            throw ConfigurationError("candidate top_p must be in (0, 1], got " +
                                     std::to_string(top_p));
        }
        if (severity_column.empty()) {
            throw ConfigurationError("candidate severity column name is empty");
        }
    }
};

// ---------------------------------------------------------------------------
// CandidatePool — candidates (severity descending) and the records routed
// away from metrology because their predicted label is physical damage
// ---------------------------------------------------------------------------
struct CandidatePool {
    std::string severity_column = "severity";
    double severity_threshold = 0.0;
    std::vector<std::string> predicate_names;
    std::vector<Candidate> candidates;
    std::vector<Candidate> physical_damage;

    size_t size() const { return candidates.size(); }
};

namespace candidate_pool {

inline void sort_by_severity(std::vector<Candidate>& cands) {
    std::stable_sort(cands.begin(), cands.end(), [](const Candidate& a, const Candidate& b) {
        return a.severity > b.severity;
    });
}

// Every record as a candidate, no severity cut and no routing.
inline CandidatePool from_records(const RecordSet& records, const std::string& severity_column) {
    size_t col = records.require_score(severity_column);
    records.validate();

    CandidatePool pool;
    pool.severity_column = severity_column;
    pool.predicate_names = records.predicate_names;
    pool.severity_threshold = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records.records[i];
        pool.candidates.push_back({i, r.id, r.scores[col], r.predicates, r.predicted_label});
    }
    sort_by_severity(pool.candidates);
    return pool;
}

}  // namespace candidate_pool

// Records with severity >= the (1 - top_p) quantile of the severity column.
inline CandidatePool build_candidate_pool(const RecordSet& records,
                                          const CandidatePoolConfig& cfg) {
    cfg.validate();
    size_t col = records.require_score(cfg.severity_column);
    records.validate();

    std::vector<double> severity;
    severity.reserve(records.size());
    for (const auto& r : records.records) {
        if (std::isnan(r.scores[col])) {
            throw DataIntegrityError("record '" + r.id + "' has NaN " + cfg.severity_column);
        }
        severity.push_back(r.scores[col]);
    }

    CandidatePool pool;
    pool.severity_column = cfg.severity_column;
    pool.predicate_names = records.predicate_names;
    pool.severity_threshold = percentile(severity, 100.0 * (1.0 - cfg.top_p));

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records.records[i];
        if (severity[i] < pool.severity_threshold) continue;
        Candidate c{i, r.id, severity[i], r.predicates, r.predicted_label};
        if (!cfg.physical_damage_label.empty() && r.predicted_label == cfg.physical_damage_label) {
            pool.physical_damage.push_back(std::move(c));
        } else {
            pool.candidates.push_back(std::move(c));
        }
    }
    candidate_pool::sort_by_severity(pool.candidates);
    candidate_pool::sort_by_severity(pool.physical_damage);
    return pool;
}
