#pragma once

#include "errors.hpp"
#include "selection/candidate_pool.hpp"
#include "selection/selection_result.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// ---------------------------------------------------------------------------
// BudgetPolicy — metrology budget and mandatory-override predicates
//
// The effective cap is floor(total_budget / unit_cost), reduced to max_count
// when both are given. With neither, every candidate is selected.
// ---------------------------------------------------------------------------
struct BudgetPolicy {
    double unit_cost = 1.0;
    std::optional<double> total_budget;
    std::optional<int> max_count;
    std::vector<std::string> mandatory_predicates;

    void validate() const {
        if (!(unit_cost >= 0.0) || std::isinf(unit_cost)) {
            throw ConfigurationError("unit cost must be finite and non-negative");
        }
        if (total_budget) {
            if (!(*total_budget >= 0.0) || std::isinf(*total_budget)) {
                throw ConfigurationError("total budget must be finite and non-negative");
            }
            if (unit_cost <= 0.0) {
                throw ConfigurationError("total budget given with a zero unit cost");
            }
        }
        if (max_count && *max_count < 0) {
            throw ConfigurationError("max_count must be non-negative, got " +
                                     std::to_string(*max_count));
        }
    }

    std::optional<int> effective_cap() const {
        std::optional<int> cap;
        if (total_budget) {
            double affordable = std::floor(*total_budget / unit_cost + 1e-9);
            constexpr double int_max = std::numeric_limits<int>::max();
            cap = affordable >= int_max ? std::numeric_limits<int>::max()
                                        : static_cast<int>(affordable);
        }
        if (max_count) {
            cap = cap ? std::min(*cap, *max_count) : *max_count;
        }
        return cap;
    }
};

namespace budgeted_selection {

inline std::string mandatory_reason(const Candidate& c, const std::vector<size_t>& pred_cols,
                                    const std::vector<std::string>& names) {
    std::string reason;
    for (size_t i = 0; i < pred_cols.size(); ++i) {
        if (!c.predicates[pred_cols[i]]) continue;
        if (!reason.empty()) reason += ",";
        reason += names[i];
    }
    return reason;
}

inline RecordSelection to_row(const Candidate& c, bool selected, double cost, std::string reason) {
    RecordSelection s;
    s.row = c.row;
    s.id = c.id;
    s.selected = selected;
    s.cost = cost;
    s.score = c.severity;
    s.reason = std::move(reason);
    return s;
}

}  // namespace budgeted_selection

// Selects from the pool under the policy's cap. Mandatory candidates are
// always selected; when they alone reach the cap nothing else is added and
// budget_overrun is set. Returns a fresh (selected, remainder) pair.
inline SelectionResult budgeted_mandatory_select(const CandidatePool& pool,
                                                 const BudgetPolicy& policy) {
    policy.validate();

    std::vector<size_t> pred_cols;
    for (const auto& name : policy.mandatory_predicates) {
        size_t col = pool.predicate_names.size();
        for (size_t i = 0; i < pool.predicate_names.size(); ++i) {
            if (pool.predicate_names[i] == name) { col = i; break; }
        }
        if (col == pool.predicate_names.size()) {
            throw ConfigurationError("mandatory predicate '" + name + "' is not present");
        }
        pred_cols.push_back(col);
    }

    // Deduplicate by id, keeping the highest-severity occurrence.
    std::vector<Candidate> cands = pool.candidates;
    candidate_pool::sort_by_severity(cands);
    {
        std::unordered_set<std::string> seen;
        std::vector<Candidate> unique;
        unique.reserve(cands.size());
        for (auto& c : cands) {
            if (c.predicates.size() != pool.predicate_names.size()) {
                throw DataIntegrityError("candidate '" + c.id + "' predicate arity mismatch");
            }
            if (seen.insert(c.id).second) unique.push_back(std::move(c));
        }
        cands = std::move(unique);
    }

    std::vector<bool> is_mandatory(cands.size(), false);
    int n_mandatory = 0;
    for (size_t i = 0; i < cands.size(); ++i) {
        for (size_t col : pred_cols) {
            if (cands[i].predicates[col]) { is_mandatory[i] = true; break; }
        }
        if (is_mandatory[i]) ++n_mandatory;
    }

    auto cap = policy.effective_cap();

    SelectionResult result;
    result.method = "budgeted_mandatory";
    result.unit_cost = policy.unit_cost;
    result.cap = cap ? *cap : -1;

    std::vector<bool> take(cands.size(), false);
    if (!cap) {
        std::fill(take.begin(), take.end(), true);
    } else if (n_mandatory >= *cap) {
        take = is_mandatory;
        result.budget_overrun = true;
    } else {
        int remaining = *cap - n_mandatory;
        for (size_t i = 0; i < cands.size(); ++i) {
            if (is_mandatory[i]) {
                take[i] = true;
            } else if (remaining > 0) {
                take[i] = true;
                --remaining;
            }
        }
    }

    // cands is already severity-descending, so both lists come out in order.
    for (size_t i = 0; i < cands.size(); ++i) {
        if (take[i]) {
            std::string reason = budgeted_selection::mandatory_reason(
                cands[i], pred_cols, policy.mandatory_predicates);
            if (reason.empty()) reason = selection_reason::HIGH_SEVERITY;
            result.selected.push_back(
                budgeted_selection::to_row(cands[i], true, policy.unit_cost, std::move(reason)));
        } else {
            result.remainder.push_back(budgeted_selection::to_row(
                cands[i], false, 0.0, selection_reason::NOT_SELECTED_BUDGET));
        }
    }
    return result;
}

// Convenience: build the top-p pool from records, then select.
inline SelectionResult budgeted_mandatory_select(const RecordSet& records,
                                                 const CandidatePoolConfig& pool_cfg,
                                                 const BudgetPolicy& policy) {
    policy.validate();
    for (const auto& name : policy.mandatory_predicates) records.require_predicate(name);
    return budgeted_mandatory_select(build_candidate_pool(records, pool_cfg), policy);
}
