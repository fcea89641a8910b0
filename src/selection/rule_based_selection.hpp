#pragma once

#include "errors.hpp"
#include "records/record.hpp"
#include "selection/random_selection.hpp"
#include "selection/selection_result.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RuleBasedSelectionConfig — top floor(N*rate) by a named risk column
// ---------------------------------------------------------------------------
struct RuleBasedSelectionConfig {
    double rate = 0.10;
    std::string risk_column = "risk_score";
    double unit_cost = 1.0;
};

namespace selection {

// Rows ordered by score descending; equal scores keep original row order.
inline std::vector<size_t> rank_descending(const std::vector<double>& scores) {
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return scores[a] > scores[b];
    });
    return order;
}

inline SelectionResult rule_based_select(const RecordSet& records,
                                         const RuleBasedSelectionConfig& cfg) {
    check_rate(cfg.rate);
    check_unit_cost(cfg.unit_cost);
    size_t col = records.require_score(cfg.risk_column);
    records.validate();

    size_t n = records.size();
    std::vector<double> scores;
    scores.reserve(n);
    for (const auto& r : records.records) {
        if (std::isnan(r.scores[col])) {
            throw DataIntegrityError("record '" + r.id + "' has NaN " + cfg.risk_column);
        }
        scores.push_back(r.scores[col]);
    }

    auto order = rank_descending(scores);
    size_t n_select = static_cast<size_t>(count_for_rate(n, cfg.rate));

    SelectionResult result;
    result.method = "rulebased";
    result.unit_cost = cfg.unit_cost;
    result.cap = static_cast<int>(n_select);

    for (size_t rank = 0; rank < n; ++rank) {
        size_t row = order[rank];
        RecordSelection s;
        s.row = row;
        s.id = records.records[row].id;
        s.score = scores[row];
        if (rank < n_select) {
            s.selected = true;
            s.cost = cfg.unit_cost;
            s.reason = selection_reason::TOP_RISK_SCORE;
            result.selected.push_back(std::move(s));
        } else {
            s.reason = selection_reason::NOT_SELECTED;
            result.remainder.push_back(std::move(s));
        }
    }
    return result;
}

}  // namespace selection
