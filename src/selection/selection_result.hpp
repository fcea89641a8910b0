#pragma once

#include "errors.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace selection_reason {
    constexpr const char* RANDOM_SAMPLE        = "random_sample";
    constexpr const char* TOP_RISK_SCORE       = "top_risk_score";
    constexpr const char* HIGH_SEVERITY        = "high-severity";
    constexpr const char* NOT_SELECTED         = "not_selected";
    constexpr const char* NOT_SELECTED_BUDGET  = "not selected: budget";
}  // namespace selection_reason

// ---------------------------------------------------------------------------
// RecordSelection — one row of a selection table
// ---------------------------------------------------------------------------
struct RecordSelection {
    size_t row = 0;          // index into the evaluated RecordSet
    std::string id;
    bool selected = false;
    double cost = 0.0;
    double score = 0.0;      // ranking key the policy used (0 for random)
    std::string reason;
};

// ---------------------------------------------------------------------------
// SelectionResult — output of one selection policy
//
// `selected` is in policy order (rank order for ranked policies). `remainder`
// lists every considered-but-unselected record with cost 0.
// ---------------------------------------------------------------------------
struct SelectionResult {
    std::string method;
    double unit_cost = 1.0;
    bool budget_overrun = false;
    int cap = -1;            // effective cap, -1 when unbounded
    std::vector<RecordSelection> selected;
    std::vector<RecordSelection> remainder;

    int n_selected() const { return static_cast<int>(selected.size()); }

    double total_cost() const {
        double total = 0.0;
        for (const auto& s : selected) total += s.cost;
        return total;
    }

    // Per-row selected flag over a record set of n_total rows.
    std::vector<bool> mask(size_t n_total) const {
        std::vector<bool> flags(n_total, false);
        for (const auto& s : selected) {
            if (s.row >= n_total) {
                throw DataIntegrityError("selection row " + std::to_string(s.row) +
                                         " outside record set of size " +
                                         std::to_string(n_total));
            }
            flags[s.row] = true;
        }
        return flags;
    }

    std::vector<size_t> selected_rows() const {
        std::vector<size_t> rows;
        rows.reserve(selected.size());
        for (const auto& s : selected) rows.push_back(s.row);
        return rows;
    }

    // selected followed by remainder.
    std::vector<RecordSelection> table() const {
        std::vector<RecordSelection> all = selected;
        all.insert(all.end(), remainder.begin(), remainder.end());
        return all;
    }
};

namespace selection {

inline void check_rate(double rate) {
    if (!(rate > 0.0 && rate <= 1.0)) {
        throw ConfigurationError("selection rate must be in (0, 1], got " + std::to_string(rate));
    }
}

inline void check_unit_cost(double unit_cost) {
    if (!(unit_cost >= 0.0)) {
        throw ConfigurationError("unit cost must be non-negative, got " + std::to_string(unit_cost));
    }
}

}  // namespace selection
