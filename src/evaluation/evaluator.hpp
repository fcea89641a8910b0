#pragma once

#include "analysis/statistical_tests.hpp"
#include "errors.hpp"
#include "labeling/risk_labeler.hpp"
#include "records/record.hpp"
#include "selection/selection_result.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Metrics — confusion matrix, detection rates, cost and yield summaries
//
// Rates are 0.0 (never NaN) when their denominator is 0. cost_per_catch is
// +inf when tp == 0.
// ---------------------------------------------------------------------------
struct Metrics {
    std::string method;

    int n_total = 0;
    int n_high_risk = 0;
    int n_selected = 0;
    int tp = 0;
    int fp = 0;
    int fn = 0;
    int tn = 0;

    double recall = 0.0;
    double precision = 0.0;
    double f1 = 0.0;
    double specificity = 0.0;
    double false_positive_rate = 0.0;
    double selection_rate = 0.0;

    double unit_cost = 1.0;
    double total_cost = 0.0;
    double cost_per_catch = std::numeric_limits<double>::infinity();
    double cost_per_inspection = 0.0;

    double avg_yield_all = 0.0;
    double avg_yield_selected = 0.0;
    double avg_yield_not_selected = 0.0;
    double yield_std = 0.0;
    double yield_q25 = 0.0;
    double yield_q50 = 0.0;
    double yield_q75 = 0.0;
};

// ---------------------------------------------------------------------------
// NormalizedMetrics — currency-free view of Metrics
// ---------------------------------------------------------------------------
struct NormalizedMetrics {
    std::string method;
    int n_total = 0;
    int n_high_risk = 0;
    int inspections = 0;
    int tp = 0;
    double selection_rate = 0.0;
    double recall = 0.0;
    double precision = 0.0;
    double f1 = 0.0;
    double inspections_per_catch = std::numeric_limits<double>::infinity();
};

// ---------------------------------------------------------------------------
// MethodDelta — one row of a compare_methods table
// ---------------------------------------------------------------------------
struct MethodDelta {
    std::string method;
    int n_selected = 0;
    double selection_rate = 0.0;
    double recall = 0.0;
    double precision = 0.0;
    double f1 = 0.0;
    double cost_per_catch = 0.0;
    int missed_high_risk = 0;
    int delta_selected = 0;
    double delta_cost_pct = 0.0;
    double delta_recall = 0.0;
};

namespace evaluator {

inline double safe_ratio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

}  // namespace evaluator

inline Metrics evaluate(const std::vector<double>& outcomes,
                        const std::vector<bool>& high_risk,
                        const std::vector<bool>& selected,
                        double unit_cost,
                        const std::string& method = "") {
    size_t n = outcomes.size();
    if (high_risk.size() != n || selected.size() != n) {
        throw DataIntegrityError("evaluate: mask lengths (" + std::to_string(high_risk.size()) +
                                 ", " + std::to_string(selected.size()) +
                                 ") do not match record count " + std::to_string(n));
    }
    if (n == 0) {
        throw DataIntegrityError("evaluate: empty record set");
    }
    if (!(unit_cost >= 0.0)) {
        throw ConfigurationError("unit cost must be non-negative");
    }

    Metrics m;
    m.method = method;
    m.n_total = static_cast<int>(n);
    m.unit_cost = unit_cost;

    std::vector<double> sel_yields;
    std::vector<double> unsel_yields;
    for (size_t i = 0; i < n; ++i) {
        bool hr = high_risk[i];
        bool s = selected[i];
        if (hr && s) ++m.tp;
        else if (hr) ++m.fn;
        else if (s) ++m.fp;
        else ++m.tn;
        (s ? sel_yields : unsel_yields).push_back(outcomes[i]);
    }
    m.n_high_risk = m.tp + m.fn;
    m.n_selected = m.tp + m.fp;

    using evaluator::safe_ratio;
    m.recall = safe_ratio(m.tp, m.tp + m.fn);
    m.precision = safe_ratio(m.tp, m.tp + m.fp);
    m.f1 = safe_ratio(2.0 * m.precision * m.recall, m.precision + m.recall);
    m.specificity = safe_ratio(m.tn, m.tn + m.fp);
    m.false_positive_rate = safe_ratio(m.fp, m.fp + m.tn);
    m.selection_rate = safe_ratio(m.n_selected, m.n_total);

    m.total_cost = m.n_selected * unit_cost;
    m.cost_per_catch = m.tp > 0 ? m.total_cost / m.tp : std::numeric_limits<double>::infinity();
    m.cost_per_inspection = m.n_selected > 0 ? m.total_cost / m.n_selected : 0.0;

    m.avg_yield_all = mean_of(outcomes);
    m.avg_yield_selected = mean_of(sel_yields);
    m.avg_yield_not_selected = mean_of(unsel_yields);
    m.yield_std = std_of(outcomes);
    m.yield_q25 = percentile(outcomes, 25.0);
    m.yield_q50 = percentile(outcomes, 50.0);
    m.yield_q75 = percentile(outcomes, 75.0);
    return m;
}

inline Metrics evaluate(const RecordSet& records,
                        const HighRiskLabels& labels,
                        const SelectionResult& selection) {
    auto outcomes = records.outcomes();
    return evaluate(outcomes, labels.mask, selection.mask(records.size()),
                    selection.unit_cost, selection.method);
}

inline NormalizedMetrics normalize(const Metrics& m) {
    NormalizedMetrics n;
    n.method = m.method;
    n.n_total = m.n_total;
    n.n_high_risk = m.n_high_risk;
    n.inspections = m.n_selected;
    n.tp = m.tp;
    n.selection_rate = m.selection_rate;
    n.recall = m.recall;
    n.precision = m.precision;
    n.f1 = m.f1;
    n.inspections_per_catch = m.tp > 0 ? static_cast<double>(m.n_selected) / m.tp
                                       : std::numeric_limits<double>::infinity();
    return n;
}

// Deltas of every method relative to the first. delta_cost_pct is 0 when the
// first method has zero cost.
inline std::vector<MethodDelta> compare_methods(const std::vector<Metrics>& methods) {
    std::vector<MethodDelta> rows;
    if (methods.empty()) return rows;
    const Metrics& base = methods.front();
    for (const auto& m : methods) {
        MethodDelta d;
        d.method = m.method;
        d.n_selected = m.n_selected;
        d.selection_rate = m.selection_rate;
        d.recall = m.recall;
        d.precision = m.precision;
        d.f1 = m.f1;
        d.cost_per_catch = m.cost_per_catch;
        d.missed_high_risk = m.fn;
        d.delta_selected = m.n_selected - base.n_selected;
        d.delta_cost_pct = base.total_cost > 0.0
                               ? (m.total_cost - base.total_cost) / base.total_cost * 100.0
                               : 0.0;
        d.delta_recall = m.recall - base.recall;
        rows.push_back(d);
    }
    return rows;
}
