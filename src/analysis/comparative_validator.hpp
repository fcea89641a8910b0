#pragma once

#include "analysis/statistical_tests.hpp"
#include "errors.hpp"
#include "evaluation/evaluator.hpp"
#include "labeling/risk_labeler.hpp"
#include "records/record.hpp"
#include "selection/selection_result.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CostForm — how cost intervals are emitted
//
// NORMALIZED reports percentages only. ABSOLUTE additionally fills the
// unit-cost interval, for internal consumers.
// ---------------------------------------------------------------------------
enum class CostForm { NORMALIZED, ABSOLUTE };

inline const char* to_string(CostForm f) {
    return f == CostForm::NORMALIZED ? "normalized" : "absolute";
}

// ---------------------------------------------------------------------------
// BootstrapConfig / ComparisonConfig
// ---------------------------------------------------------------------------
struct BootstrapConfig {
    int iterations = 10000;
    uint32_t seed = 42;
    double confidence = 0.95;

    void validate() const {
        if (iterations < 1) {
            throw ConfigurationError("bootstrap iterations must be >= 1, got " +
                                     std::to_string(iterations));
        }
        if (!(confidence > 0.0 && confidence < 1.0)) {
            throw ConfigurationError("bootstrap confidence must be in (0, 1)");
        }
    }
};

struct ComparisonConfig {
    double alpha = 0.05;
    double min_expected_count = 5.0;
    BootstrapConfig bootstrap;
    CostForm cost_form = CostForm::NORMALIZED;

    void validate() const {
        if (!(alpha > 0.0 && alpha < 1.0)) {
            throw ConfigurationError("alpha must be in (0, 1)");
        }
        bootstrap.validate();
    }
};

struct Interval {
    double lower = 0.0;
    double upper = 0.0;

    bool contains(double v) const { return lower <= v && v <= upper; }
    bool excludes_zero() const { return lower > 0.0 || upper < 0.0; }
};

// ---------------------------------------------------------------------------
// CostBootstrapResult — baseline minus candidate cost; positive means the
// candidate is cheaper
// ---------------------------------------------------------------------------
struct CostBootstrapResult {
    TestStatus status = TestStatus::OK;
    std::string note;
    int n_bootstrap = 0;
    int n_samples = 0;
    double confidence = 0.95;

    double percent_reduction = 0.0;
    Interval percent_ci;
    double p_value = 1.0;
    bool significant = false;

    std::optional<double> observed_diff;          // ABSOLUTE only
    std::optional<double> bootstrap_std;          // ABSOLUTE only
    std::optional<Interval> absolute_ci;          // ABSOLUTE only
};

// ---------------------------------------------------------------------------
// RecallBootstrapResult — candidate recall minus baseline recall
// ---------------------------------------------------------------------------
struct RecallBootstrapResult {
    TestStatus status = TestStatus::OK;
    std::string note;
    int n_bootstrap = 0;
    int n_high_risk = 0;
    double confidence = 0.95;

    double baseline_recall = 0.0;
    double candidate_recall = 0.0;
    double observed_diff = 0.0;
    Interval ci;
    bool significant = false;
};

// ---------------------------------------------------------------------------
// ComparisonResult — baseline vs candidate on one record set and ground truth
// ---------------------------------------------------------------------------
struct ComparisonResult {
    std::string baseline_method;
    std::string candidate_method;
    int n_total = 0;
    int n_high_risk = 0;
    double alpha = 0.05;

    TTestResult yield_test;              // a = baseline selected yields
    ContingencyResult detection_test;    // rows: baseline, candidate; cols: tp, fn
    double odds_ratio = 0.0;
    TestResult mcnemar;
    int mcnemar_b = 0;                   // baseline right, candidate wrong
    int mcnemar_c = 0;                   // baseline wrong, candidate right
    CostBootstrapResult cost;
    RecallBootstrapResult recall;

    double baseline_recall = 0.0;
    double candidate_recall = 0.0;
    double delta_recall = 0.0;
    int delta_selected = 0;
    double delta_cost_pct = 0.0;
};

namespace comparison {

inline std::vector<double> cost_vector(const SelectionResult& sel, size_t n) {
    std::vector<double> costs(n, 0.0);
    for (const auto& s : sel.selected) {
        if (s.row >= n) {
            throw DataIntegrityError("selection row outside record set");
        }
        costs[s.row] = s.cost;
    }
    return costs;
}

inline double pct_reduction(double baseline, double candidate) {
    return baseline > 0.0 ? (baseline - candidate) / baseline * 100.0 : 0.0;
}

inline std::vector<size_t> draw(std::mt19937& rng, size_t n) {
    std::uniform_int_distribution<size_t> pick(0, n - 1);
    std::vector<size_t> idx(n);
    for (auto& i : idx) i = pick(rng);
    return idx;
}

}  // namespace comparison

// Resamples per-record cost pairs with replacement.
inline CostBootstrapResult bootstrap_cost_ci(const std::vector<double>& baseline_costs,
                                             const std::vector<double>& candidate_costs,
                                             const BootstrapConfig& cfg,
                                             CostForm form = CostForm::NORMALIZED) {
    cfg.validate();
    if (baseline_costs.size() != candidate_costs.size()) {
        throw DataIntegrityError("bootstrap_cost_ci: cost vectors differ in length");
    }
    CostBootstrapResult r;
    size_t n = baseline_costs.size();
    r.n_samples = static_cast<int>(n);
    r.n_bootstrap = cfg.iterations;
    r.confidence = cfg.confidence;
    if (n == 0) {
        r.status = TestStatus::INSUFFICIENT_DATA;
        r.note = "empty record set";
        return r;
    }

    double base_total = 0.0, cand_total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        base_total += baseline_costs[i];
        cand_total += candidate_costs[i];
    }
    double observed = base_total - cand_total;
    r.percent_reduction = comparison::pct_reduction(base_total, cand_total);

    std::mt19937 rng(cfg.seed);
    std::vector<double> diffs;
    std::vector<double> pcts;
    diffs.reserve(cfg.iterations);
    pcts.reserve(cfg.iterations);
    for (int it = 0; it < cfg.iterations; ++it) {
        double b = 0.0, c = 0.0;
        for (size_t i : comparison::draw(rng, n)) {
            b += baseline_costs[i];
            c += candidate_costs[i];
        }
        diffs.push_back(b - c);
        pcts.push_back(comparison::pct_reduction(b, c));
    }

    double tail = (1.0 - cfg.confidence) / 2.0 * 100.0;
    Interval abs_ci{percentile(diffs, tail), percentile(diffs, 100.0 - tail)};
    r.percent_ci = {percentile(pcts, tail), percentile(pcts, 100.0 - tail)};
    r.significant = abs_ci.excludes_zero();

    int extreme = 0;
    for (double d : diffs) {
        if (observed > 0.0 ? d <= 0.0 : d >= 0.0) ++extreme;
    }
    r.p_value = static_cast<double>(extreme) / diffs.size();

    if (form == CostForm::ABSOLUTE) {
        r.observed_diff = observed;
        r.bootstrap_std = std_of(diffs);
        r.absolute_ci = abs_ci;
    }
    return r;
}

// Resamples (baseline, candidate, ground truth) triples; recall of a draw
// with no high-risk records is 0.
inline RecallBootstrapResult bootstrap_recall_ci(const std::vector<bool>& baseline_selected,
                                                 const std::vector<bool>& candidate_selected,
                                                 const std::vector<bool>& high_risk,
                                                 const BootstrapConfig& cfg) {
    cfg.validate();
    size_t n = high_risk.size();
    if (baseline_selected.size() != n || candidate_selected.size() != n) {
        throw DataIntegrityError("bootstrap_recall_ci: mask lengths differ");
    }
    RecallBootstrapResult r;
    r.n_bootstrap = cfg.iterations;
    r.confidence = cfg.confidence;

    auto recall_of = [&](const std::vector<size_t>* idx, const std::vector<bool>& sel) {
        int tp = 0, pos = 0;
        size_t m = idx ? idx->size() : n;
        for (size_t k = 0; k < m; ++k) {
            size_t i = idx ? (*idx)[k] : k;
            if (!high_risk[i]) continue;
            ++pos;
            if (sel[i]) ++tp;
        }
        return pos > 0 ? static_cast<double>(tp) / pos : 0.0;
    };

    for (size_t i = 0; i < n; ++i) {
        if (high_risk[i]) ++r.n_high_risk;
    }
    if (r.n_high_risk == 0) {
        r.status = TestStatus::INSUFFICIENT_DATA;
        r.note = "no high-risk records";
        return r;
    }

    r.baseline_recall = recall_of(nullptr, baseline_selected);
    r.candidate_recall = recall_of(nullptr, candidate_selected);
    r.observed_diff = r.candidate_recall - r.baseline_recall;

    std::mt19937 rng(cfg.seed);
    std::vector<double> diffs;
    diffs.reserve(cfg.iterations);
    for (int it = 0; it < cfg.iterations; ++it) {
        auto idx = comparison::draw(rng, n);
        diffs.push_back(recall_of(&idx, candidate_selected) - recall_of(&idx, baseline_selected));
    }
    double tail = (1.0 - cfg.confidence) / 2.0 * 100.0;
    r.ci = {percentile(diffs, tail), percentile(diffs, 100.0 - tail)};
    r.significant = r.ci.excludes_zero();
    return r;
}

// ---------------------------------------------------------------------------
// compare — every test between two selections of the same record set. A
// degenerate test is reported as INSUFFICIENT_DATA; the others still run.
// ---------------------------------------------------------------------------
inline ComparisonResult compare(const RecordSet& records,
                                const HighRiskLabels& labels,
                                const SelectionResult& baseline,
                                const SelectionResult& candidate,
                                const ComparisonConfig& cfg = {}) {
    cfg.validate();
    size_t n = records.size();
    if (labels.mask.size() != n) {
        throw DataIntegrityError("ground-truth mask length " + std::to_string(labels.mask.size()) +
                                 " does not match record count " + std::to_string(n));
    }
    auto outcomes = records.outcomes();
    auto base_sel = baseline.mask(n);
    auto cand_sel = candidate.mask(n);
    Metrics bm = evaluate(outcomes, labels.mask, base_sel, baseline.unit_cost, baseline.method);
    Metrics cm = evaluate(outcomes, labels.mask, cand_sel, candidate.unit_cost, candidate.method);

    ComparisonResult r;
    r.baseline_method = baseline.method;
    r.candidate_method = candidate.method;
    r.n_total = static_cast<int>(n);
    r.n_high_risk = bm.n_high_risk;
    r.alpha = cfg.alpha;
    r.baseline_recall = bm.recall;
    r.candidate_recall = cm.recall;
    r.delta_recall = cm.recall - bm.recall;
    r.delta_selected = cm.n_selected - bm.n_selected;

    std::vector<double> base_yields, cand_yields;
    for (size_t i = 0; i < n; ++i) {
        if (base_sel[i]) base_yields.push_back(outcomes[i]);
        if (cand_sel[i]) cand_yields.push_back(outcomes[i]);
    }
    r.yield_test = student_t_test(base_yields, cand_yields);

    r.detection_test = contingency_test_2x2(bm.tp, bm.fn, cm.tp, cm.fn, cfg.min_expected_count);
    r.odds_ratio = (bm.fn > 0 && cm.tp > 0)
                       ? static_cast<double>(bm.tp) * cm.fn / (static_cast<double>(bm.fn) * cm.tp)
                       : std::numeric_limits<double>::infinity();

    for (size_t i = 0; i < n; ++i) {
        bool base_right = base_sel[i] == labels.mask[i];
        bool cand_right = cand_sel[i] == labels.mask[i];
        if (base_right && !cand_right) ++r.mcnemar_b;
        if (!base_right && cand_right) ++r.mcnemar_c;
    }
    r.mcnemar = mcnemar_test(r.mcnemar_b, r.mcnemar_c);

    auto base_costs = comparison::cost_vector(baseline, n);
    auto cand_costs = comparison::cost_vector(candidate, n);
    r.cost = bootstrap_cost_ci(base_costs, cand_costs, cfg.bootstrap, cfg.cost_form);
    r.recall = bootstrap_recall_ci(base_sel, cand_sel, labels.mask, cfg.bootstrap);

    double base_total = baseline.total_cost();
    r.delta_cost_pct = base_total > 0.0 ? (candidate.total_cost() - base_total) / base_total * 100.0
                                        : 0.0;
    return r;
}
