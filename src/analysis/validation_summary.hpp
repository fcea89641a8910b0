#pragma once

#include "analysis/comparative_validator.hpp"
#include "analysis/proxy_plausibility.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

// Holm-Bonferroni step-down adjustment. Output is in input order; adjusted
// values never decrease along the ascending raw order and are capped at 1.
inline std::vector<double> holm_adjust(const std::vector<double>& raw) {
    std::vector<std::pair<double, size_t>> ranked;
    ranked.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) ranked.emplace_back(raw[i], i);
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<double> adjusted(raw.size(), 1.0);
    double floor_p = 0.0;
    size_t m = ranked.size();
    for (size_t k = 0; k < m; ++k) {
        double scaled = ranked[k].first * static_cast<double>(m - k);
        floor_p = std::max(floor_p, std::min(1.0, scaled));
        adjusted[ranked[k].second] = floor_p;
    }
    return adjusted;
}

// ---------------------------------------------------------------------------
// SummaryEntry — one p-valued test inside a ValidationSummary
// ---------------------------------------------------------------------------
struct SummaryEntry {
    std::string comparison;     // "baseline_vs_candidate"
    std::string test;
    TestStatus status = TestStatus::OK;
    double raw_p_value = 1.0;
    double corrected_p_value = 1.0;
    bool survives_correction = false;
};

// ---------------------------------------------------------------------------
// ValidationSummary — Holm-corrected view over same-source comparisons
//
// Only ComparisonResult is accepted. Degenerate tests are listed but never
// counted as significant and do not take part in the correction.
// ---------------------------------------------------------------------------
class ValidationSummary {
public:
    ValidationSummary() = default;
    explicit ValidationSummary(double alpha) : alpha_(alpha) {}

    void add(const ComparisonResult& r) {
        std::string label = r.baseline_method + "_vs_" + r.candidate_method;
        push(label, "t_test_yields", r.yield_test);
        push(label, r.detection_test.test + "_detection", r.detection_test);
        push(label, "mcnemar", r.mcnemar);
        TestResult cost;
        cost.status = r.cost.status;
        cost.p_value = r.cost.p_value;
        push(label, "bootstrap_cost", cost);
        recall_significant_ += (r.recall.significant ? 1 : 0);
        correct();
    }

    void add(const ProxyVerdict&) = delete;

    const std::vector<SummaryEntry>& entries() const { return entries_; }
    double alpha() const { return alpha_; }

    int total_tests() const { return static_cast<int>(entries_.size()); }

    std::vector<std::string> significant_tests() const {
        std::vector<std::string> out;
        for (const auto& e : entries_) {
            if (e.survives_correction) out.push_back(e.comparison + "/" + e.test);
        }
        return out;
    }

    // Bootstrap recall intervals that exclude zero; reported separately since
    // they carry no p-value.
    int significant_recall_intervals() const { return recall_significant_; }

    // "all", "partial" or "none" over tests with status OK.
    std::string conclusion() const {
        int scored = 0, sig = 0;
        for (const auto& e : entries_) {
            if (e.status != TestStatus::OK) continue;
            ++scored;
            if (e.survives_correction) ++sig;
        }
        if (sig == 0) return "none";
        return sig == scored ? "all" : "partial";
    }

private:
    void push(const std::string& label, const std::string& test, const TestResult& t) {
        SummaryEntry e;
        e.comparison = label;
        e.test = test;
        e.status = t.status;
        e.raw_p_value = t.ok() ? t.p_value : 1.0;
        entries_.push_back(e);
    }

    void correct() {
        std::vector<double> raw;
        std::vector<size_t> idx;
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (entries_[i].status != TestStatus::OK) continue;
            raw.push_back(entries_[i].raw_p_value);
            idx.push_back(i);
        }
        auto corrected = holm_adjust(raw);
        for (size_t k = 0; k < idx.size(); ++k) {
            auto& e = entries_[idx[k]];
            e.corrected_p_value = corrected[k];
            e.survives_correction = corrected[k] < alpha_;
        }
    }

    double alpha_ = 0.05;
    int recall_significant_ = 0;
    std::vector<SummaryEntry> entries_;
};
