#pragma once

#include "analysis/comparative_validator.hpp"
#include "analysis/proxy_plausibility.hpp"
#include "analysis/validation_summary.hpp"
#include "evaluation/evaluator.hpp"
#include "labeling/risk_labeler.hpp"
#include "sweep/multi_seed_sweep.hpp"
#include "sweep/sensitivity_sweep.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace artifact_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

// Non-finite values have no JSON literal and are written as null.
inline std::string num(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

inline std::string str(const std::string& s) { return "\"" + json_escape(s) + "\""; }

inline const char* boolean(bool b) { return b ? "true" : "false"; }

inline std::string test_fields(const TestResult& t) {
    std::ostringstream ss;
    ss << "\"status\":" << str(to_string(t.status));
    ss << ",\"statistic\":" << num(t.statistic);
    ss << ",\"p_value\":" << num(t.p_value);
    if (!t.note.empty()) ss << ",\"note\":" << str(t.note);
    return ss.str();
}

inline std::string interval(const Interval& i) {
    return "{\"lower\":" + num(i.lower) + ",\"upper\":" + num(i.upper) + "}";
}

inline std::string to_json(const HighRiskDefinition& d) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"method\":" << str(d.method);
    ss << ",\"quantile\":" << num(d.quantile);
    ss << ",\"n\":" << d.n;
    ss << ",\"k\":" << d.k;
    ss << ",\"actual_rate\":" << num(d.actual_rate);
    ss << ",\"threshold_outcome_at_k\":" << num(d.threshold_outcome_at_k);
    ss << ",\"threshold_outcome_next\":" << num(d.threshold_outcome_next);
    ss << ",\"tie_break\":" << str(d.tie_break);
    ss << ",\"outcome_column\":" << str(d.outcome_column);
    ss << ",\"source_hash\":" << str(d.source_hash);
    ss << ",\"source_row_count\":" << d.source_row_count;
    ss << "}";
    return ss.str();
}

// Absolute form: every field, cost in configured units.
inline std::string to_json(const Metrics& m) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"method\":" << str(m.method);
    ss << ",\"n_total\":" << m.n_total;
    ss << ",\"n_high_risk\":" << m.n_high_risk;
    ss << ",\"n_selected\":" << m.n_selected;
    ss << ",\"tp\":" << m.tp << ",\"fp\":" << m.fp << ",\"fn\":" << m.fn << ",\"tn\":" << m.tn;
    ss << ",\"recall\":" << num(m.recall);
    ss << ",\"precision\":" << num(m.precision);
    ss << ",\"f1\":" << num(m.f1);
    ss << ",\"specificity\":" << num(m.specificity);
    ss << ",\"false_positive_rate\":" << num(m.false_positive_rate);
    ss << ",\"selection_rate\":" << num(m.selection_rate);
    ss << ",\"unit_cost\":" << num(m.unit_cost);
    ss << ",\"total_cost\":" << num(m.total_cost);
    ss << ",\"cost_per_catch\":" << num(m.cost_per_catch);
    ss << ",\"cost_per_catch_infinite\":" << boolean(std::isinf(m.cost_per_catch));
    ss << ",\"cost_per_inspection\":" << num(m.cost_per_inspection);
    ss << ",\"avg_yield_all\":" << num(m.avg_yield_all);
    ss << ",\"avg_yield_selected\":" << num(m.avg_yield_selected);
    ss << ",\"avg_yield_not_selected\":" << num(m.avg_yield_not_selected);
    ss << ",\"yield_std\":" << num(m.yield_std);
    ss << ",\"yield_q25\":" << num(m.yield_q25);
    ss << ",\"yield_q50\":" << num(m.yield_q50);
    ss << ",\"yield_q75\":" << num(m.yield_q75);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const NormalizedMetrics& m) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"method\":" << str(m.method);
    ss << ",\"n_total\":" << m.n_total;
    ss << ",\"n_high_risk\":" << m.n_high_risk;
    ss << ",\"inspections\":" << m.inspections;
    ss << ",\"tp\":" << m.tp;
    ss << ",\"selection_rate\":" << num(m.selection_rate);
    ss << ",\"recall\":" << num(m.recall);
    ss << ",\"precision\":" << num(m.precision);
    ss << ",\"f1\":" << num(m.f1);
    ss << ",\"inspections_per_catch\":" << num(m.inspections_per_catch);
    ss << "}";
    return ss.str();
}

// Cost figures appear as percentages unless the result was computed in
// CostForm::ABSOLUTE.
inline std::string to_json(const ComparisonResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"baseline\":" << str(r.baseline_method);
    ss << ",\"candidate\":" << str(r.candidate_method);
    ss << ",\"n_total\":" << r.n_total;
    ss << ",\"n_high_risk\":" << r.n_high_risk;
    ss << ",\"alpha\":" << num(r.alpha);
    ss << ",\"baseline_recall\":" << num(r.baseline_recall);
    ss << ",\"candidate_recall\":" << num(r.candidate_recall);
    ss << ",\"delta_recall\":" << num(r.delta_recall);
    ss << ",\"delta_selected\":" << r.delta_selected;
    ss << ",\"delta_cost_pct\":" << num(r.delta_cost_pct);

    const auto& t = r.yield_test;
    ss << ",\"t_test_yields\":{" << test_fields(t);
    ss << ",\"significant\":" << boolean(t.significant(r.alpha));
    ss << ",\"df\":" << num(t.df);
    ss << ",\"cohens_d\":" << num(t.cohens_d);
    ss << ",\"effect_size\":" << str(t.effect_size);
    ss << ",\"baseline_mean\":" << num(t.mean_a) << ",\"baseline_std\":" << num(t.std_a);
    ss << ",\"candidate_mean\":" << num(t.mean_b) << ",\"candidate_std\":" << num(t.std_b);
    ss << ",\"n_baseline\":" << t.n_a << ",\"n_candidate\":" << t.n_b << "}";

    const auto& d = r.detection_test;
    ss << ",\"detection\":{\"test\":" << str(d.test) << "," << test_fields(d);
    ss << ",\"significant\":" << boolean(d.significant(r.alpha));
    ss << ",\"table\":[[" << d.table[0][0] << "," << d.table[0][1] << "],["
       << d.table[1][0] << "," << d.table[1][1] << "]]";
    ss << ",\"expected\":[[" << num(d.expected[0][0]) << "," << num(d.expected[0][1]) << "],["
       << num(d.expected[1][0]) << "," << num(d.expected[1][1]) << "]]";
    ss << ",\"odds_ratio\":" << num(r.odds_ratio) << "}";

    ss << ",\"mcnemar\":{" << test_fields(r.mcnemar);
    ss << ",\"significant\":" << boolean(r.mcnemar.significant(r.alpha));
    ss << ",\"b\":" << r.mcnemar_b << ",\"c\":" << r.mcnemar_c << "}";

    const auto& c = r.cost;
    ss << ",\"bootstrap_cost\":{\"status\":" << str(to_string(c.status));
    ss << ",\"n_bootstrap\":" << c.n_bootstrap << ",\"n_samples\":" << c.n_samples;
    ss << ",\"confidence\":" << num(c.confidence);
    ss << ",\"percent_reduction\":" << num(c.percent_reduction);
    ss << ",\"delta_cost_pct_ci\":" << interval(c.percent_ci);
    ss << ",\"p_value\":" << num(c.p_value);
    ss << ",\"significant\":" << boolean(c.significant);
    if (c.absolute_ci) {
        ss << ",\"observed_diff\":" << num(*c.observed_diff);
        ss << ",\"bootstrap_std\":" << num(*c.bootstrap_std);
        ss << ",\"absolute_ci\":" << interval(*c.absolute_ci);
    }
    ss << "}";

    const auto& rc = r.recall;
    ss << ",\"bootstrap_recall\":{\"status\":" << str(to_string(rc.status));
    ss << ",\"n_bootstrap\":" << rc.n_bootstrap << ",\"n_high_risk\":" << rc.n_high_risk;
    ss << ",\"confidence\":" << num(rc.confidence);
    ss << ",\"observed_diff\":" << num(rc.observed_diff);
    ss << ",\"ci\":" << interval(rc.ci);
    ss << ",\"significant\":" << boolean(rc.significant) << "}";

    ss << "}";
    return ss.str();
}

inline std::string to_json(const ProxyVerdict& v) {
    auto summary = [](const SampleSummary& s) {
        return "{\"n\":" + std::to_string(s.n) + ",\"mean\":" + num(s.mean) +
               ",\"std\":" + num(s.std) + ",\"min\":" + num(s.min) + ",\"max\":" + num(s.max) + "}";
    };
    std::ostringstream ss;
    ss << "{";
    ss << "\"test\":\"kolmogorov_smirnov_2sample\"";
    ss << ",\"source_a\":" << str(v.source_a);
    ss << ",\"source_b\":" << str(v.source_b);
    ss << ",\"ks_statistic\":" << num(v.ks_statistic);
    ss << ",\"p_value\":" << num(v.p_value);
    ss << ",\"alpha\":" << num(v.alpha);
    ss << ",\"status\":" << str(to_string(v.status));
    ss << ",\"evidence\":" << str(v.evidence);
    ss << ",\"caveat\":" << str(v.caveat);
    ss << ",\"summary_a\":" << summary(v.summary_a);
    ss << ",\"summary_b\":" << summary(v.summary_b);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ValidationSummary& s) {
    std::ostringstream ss;
    ss << "{\"alpha\":" << num(s.alpha());
    ss << ",\"correction\":\"holm_bonferroni\"";
    ss << ",\"total_tests\":" << s.total_tests();
    ss << ",\"conclusion\":" << str(s.conclusion());
    ss << ",\"significant_recall_intervals\":" << s.significant_recall_intervals();
    ss << ",\"tests\":[";
    const auto& entries = s.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& e = entries[i];
        ss << "{\"comparison\":" << str(e.comparison);
        ss << ",\"test\":" << str(e.test);
        ss << ",\"status\":" << str(to_string(e.status));
        ss << ",\"raw_p_value\":" << num(e.raw_p_value);
        ss << ",\"corrected_p_value\":" << num(e.corrected_p_value);
        ss << ",\"survives_correction\":" << boolean(e.survives_correction) << "}";
    }
    ss << "]}";
    return ss.str();
}

inline std::string to_json(const SensitivitySweepResult& r) {
    std::ostringstream ss;
    ss << "{\"framework\":" << str(r.framework_method);
    ss << ",\"grid_points\":" << r.grid_points;
    ss << ",\"recall_dominance_count\":" << r.recall_dominance_count;
    ss << ",\"cost_dominance_count\":" << r.cost_dominance_count;
    ss << ",\"none_count\":" << r.none_count;
    ss << ",\"points\":[";
    for (size_t i = 0; i < r.points.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& p = r.points[i];
        ss << "{\"r\":" << num(p.r) << ",\"baseline\":" << str(p.baseline_method)
           << ",\"dominance_type\":" << str(to_string(p.type)) << "}";
    }
    ss << "]}";
    return ss.str();
}

inline std::string to_json(const MultiSeedSummary& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"n_seeds\":" << s.n_seeds;
    ss << ",\"n_records\":" << s.n_records;
    ss << ",\"n_high_risk\":" << s.n_high_risk;
    ss << ",\"selection_rate\":" << num(s.rate);
    ss << ",\"n_selected_per_run\":" << s.n_selected_per_run;
    ss << ",\"recall_mean\":" << num(s.recall_mean);
    ss << ",\"recall_std\":" << num(s.recall_std);
    ss << ",\"recall_p5\":" << num(s.recall_p5);
    ss << ",\"recall_p50\":" << num(s.recall_p50);
    ss << ",\"recall_p95\":" << num(s.recall_p95);
    ss << "}";
    return ss.str();
}

inline void write_text(const std::string& path, const std::string& body) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << body << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing: " + path);
    }
}

}  // namespace artifact_io
