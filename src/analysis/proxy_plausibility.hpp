#pragma once

#include "analysis/statistical_tests.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PlausibilityStatus — outcome of a cross-source distribution check
// ---------------------------------------------------------------------------
enum class PlausibilityStatus { PASSED_PLAUSIBILITY, FAILED_PLAUSIBILITY };

inline const char* to_string(PlausibilityStatus s) {
    return s == PlausibilityStatus::PASSED_PLAUSIBILITY ? "PASSED_PLAUSIBILITY"
                                                        : "FAILED_PLAUSIBILITY";
}

struct SampleSummary {
    int n = 0;
    double mean = 0.0;
    double std = 0.0;
    double min = 0.0;
    double max = 0.0;
};

inline SampleSummary summarize(const std::vector<double>& v) {
    SampleSummary s;
    s.n = static_cast<int>(v.size());
    if (v.empty()) return s;
    s.mean = mean_of(v);
    s.std = std_of(v);
    auto [lo, hi] = std::minmax_element(v.begin(), v.end());
    s.min = *lo;
    s.max = *hi;
    return s;
}

// ---------------------------------------------------------------------------
// ProxyVerdict — KS similarity of two independently sourced score arrays
//
// Correlational evidence only. Kept apart from ComparisonResult: a verdict
// cannot enter a ValidationSummary.
// ---------------------------------------------------------------------------
struct ProxyVerdict {
    std::string source_a;
    std::string source_b;
    double ks_statistic = 0.0;
    double p_value = 1.0;
    double alpha = 0.05;
    PlausibilityStatus status = PlausibilityStatus::PASSED_PLAUSIBILITY;
    std::string evidence = "correlational_not_causal";
    std::string caveat = "plausibility-checked only, not causally validated";
    SampleSummary summary_a;
    SampleSummary summary_b;

    bool passed() const { return status == PlausibilityStatus::PASSED_PLAUSIBILITY; }
};

struct ProxyCheckConfig {
    double alpha = 0.05;
    std::string source_a = "source_a";
    std::string source_b = "source_b";
};

// FAILED_PLAUSIBILITY iff p <= alpha. An empty or non-finite sample is a
// DataIntegrityError; a "different" outcome is a normal verdict.
inline ProxyVerdict check_plausibility(const std::vector<double>& a,
                                       const std::vector<double>& b,
                                       const ProxyCheckConfig& cfg = {}) {
    if (!(cfg.alpha > 0.0 && cfg.alpha < 1.0)) {
        throw ConfigurationError("plausibility alpha must be in (0, 1)");
    }
    for (const auto* sample : {&a, &b}) {
        for (double v : *sample) {
            if (!std::isfinite(v)) {
                throw DataIntegrityError("plausibility sample contains a non-finite value");
            }
        }
    }
    TestResult ks = ks_two_sample(a, b);

    ProxyVerdict v;
    v.source_a = cfg.source_a;
    v.source_b = cfg.source_b;
    v.ks_statistic = ks.statistic;
    v.p_value = ks.p_value;
    v.alpha = cfg.alpha;
    v.status = ks.p_value <= cfg.alpha ? PlausibilityStatus::FAILED_PLAUSIBILITY
                                       : PlausibilityStatus::PASSED_PLAUSIBILITY;
    v.summary_a = summarize(a);
    v.summary_b = summarize(b);
    return v;
}

// Linear rescale of a score array clipped to [lo, hi], for deriving a proxy
// series from a source whose native scale differs.
inline std::vector<double> scaled_proxy(const std::vector<double>& values, double factor,
                                        double lo = 0.0, double hi = 1.0) {
    if (lo > hi) {
        throw ConfigurationError("scaled_proxy: lower clip above upper clip");
    }
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) out.push_back(std::clamp(v * factor, lo, hi));
    return out;
}
