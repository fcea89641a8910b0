#pragma once

#include "errors.hpp"
#include "evaluation/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// MethodOutcome — inspection counts and detection for one method at one
// cost ratio. Primary inspections cost 1 unit, secondary ones cost r.
// ---------------------------------------------------------------------------
struct MethodOutcome {
    std::string method;
    int n_primary = 0;
    int n_secondary = 0;
    int tp = 0;
    double recall = 0.0;
    double selection_rate = 0.0;
};

// Recomputes a method's outcome at cost ratio r.
using MethodEvaluator = std::function<MethodOutcome(double r)>;

enum class DominanceType { RECALL_DOMINANCE, COST_DOMINANCE, NONE };

inline const char* to_string(DominanceType t) {
    switch (t) {
        case DominanceType::RECALL_DOMINANCE: return "recall_dominance";
        case DominanceType::COST_DOMINANCE:   return "cost_dominance";
        case DominanceType::NONE:             return "none";
    }
    return "none";
}

// Which normalized cost the dominance rule compares.
enum class CostBasis { TOTAL, PER_CATCH };

// ---------------------------------------------------------------------------
// SensitivityConfig
// ---------------------------------------------------------------------------
struct SensitivityConfig {
    std::vector<double> cost_ratios = {1.0, 2.0, 3.0, 5.0, 7.0, 10.0};
    CostBasis basis = CostBasis::PER_CATCH;
    double tolerance = 1e-9;   // relative

    void validate() const {
        if (cost_ratios.empty()) {
            throw ConfigurationError("cost-ratio grid is empty");
        }
        for (double r : cost_ratios) {
            if (!(r > 0.0) || std::isinf(r)) {
                throw ConfigurationError("cost ratio must be finite and positive, got " +
                                         std::to_string(r));
            }
        }
        if (!(tolerance >= 0.0)) {
            throw ConfigurationError("dominance tolerance must be non-negative");
        }
    }
};

struct SensitivityRow {
    double r = 1.0;
    std::string method;
    bool is_framework = false;
    double selection_rate = 0.0;
    double recall = 0.0;
    double normalized_cost = 0.0;
    double cost_per_catch = std::numeric_limits<double>::infinity();
    std::optional<DominanceType> dominance;   // framework rows only
};

struct DominancePoint {
    double r = 1.0;
    std::string baseline_method;
    DominanceType type = DominanceType::NONE;
};

struct SensitivitySweepResult {
    std::string framework_method;
    std::vector<SensitivityRow> rows;
    std::vector<DominancePoint> points;
    int grid_points = 0;
    int recall_dominance_count = 0;
    int cost_dominance_count = 0;
    int none_count = 0;

    // Points where the framework dominates a baseline in either sense.
    int dominance_count() const { return recall_dominance_count + cost_dominance_count; }
};

namespace sensitivity {

inline bool approx_equal(double a, double b, double tol) {
    if (std::isinf(a) || std::isinf(b)) return a == b;
    double scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= tol * scale;
}

inline bool strictly_less(double a, double b, double tol) {
    return a < b && !approx_equal(a, b, tol);
}

inline SensitivityRow make_row(const MethodOutcome& o, double r, bool framework) {
    SensitivityRow row;
    row.r = r;
    row.method = o.method;
    row.is_framework = framework;
    row.selection_rate = o.selection_rate;
    row.recall = o.recall;
    row.normalized_cost = o.n_primary * 1.0 + o.n_secondary * r;
    row.cost_per_catch = o.tp > 0 ? row.normalized_cost / o.tp
                                  : std::numeric_limits<double>::infinity();
    return row;
}

// Equal-or-lower cost with strictly higher recall is recall dominance;
// equal-or-higher recall with strictly lower cost is cost dominance. When
// both hold, recall dominance is reported.
inline DominanceType classify(const SensitivityRow& fw, const SensitivityRow& base,
                              CostBasis basis, double tol) {
    double cf = basis == CostBasis::TOTAL ? fw.normalized_cost : fw.cost_per_catch;
    double cb = basis == CostBasis::TOTAL ? base.normalized_cost : base.cost_per_catch;

    bool cost_le = cf < cb || approx_equal(cf, cb, tol);
    bool cost_lt = strictly_less(cf, cb, tol);
    bool recall_ge = fw.recall > base.recall || approx_equal(fw.recall, base.recall, tol);
    bool recall_gt = fw.recall > base.recall && !approx_equal(fw.recall, base.recall, tol);

    if (cost_le && recall_gt) return DominanceType::RECALL_DOMINANCE;
    if (recall_ge && cost_lt) return DominanceType::COST_DOMINANCE;
    return DominanceType::NONE;
}

}  // namespace sensitivity

// Constant outcome: selection does not depend on r, only the cost does.
inline MethodEvaluator fixed_outcome(const Metrics& m, int n_primary, int n_secondary) {
    MethodOutcome o;
    o.method = m.method;
    o.n_primary = n_primary;
    o.n_secondary = n_secondary;
    o.tp = m.tp;
    o.recall = m.recall;
    o.selection_rate = m.selection_rate;
    return [o](double) { return o; };
}

// One row per (r, method). The framework row at each r carries its dominance
// against the first baseline; every (r, baseline) pair is tallied.
inline SensitivitySweepResult run_sensitivity_sweep(const MethodEvaluator& framework,
                                                    const std::vector<MethodEvaluator>& baselines,
                                                    const SensitivityConfig& cfg = {}) {
    cfg.validate();
    if (!framework) {
        throw ConfigurationError("sensitivity sweep needs a framework evaluator");
    }
    if (baselines.empty()) {
        throw ConfigurationError("sensitivity sweep needs at least one baseline");
    }

    SensitivitySweepResult result;
    result.grid_points = static_cast<int>(cfg.cost_ratios.size());
    for (double r : cfg.cost_ratios) {
        SensitivityRow fw = sensitivity::make_row(framework(r), r, true);
        result.framework_method = fw.method;

        std::vector<SensitivityRow> base_rows;
        for (const auto& b : baselines) {
            SensitivityRow row = sensitivity::make_row(b(r), r, false);
            DominanceType t = sensitivity::classify(fw, row, cfg.basis, cfg.tolerance);
            result.points.push_back({r, row.method, t});
            if (t == DominanceType::RECALL_DOMINANCE) ++result.recall_dominance_count;
            else if (t == DominanceType::COST_DOMINANCE) ++result.cost_dominance_count;
            else ++result.none_count;
            if (!fw.dominance) fw.dominance = t;
            base_rows.push_back(std::move(row));
        }
        result.rows.push_back(fw);
        for (auto& row : base_rows) result.rows.push_back(std::move(row));
    }
    return result;
}
