#pragma once

#include "analysis/comparative_validator.hpp"
#include "analysis/proxy_plausibility.hpp"
#include "analysis/validation_summary.hpp"
#include "errors.hpp"
#include "evaluation/evaluator.hpp"
#include "io/artifact_json.hpp"
#include "io/record_csv.hpp"
#include "labeling/risk_labeler.hpp"
#include "records/record.hpp"
#include "selection/budgeted_mandatory_selection.hpp"
#include "selection/candidate_pool.hpp"
#include "selection/random_selection.hpp"
#include "selection/rule_based_selection.hpp"
#include "sweep/multi_seed_sweep.hpp"
#include "sweep/sensitivity_sweep.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ValidationRunConfig — everything one end-to-end evaluation needs
// ---------------------------------------------------------------------------
struct ValidationRunConfig {
    double quantile = 0.20;
    RandomSelectionConfig random;
    RuleBasedSelectionConfig rule_based;
    CandidatePoolConfig pool;
    BudgetPolicy budget;
    ComparisonConfig comparison;
    SensitivityConfig sensitivity;
    MultiSeedConfig multi_seed;
    // Two score columns from independent sources; empty skips the check.
    std::optional<std::pair<std::string, std::string>> proxy_columns;

    void validate() const {
        if (!(quantile > 0.0 && quantile <= 1.0)) {
            throw ConfigurationError("quantile must be in (0, 1], got " + std::to_string(quantile));
        }
        selection::check_rate(random.rate);
        selection::check_rate(rule_based.rate);
        pool.validate();
        budget.validate();
        comparison.validate();
        sensitivity.validate();
        multi_seed.validate();
    }
};

// ---------------------------------------------------------------------------
// ValidationRun — artifacts of one run. The framework is the budgeted
// mandatory-override policy; random and rule-based are its baselines.
// ---------------------------------------------------------------------------
struct ValidationRun {
    HighRiskLabels labels;
    SelectionResult random;
    SelectionResult rule_based;
    SelectionResult framework;
    int physical_damage_routed = 0;
    std::vector<Metrics> metrics;               // random, rule_based, framework
    std::vector<MethodDelta> method_deltas;
    std::vector<ComparisonResult> comparisons;  // random vs fw, rule_based vs fw
    ValidationSummary summary;
    SensitivitySweepResult sensitivity;
    MultiSeedResult multi_seed;
    std::optional<ProxyVerdict> proxy;
};

inline void check_required_columns(const RecordSet& records, const ValidationRunConfig& cfg) {
    if (!records.has_outcome) {
        throw ConfigurationError("outcome column '" + records.outcome_name + "' is not present");
    }
    records.require_score(cfg.rule_based.risk_column);
    records.require_score(cfg.pool.severity_column);
    for (const auto& p : cfg.budget.mandatory_predicates) records.require_predicate(p);
    if (cfg.proxy_columns) {
        records.require_score(cfg.proxy_columns->first);
        records.require_score(cfg.proxy_columns->second);
    }
}

// Baselines spend primary inspections (1 unit each); the framework's
// selections are secondary metrology actions costing r units.
inline ValidationRun run_validation(const RecordSet& records, const ValidationRunConfig& cfg) {
    cfg.validate();
    check_required_columns(records, cfg);
    records.validate();

    ValidationRun run;
    run.summary = ValidationSummary(cfg.comparison.alpha);
    run.labels = risk_labeler::label_high_risk(records, cfg.quantile);

    run.random = selection::random_select(records, cfg.random);
    run.rule_based = selection::rule_based_select(records, cfg.rule_based);
    CandidatePool pool = build_candidate_pool(records, cfg.pool);
    run.physical_damage_routed = static_cast<int>(pool.physical_damage.size());
    run.framework = budgeted_mandatory_select(pool, cfg.budget);

    for (const auto* sel : {&run.random, &run.rule_based, &run.framework}) {
        run.metrics.push_back(evaluate(records, run.labels, *sel));
    }
    run.method_deltas = compare_methods(run.metrics);

    for (const auto* base : {&run.random, &run.rule_based}) {
        run.comparisons.push_back(compare(records, run.labels, *base, run.framework, cfg.comparison));
        run.summary.add(run.comparisons.back());
    }

    const Metrics& fw = run.metrics[2];
    run.sensitivity = run_sensitivity_sweep(
        fixed_outcome(fw, 0, fw.n_selected),
        {fixed_outcome(run.metrics[0], run.metrics[0].n_selected, 0),
         fixed_outcome(run.metrics[1], run.metrics[1].n_selected, 0)},
        cfg.sensitivity);

    run.multi_seed = run_multi_seed_sweep(run.labels.mask, cfg.multi_seed);

    if (cfg.proxy_columns) {
        ProxyCheckConfig pc;
        pc.alpha = cfg.comparison.alpha;
        pc.source_a = cfg.proxy_columns->first;
        pc.source_b = cfg.proxy_columns->second;
        run.proxy = check_plausibility(records.score_column(pc.source_a),
                                       records.score_column(pc.source_b), pc);
    }
    return run;
}

// Writes every artifact of `run` under `dir`; returns the paths written.
// Metrics are written normalized unless `absolute_costs` is set.
inline std::vector<std::string> write_artifacts(const ValidationRun& run, const std::string& dir,
                                                bool absolute_costs = false) {
    namespace fs = std::filesystem;
    fs::create_directories(dir);
    std::vector<std::string> written;
    auto path = [&](const std::string& name) {
        written.push_back((fs::path(dir) / name).string());
        return written.back();
    };

    artifact_io::write_text(path("high_risk_definition.json"),
                            artifact_io::to_json(run.labels.definition));

    std::string metrics = "[";
    for (size_t i = 0; i < run.metrics.size(); ++i) {
        if (i > 0) metrics += ",";
        metrics += absolute_costs ? artifact_io::to_json(run.metrics[i])
                                  : artifact_io::to_json(normalize(run.metrics[i]));
    }
    artifact_io::write_text(path("metrics.json"), metrics + "]");
    write_csv_file(path("method_comparison.csv"), write_method_comparison_csv, run.method_deltas);

    for (const auto* sel : {&run.random, &run.rule_based, &run.framework}) {
        write_csv_file(path("selection_" + sel->method + ".csv"), write_selection_csv, *sel);
    }

    for (const auto& c : run.comparisons) {
        artifact_io::write_text(
            path("comparison_" + c.baseline_method + "_vs_" + c.candidate_method + ".json"),
            artifact_io::to_json(c));
    }
    artifact_io::write_text(path("validation_summary.json"), artifact_io::to_json(run.summary));

    write_csv_file(path("sensitivity_cost_ratio.csv"), write_sensitivity_csv, run.sensitivity);
    artifact_io::write_text(path("sensitivity_summary.json"),
                            artifact_io::to_json(run.sensitivity));

    write_csv_file(path("random_seed_sweep.csv"), write_seed_sweep_csv, run.multi_seed);
    artifact_io::write_text(path("random_seed_sweep_summary.json"),
                            artifact_io::to_json(run.multi_seed.summary));

    if (run.proxy) {
        artifact_io::write_text(path("proxy_validation.json"), artifact_io::to_json(*run.proxy));
    }
    return written;
}
