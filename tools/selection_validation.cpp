// selection_validation.cpp — CLI driver for the selection-and-validation run
//
// Pipeline: records -> ground-truth labels -> random / rule-based / budgeted
// selections -> metrics -> comparisons -> sweeps -> artifacts.
//
// Usage: ./selection_validation --records <csv|parquet> --output-dir <dir> [options]

#include "io/record_csv.hpp"
#include "io/record_parquet.hpp"
#include "pipeline/validation_run.hpp"
#include "scoring/gbt_risk_scorer.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

std::vector<double> parse_doubles(const std::string& s) {
    std::vector<double> out;
    for (const auto& item : split_list(s)) out.push_back(std::stod(item));
    return out;
}

std::string fmt_pct(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << v * 100.0 << "%";
    return ss.str();
}

}  // anonymous namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --records <path> --output-dir <dir> [options]\n"
              << "\n"
              << "  --records               Record file (.csv or .parquet)\n"
              << "  --output-dir            Artifact directory\n"
              << "  --id-column             Identifier column (default: wafer_id)\n"
              << "  --outcome-column        Outcome column (default: yield)\n"
              << "  --risk-column           Rule-based ranking column (default: risk_score)\n"
              << "  --severity-column       Budgeted ranking column (default: severity)\n"
              << "  --score-columns         Extra score columns to load, comma-separated\n"
              << "  --predicates            Mandatory predicate columns, comma-separated\n"
              << "  --label-column          Predicted label column (default: pred_label)\n"
              << "  --physical-damage-label Label routed away from metrology (default: Scratch)\n"
              << "  --quantile              High-risk quantile (default: 0.20)\n"
              << "  --rate                  Baseline selection rate (default: 0.10)\n"
              << "  --seed                  Random baseline seed (default: 42)\n"
              << "  --top-p                 Candidate severity top fraction (default: 0.10)\n"
              << "  --unit-cost             Metrology unit cost (default: 1.0)\n"
              << "  --total-budget          Metrology budget (default: none)\n"
              << "  --max-count             Metrology count cap (default: none)\n"
              << "  --bootstrap-iterations  Bootstrap draws (default: 10000)\n"
              << "  --bootstrap-seed        Bootstrap seed (default: 42)\n"
              << "  --cost-ratios           Sensitivity grid (default: 1,2,3,5,7,10)\n"
              << "  --n-seeds               Multi-seed sweep size (default: 50)\n"
              << "  --proxy-columns         Two score columns for the plausibility check, a,b\n"
              << "  --model                 XGBoost model scored into --risk-column\n"
              << "  --model-features        Feature columns for --model, comma-separated\n"
              << "  --absolute-costs        Also emit absolute cost figures\n"
              << "  --parquet-selections    Also write each selection table as .parquet\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string records_path;
    std::string output_dir;
    std::string model_path;
    std::vector<std::string> model_features;
    std::vector<std::string> extra_scores;
    bool absolute_costs = false;
    bool parquet_selections = false;

    ColumnMapping mapping;
    mapping.score_columns.clear();
    ValidationRunConfig cfg;
    cfg.budget.mandatory_predicates.clear();

    // Parse CLI args
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--absolute-costs") {
                absolute_costs = true;
                cfg.comparison.cost_form = CostForm::ABSOLUTE;
            } else if (arg == "--parquet-selections") {
                parquet_selections = true;
            } else if (!has_value) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            } else if (arg == "--records") {
                records_path = argv[++i];
            } else if (arg == "--output-dir") {
                output_dir = argv[++i];
            } else if (arg == "--id-column") {
                mapping.id_column = argv[++i];
            } else if (arg == "--outcome-column") {
                mapping.outcome_column = argv[++i];
            } else if (arg == "--risk-column") {
                cfg.rule_based.risk_column = argv[++i];
            } else if (arg == "--severity-column") {
                cfg.pool.severity_column = argv[++i];
            } else if (arg == "--score-columns") {
                extra_scores = split_list(argv[++i]);
            } else if (arg == "--predicates") {
                mapping.predicate_columns = split_list(argv[++i]);
                cfg.budget.mandatory_predicates = mapping.predicate_columns;
            } else if (arg == "--label-column") {
                mapping.label_column = argv[++i];
            } else if (arg == "--physical-damage-label") {
                cfg.pool.physical_damage_label = argv[++i];
            } else if (arg == "--quantile") {
                cfg.quantile = std::stod(argv[++i]);
            } else if (arg == "--rate") {
                cfg.random.rate = std::stod(argv[++i]);
                cfg.rule_based.rate = cfg.random.rate;
                cfg.multi_seed.rate = cfg.random.rate;
            } else if (arg == "--seed") {
                cfg.random.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--top-p") {
                cfg.pool.top_p = std::stod(argv[++i]);
            } else if (arg == "--unit-cost") {
                cfg.budget.unit_cost = std::stod(argv[++i]);
            } else if (arg == "--total-budget") {
                cfg.budget.total_budget = std::stod(argv[++i]);
            } else if (arg == "--max-count") {
                cfg.budget.max_count = std::stoi(argv[++i]);
            } else if (arg == "--bootstrap-iterations") {
                cfg.comparison.bootstrap.iterations = std::stoi(argv[++i]);
            } else if (arg == "--bootstrap-seed") {
                cfg.comparison.bootstrap.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--cost-ratios") {
                cfg.sensitivity.cost_ratios = parse_doubles(argv[++i]);
            } else if (arg == "--n-seeds") {
                cfg.multi_seed.n_seeds = std::stoi(argv[++i]);
            } else if (arg == "--proxy-columns") {
                auto cols = split_list(argv[++i]);
                if (cols.size() != 2) {
                    std::cerr << "--proxy-columns takes exactly two columns\n";
                    return 1;
                }
                cfg.proxy_columns = std::make_pair(cols[0], cols[1]);
            } else if (arg == "--model") {
                model_path = argv[++i];
            } else if (arg == "--model-features") {
                model_features = split_list(argv[++i]);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (records_path.empty()) {
        std::cerr << "Missing required argument: --records\n";
        print_usage(argv[0]);
        return 1;
    }
    if (output_dir.empty()) {
        std::cerr << "Missing required argument: --output-dir\n";
        print_usage(argv[0]);
        return 1;
    }
    if (!model_path.empty() && model_features.empty()) {
        std::cerr << "--model requires --model-features\n";
        return 1;
    }

    // Columns to load: model features (if scoring) or the risk column, then
    // severity, proxy and any extras, without duplicates.
    auto add_score = [&](const std::string& name) {
        for (const auto& s : mapping.score_columns) if (s == name) return;
        mapping.score_columns.push_back(name);
    };
    if (model_path.empty()) add_score(cfg.rule_based.risk_column);
    for (const auto& f : model_features) add_score(f);
    add_score(cfg.pool.severity_column);
    if (cfg.proxy_columns) {
        add_score(cfg.proxy_columns->first);
        add_score(cfg.proxy_columns->second);
    }
    for (const auto& s : extra_scores) add_score(s);

    try {
        std::string ext = std::filesystem::path(records_path).extension().string();
        RecordSet records;
        if (ext == ".parquet") {
            records = read_records_parquet(records_path, mapping);
        } else if (ext == ".csv") {
            records = read_records_csv(records_path, mapping);
        } else {
            std::cerr << "Unsupported record format. Use .csv or .parquet extension.\n";
            return 1;
        }
        std::cout << "Loaded " << records.size() << " records from " << records_path << "\n";

        if (!model_path.empty()) {
            GbtRiskScorer scorer(model_path);
            records = attach_scores(records, scorer, model_features, cfg.rule_based.risk_column);
            std::cout << "Scored " << cfg.rule_based.risk_column << " with " << model_path << "\n";
        }

        ValidationRun run = run_validation(records, cfg);

        const auto& def = run.labels.definition;
        std::cout << "High-risk: k=" << def.k << " of N=" << def.n << " (q=" << def.quantile
                  << ", hash " << def.source_hash << ")\n";
        std::cout << "Physical-damage routed: " << run.physical_damage_routed << "\n";
        if (run.framework.budget_overrun) {
            std::cout << "WARNING: mandatory inspections exceed the budget cap ("
                      << run.framework.n_selected() << " > " << run.framework.cap << ")\n";
        }
        for (const auto& d : run.method_deltas) {
            std::cout << "  " << std::left << std::setw(20) << d.method
                      << " selected=" << d.n_selected << " recall=" << fmt_pct(d.recall)
                      << " precision=" << fmt_pct(d.precision)
                      << " delta_selected=" << d.delta_selected
                      << " delta_cost=" << fmt_pct(d.delta_cost_pct / 100.0)
                      << " delta_recall=" << fmt_pct(d.delta_recall) << "\n";
        }
        for (const auto& c : run.comparisons) {
            std::cout << "  " << c.baseline_method << " vs " << c.candidate_method
                      << ": delta_recall=" << fmt_pct(c.delta_recall)
                      << " recall CI [" << fmt_pct(c.recall.ci.lower) << ", "
                      << fmt_pct(c.recall.ci.upper) << "]"
                      << (c.recall.significant ? " significant" : "") << "\n";
        }
        std::cout << "Summary: " << run.summary.conclusion() << " ("
                  << run.summary.significant_tests().size() << "/" << run.summary.total_tests()
                  << " tests survive Holm correction)\n";
        std::cout << "Sensitivity: " << run.sensitivity.dominance_count() << " dominance points of "
                  << run.sensitivity.points.size() << "\n";
        const auto& ms = run.multi_seed.summary;
        std::cout << "Random null band: p5=" << fmt_pct(ms.recall_p5)
                  << " p50=" << fmt_pct(ms.recall_p50) << " p95=" << fmt_pct(ms.recall_p95) << "\n";
        if (run.proxy) {
            std::cout << "Proxy check: " << to_string(run.proxy->status)
                      << " (ks=" << run.proxy->ks_statistic << ", p=" << run.proxy->p_value
                      << ", correlational only)\n";
        }

        auto written = write_artifacts(run, output_dir, absolute_costs);
        if (parquet_selections) {
            for (const auto* sel : {&run.random, &run.rule_based, &run.framework}) {
                auto path = (std::filesystem::path(output_dir) /
                             ("selection_" + sel->method + ".parquet")).string();
                write_selection_parquet(*sel, path);
                written.push_back(path);
            }
        }
        for (const auto& p : written) std::cout << "Wrote " << p << "\n";
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const DataIntegrityError& e) {
        std::cerr << "Data integrity error: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
