#pragma once

#include "analysis/statistical_tests.hpp"
#include "errors.hpp"
#include "selection/random_selection.hpp"

#include <cstdint>
#include <vector>

// ---------------------------------------------------------------------------
// MultiSeedSweep — random-selection recall across independent seeds, the
// null-model reference band for a ranked policy
// ---------------------------------------------------------------------------
struct MultiSeedConfig {
    int n_seeds = 50;
    double rate = 0.10;
    uint32_t first_seed = 0;   // seeds are first_seed .. first_seed + n_seeds - 1

    void validate() const {
        if (n_seeds < 1) {
            throw ConfigurationError("seed count must be >= 1, got " + std::to_string(n_seeds));
        }
        selection::check_rate(rate);
    }
};

struct SeedRow {
    uint32_t seed = 0;
    int tp = 0;
    int fn = 0;
    double recall = 0.0;
};

struct MultiSeedSummary {
    int n_seeds = 0;
    int n_records = 0;
    int n_high_risk = 0;
    double rate = 0.0;
    int n_selected_per_run = 0;
    double recall_mean = 0.0;
    double recall_std = 0.0;
    double recall_p5 = 0.0;
    double recall_p50 = 0.0;
    double recall_p95 = 0.0;
};

struct MultiSeedResult {
    std::vector<SeedRow> rows;
    MultiSeedSummary summary;
};

// Each seed draws from its own generator, so rows are independent of order.
inline MultiSeedResult run_multi_seed_sweep(const std::vector<bool>& high_risk,
                                            const MultiSeedConfig& cfg = {}) {
    cfg.validate();
    size_t n = high_risk.size();
    if (n == 0) {
        throw DataIntegrityError("multi-seed sweep over an empty record set");
    }

    MultiSeedResult result;
    auto& s = result.summary;
    s.n_seeds = cfg.n_seeds;
    s.n_records = static_cast<int>(n);
    s.rate = cfg.rate;
    for (bool hr : high_risk) s.n_high_risk += hr ? 1 : 0;

    std::vector<double> recalls;
    recalls.reserve(cfg.n_seeds);
    for (int k = 0; k < cfg.n_seeds; ++k) {
        SeedRow row;
        row.seed = cfg.first_seed + static_cast<uint32_t>(k);
        auto picked = selection::random_indices(n, cfg.rate, row.seed);
        s.n_selected_per_run = static_cast<int>(picked.size());
        for (size_t i : picked) {
            if (high_risk[i]) ++row.tp;
        }
        row.fn = s.n_high_risk - row.tp;
        row.recall = s.n_high_risk > 0 ? static_cast<double>(row.tp) / s.n_high_risk : 0.0;
        recalls.push_back(row.recall);
        result.rows.push_back(row);
    }

    s.recall_mean = mean_of(recalls);
    s.recall_std = std_of(recalls);
    s.recall_p5 = percentile(recalls, 5.0);
    s.recall_p50 = percentile(recalls, 50.0);
    s.recall_p95 = percentile(recalls, 95.0);
    return result;
}
