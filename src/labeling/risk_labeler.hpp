#pragma once

#include "errors.hpp"
#include "records/record.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// HighRiskDefinition — audit record of one ground-truth labeling run
// ---------------------------------------------------------------------------
struct HighRiskDefinition {
    std::string method = "bottom_quantile_fixed_k";
    double quantile = 0.0;
    int n = 0;
    int k = 0;
    double actual_rate = 0.0;
    double threshold_outcome_at_k = std::numeric_limits<double>::quiet_NaN();
    double threshold_outcome_next = std::numeric_limits<double>::quiet_NaN();
    std::string tie_break = "id_ascending";
    std::string outcome_column = "yield";
    std::string source_hash;
    int source_row_count = 0;
};

// ---------------------------------------------------------------------------
// HighRiskLabels — ground-truth mask plus the definition that produced it
// ---------------------------------------------------------------------------
struct HighRiskLabels {
    std::vector<bool> mask;
    HighRiskDefinition definition;

    int count() const {
        return static_cast<int>(std::count(mask.begin(), mask.end(), true));
    }
};

namespace risk_labeler {

// k = floor(q * N). The guard keeps q*N that lands a hair under an integer
// (0.29 * 100 = 28.999...) on the integer.
inline int fixed_k(double quantile, size_t n) {
    return static_cast<int>(std::floor(quantile * static_cast<double>(n) + 1e-9));
}

// 64-bit FNV-1a over the outcome column, sorted ascending and rendered "%.6f"
// comma-joined. Independent of row order and of every score column.
inline std::string outcome_hash(const std::vector<double>& outcomes) {
    std::vector<double> sorted = outcomes;
    std::sort(sorted.begin(), sorted.end());

    uint64_t h = 14695981039346656037ull;
    auto feed = [&h](char c) {
        h ^= static_cast<uint8_t>(c);
        h *= 1099511628211ull;
    };

    char buf[64];
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) feed(',');
        int len = std::snprintf(buf, sizeof(buf), "%.6f", sorted[i]);
        for (int j = 0; j < len; ++j) feed(buf[j]);
    }

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(h));
    return hex;
}

// ---------------------------------------------------------------------------
// label_bottom_quantile — mark exactly k = floor(q*N) records high-risk
//
// Stable ascending sort on (outcome, tie_key); the first k are high-risk.
// ---------------------------------------------------------------------------
inline HighRiskLabels label_bottom_quantile(const std::vector<double>& outcomes,
                                            const std::vector<std::string>& tie_keys,
                                            double quantile) {
    if (!(quantile > 0.0 && quantile <= 1.0)) {
        throw ConfigurationError("quantile must be in (0, 1], got " + std::to_string(quantile));
    }
    size_t n = outcomes.size();
    if (n == 0) {
        throw DataIntegrityError("cannot label an empty outcome column");
    }
    if (tie_keys.size() != n) {
        throw DataIntegrityError("tie-break keys do not align with the outcome column");
    }
    for (double v : outcomes) {
        if (std::isnan(v)) throw DataIntegrityError("outcome column contains NaN");
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (outcomes[a] != outcomes[b]) return outcomes[a] < outcomes[b];
        return tie_keys[a] < tie_keys[b];
    });

    int k = fixed_k(quantile, n);

    HighRiskLabels labels;
    labels.mask.assign(n, false);
    for (int i = 0; i < k; ++i) {
        labels.mask[order[static_cast<size_t>(i)]] = true;
    }

    auto& def = labels.definition;
    def.quantile = quantile;
    def.n = static_cast<int>(n);
    def.k = k;
    def.actual_rate = static_cast<double>(k) / static_cast<double>(n);
    if (k > 0) {
        def.threshold_outcome_at_k = outcomes[order[static_cast<size_t>(k - 1)]];
        def.threshold_outcome_next = (static_cast<size_t>(k) < n)
            ? outcomes[order[static_cast<size_t>(k)]]
            : def.threshold_outcome_at_k;
    }
    def.source_hash = outcome_hash(outcomes);
    def.source_row_count = static_cast<int>(n);
    return labels;
}

// Label a validated record set by its outcome column, tie-broken by identifier.
inline HighRiskLabels label_high_risk(const RecordSet& records, double quantile) {
    if (!(quantile > 0.0 && quantile <= 1.0)) {
        throw ConfigurationError("quantile must be in (0, 1], got " + std::to_string(quantile));
    }
    if (!records.has_outcome) {
        throw ConfigurationError("outcome column '" + records.outcome_name + "' is not present");
    }
    records.validate();
    auto labels = label_bottom_quantile(records.outcomes(), records.ids(), quantile);
    labels.definition.outcome_column = records.outcome_name;
    return labels;
}

}  // namespace risk_labeler
