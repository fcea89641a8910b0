#pragma once

#include "errors.hpp"
#include "records/record.hpp"
#include "selection/selection_result.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

// ---------------------------------------------------------------------------
// RandomSelectionConfig
// ---------------------------------------------------------------------------
struct RandomSelectionConfig {
    double rate = 0.10;
    uint32_t seed = 42;
    double unit_cost = 1.0;
};

namespace selection {

inline int count_for_rate(size_t n, double rate) {
    return static_cast<int>(std::floor(static_cast<double>(n) * rate + 1e-9));
}

// floor(n * rate) distinct indices in [0, n), ascending. The generator is local
// to the call: same (seed, rate, n) always yields the same set.
inline std::vector<size_t> random_indices(size_t n, double rate, uint32_t seed) {
    check_rate(rate);
    int n_select = count_for_rate(n, rate);

    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(indices.begin(), indices.end(), rng);
    indices.resize(static_cast<size_t>(n_select));
    std::sort(indices.begin(), indices.end());
    return indices;
}

inline SelectionResult random_select(const RecordSet& records, const RandomSelectionConfig& cfg) {
    check_rate(cfg.rate);
    check_unit_cost(cfg.unit_cost);
    records.validate();

    size_t n = records.size();
    auto picked = random_indices(n, cfg.rate, cfg.seed);

    SelectionResult result;
    result.method = "random";
    result.unit_cost = cfg.unit_cost;
    result.cap = static_cast<int>(picked.size());

    std::vector<bool> flags(n, false);
    for (size_t row : picked) {
        flags[row] = true;
        RecordSelection s;
        s.row = row;
        s.id = records.records[row].id;
        s.selected = true;
        s.cost = cfg.unit_cost;
        s.reason = selection_reason::RANDOM_SAMPLE;
        result.selected.push_back(std::move(s));
    }
    for (size_t row = 0; row < n; ++row) {
        if (flags[row]) continue;
        RecordSelection s;
        s.row = row;
        s.id = records.records[row].id;
        s.reason = selection_reason::NOT_SELECTED;
        result.remainder.push_back(std::move(s));
    }
    return result;
}

}  // namespace selection
