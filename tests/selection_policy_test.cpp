// selection_policy_test.cpp — tests for the random and rule-based baselines
//
// Random: floor(N*rate) distinct rows, reproducible per (seed, rate, N).
// Rule-based: top floor(N*rate) by risk score, ties by original row order.

#include <gtest/gtest.h>
#include "evaluation/evaluator.hpp"
#include "labeling/risk_labeler.hpp"
#include "selection/random_selection.hpp"
#include "selection/rule_based_selection.hpp"
#include "test_record_helpers.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <vector>

using selection::random_indices;
using selection::random_select;
using selection::rule_based_select;

// ===========================================================================
// RandomSelection
// ===========================================================================
TEST(RandomSelectionTest, SelectsFloorOfRateDistinctRows) {
    auto rs = test_helpers::make_uniform_records(205);
    RandomSelectionConfig cfg;
    cfg.rate = 0.10;
    auto sel = random_select(rs, cfg);
    EXPECT_EQ(sel.n_selected(), 20);
    EXPECT_EQ(sel.remainder.size(), 185u);

    std::set<size_t> rows;
    for (const auto& s : sel.selected) {
        rows.insert(s.row);
        EXPECT_TRUE(s.selected);
        EXPECT_DOUBLE_EQ(s.cost, 1.0);
        EXPECT_EQ(s.reason, selection_reason::RANDOM_SAMPLE);
        EXPECT_EQ(s.id, rs.records[s.row].id);
    }
    EXPECT_EQ(rows.size(), 20u);
}

TEST(RandomSelectionTest, SameSeedRateAndSizeGiveSameRows) {
    for (uint32_t seed : {0u, 1u, 42u, 12345u}) {
        auto a = random_indices(200, 0.1, seed);
        auto b = random_indices(200, 0.1, seed);
        EXPECT_EQ(a, b) << "seed " << seed;
    }
}

TEST(RandomSelectionTest, IndependentOfRecordContent) {
    auto a = test_helpers::make_uniform_records(120, 1);
    auto b = test_helpers::make_uniform_records(120, 2);
    RandomSelectionConfig cfg;
    cfg.seed = 9;
    EXPECT_EQ(random_select(a, cfg).selected_rows(), random_select(b, cfg).selected_rows());
}

TEST(RandomSelectionTest, DifferentSeedsUsuallyDiffer) {
    EXPECT_NE(random_indices(200, 0.1, 1), random_indices(200, 0.1, 2));
}

TEST(RandomSelectionTest, IndicesAreSortedAndInRange) {
    auto idx = random_indices(50, 0.3, 5);
    ASSERT_EQ(idx.size(), 15u);
    EXPECT_TRUE(std::is_sorted(idx.begin(), idx.end()));
    EXPECT_LT(idx.back(), 50u);
}

TEST(RandomSelectionTest, RateOutsideRangeIsConfigurationError) {
    auto rs = test_helpers::make_uniform_records(10);
    RandomSelectionConfig cfg;
    cfg.rate = 0.0;
    EXPECT_THROW(random_select(rs, cfg), ConfigurationError);
    cfg.rate = 1.01;
    EXPECT_THROW(random_select(rs, cfg), ConfigurationError);
}

// ===========================================================================
// Scenario A — random recall around the selection rate
// ===========================================================================
TEST(RandomSelectionTest, MedianRecallOverFiftySeedsNearRate) {
    auto rs = test_helpers::make_uniform_records(200, 2024);
    auto labels = risk_labeler::label_high_risk(rs, 0.20);
    ASSERT_EQ(labels.count(), 40);

    std::vector<double> recalls;
    for (uint32_t seed = 0; seed < 50; ++seed) {
        RandomSelectionConfig cfg;
        cfg.rate = 0.10;
        cfg.seed = seed;
        auto m = evaluate(rs, labels, random_select(rs, cfg));
        recalls.push_back(m.recall);
    }
    std::sort(recalls.begin(), recalls.end());
    double median = (recalls[24] + recalls[25]) / 2.0;
    EXPECT_GE(median, 0.05);
    EXPECT_LE(median, 0.15);
}

// ===========================================================================
// RuleBasedSelection
// ===========================================================================
TEST(RuleBasedSelectionTest, TakesTopScoresDescending) {
    auto rs = test_helpers::make_records({0.1, 0.2, 0.3, 0.4, 0.5},
                                         {0.3, 0.9, 0.1, 0.7, 0.5});
    RuleBasedSelectionConfig cfg;
    cfg.rate = 0.4;
    auto sel = rule_based_select(rs, cfg);
    ASSERT_EQ(sel.n_selected(), 2);
    EXPECT_EQ(sel.selected[0].row, 1u);
    EXPECT_EQ(sel.selected[1].row, 3u);
    EXPECT_EQ(sel.selected[0].reason, selection_reason::TOP_RISK_SCORE);
    EXPECT_DOUBLE_EQ(sel.selected[0].score, 0.9);
    EXPECT_EQ(sel.remainder.size(), 3u);
}

TEST(RuleBasedSelectionTest, TiesKeepOriginalRowOrder) {
    auto rs = test_helpers::make_records({0.1, 0.2, 0.3, 0.4, 0.5},
                                         {0.5, 0.8, 0.5, 0.5, 0.2});
    RuleBasedSelectionConfig cfg;
    cfg.rate = 0.6;
    auto sel = rule_based_select(rs, cfg);
    auto rows = sel.selected_rows();
    std::vector<size_t> expected = {1, 0, 2};
    EXPECT_EQ(rows, expected);
}

TEST(RuleBasedSelectionTest, MissingRiskColumnIsConfigurationError) {
    auto rs = test_helpers::make_uniform_records(10);
    RuleBasedSelectionConfig cfg;
    cfg.risk_column = "no_such_column";
    EXPECT_THROW(rule_based_select(rs, cfg), ConfigurationError);
}

TEST(RuleBasedSelectionTest, NanRiskScoreIsDataIntegrityError) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto rs = test_helpers::make_records({0.1, 0.2, 0.3, 0.4, 0.5, 0.6},
                                         {0.9, nan, 0.8, 0.1, 0.7, 0.2});
    RuleBasedSelectionConfig cfg;
    cfg.rate = 0.5;
    EXPECT_THROW(rule_based_select(rs, cfg), DataIntegrityError);

    rs.records[1].scores[0] = 0.05;
    auto rows = rule_based_select(rs, cfg).selected_rows();
    std::vector<size_t> expected = {0, 2, 4};
    EXPECT_EQ(rows, expected);
}

TEST(RuleBasedSelectionTest, AntiCorrelatedScoreGivesPerfectRecall) {
    // Scenario B: risk_score = 1 - yield, rate equal to the quantile.
    auto rs = test_helpers::make_uniform_records(200, 99);
    auto labels = risk_labeler::label_high_risk(rs, 0.20);
    RuleBasedSelectionConfig cfg;
    cfg.rate = 0.20;
    auto m = evaluate(rs, labels, rule_based_select(rs, cfg));
    EXPECT_DOUBLE_EQ(m.recall, 1.0);
    EXPECT_DOUBLE_EQ(m.precision, 1.0);
    EXPECT_EQ(m.fp, 0);
}

TEST(RuleBasedSelectionTest, MaskMatchesSelectedRows) {
    auto rs = test_helpers::make_uniform_records(30);
    RuleBasedSelectionConfig cfg;
    cfg.rate = 0.5;
    auto sel = rule_based_select(rs, cfg);
    auto mask = sel.mask(rs.size());
    EXPECT_EQ(std::count(mask.begin(), mask.end(), true), 15);
    for (const auto& s : sel.selected) EXPECT_TRUE(mask[s.row]);
    for (const auto& s : sel.remainder) EXPECT_FALSE(mask[s.row]);
}
