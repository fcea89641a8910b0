// statistical_tests_test.cpp — tests for the t-test, 2x2 contingency tests,
// KS, McNemar and the descriptive helpers
//
// Reference values were computed with scipy.stats.

#include <gtest/gtest.h>
#include "analysis/statistical_tests.hpp"

#include <cmath>
#include <random>
#include <vector>

// ===========================================================================
// Descriptive helpers
// ===========================================================================
TEST(StatisticalTestsTest, PercentileLinearInterpolation) {
    std::vector<double> v = {4.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(percentile(v, 50.0), 2.5);
    EXPECT_DOUBLE_EQ(percentile(v, 25.0), 1.75);
    EXPECT_DOUBLE_EQ(percentile(v, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(v, 100.0), 4.0);
    EXPECT_DOUBLE_EQ(percentile({7.0}, 95.0), 7.0);
}

TEST(StatisticalTestsTest, PercentileOfEmptyThrows) {
    EXPECT_THROW(percentile({}, 50.0), DataIntegrityError);
}

TEST(StatisticalTestsTest, PopulationAndSampleStd) {
    std::vector<double> v = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    EXPECT_DOUBLE_EQ(mean_of(v), 5.0);
    EXPECT_DOUBLE_EQ(std_of(v), 2.0);
    EXPECT_NEAR(std_of(v, 1), std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_DOUBLE_EQ(std_of({}), 0.0);
}

// ===========================================================================
// Student t-test
// ===========================================================================
TEST(StatisticalTestsTest, TTestKnownValue) {
    auto r = student_t_test({1, 2, 3, 4, 5}, {6, 7, 8, 9, 10});
    ASSERT_TRUE(r.ok());
    EXPECT_NEAR(r.statistic, -5.0, 1e-12);
    EXPECT_DOUBLE_EQ(r.df, 8.0);
    EXPECT_NEAR(r.p_value, 0.0010528, 1e-6);
    EXPECT_NEAR(r.cohens_d, -5.0 / std::sqrt(2.0), 1e-12);
    EXPECT_EQ(r.effect_size, "large");
    EXPECT_TRUE(r.significant(0.05));
}

TEST(StatisticalTestsTest, TTestIdenticalMeansIsNotSignificant) {
    auto r = student_t_test({1, 2, 3, 4}, {4, 3, 2, 1});
    ASSERT_TRUE(r.ok());
    EXPECT_NEAR(r.statistic, 0.0, 1e-12);
    EXPECT_NEAR(r.p_value, 1.0, 1e-9);
    EXPECT_EQ(r.effect_size, "negligible");
}

TEST(StatisticalTestsTest, TTestDegenerateInputsAreInsufficientData) {
    EXPECT_EQ(student_t_test({}, {1, 2}).status, TestStatus::INSUFFICIENT_DATA);
    EXPECT_EQ(student_t_test({1}, {2}).status, TestStatus::INSUFFICIENT_DATA);
    auto flat = student_t_test({3, 3, 3}, {3, 3});
    EXPECT_EQ(flat.status, TestStatus::INSUFFICIENT_DATA);
    EXPECT_FALSE(flat.significant(0.05));
}

TEST(StatisticalTestsTest, CohensDThresholds) {
    EXPECT_EQ(interpret_cohens_d(0.1), "negligible");
    EXPECT_EQ(interpret_cohens_d(-0.3), "small");
    EXPECT_EQ(interpret_cohens_d(0.5), "medium");
    EXPECT_EQ(interpret_cohens_d(0.8), "large");
}

// ===========================================================================
// 2x2 contingency
// ===========================================================================
TEST(StatisticalTestsTest, ChiSquareWithYatesCorrection) {
    auto r = contingency_test_2x2(20, 30, 30, 20);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.test, "chi_square");
    EXPECT_NEAR(r.statistic, 3.24, 1e-12);
    EXPECT_NEAR(r.p_value, 0.071861, 1e-5);
    EXPECT_DOUBLE_EQ(r.expected[0][0], 25.0);
    EXPECT_EQ(r.dof, 1);
}

TEST(StatisticalTestsTest, SmallExpectedCountFallsBackToFisher) {
    auto r = contingency_test_2x2(8, 2, 1, 5);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.test, "fisher_exact");
    EXPECT_NEAR(r.p_value, 400.0 / 11440.0, 1e-9);
    EXPECT_DOUBLE_EQ(r.statistic, 20.0);
}

TEST(StatisticalTestsTest, FisherExactSymmetricTableIsOne) {
    auto r = fisher_exact_2x2(3, 3, 3, 3);
    ASSERT_TRUE(r.ok());
    EXPECT_NEAR(r.p_value, 1.0, 1e-9);
}

TEST(StatisticalTestsTest, ZeroMarginIsInsufficientData) {
    EXPECT_EQ(contingency_test_2x2(0, 0, 5, 5).status, TestStatus::INSUFFICIENT_DATA);
    EXPECT_EQ(contingency_test_2x2(4, 0, 6, 0).status, TestStatus::INSUFFICIENT_DATA);
    EXPECT_EQ(fisher_exact_2x2(0, 3, 0, 4).status, TestStatus::INSUFFICIENT_DATA);
}

TEST(StatisticalTestsTest, NegativeCountThrows) {
    EXPECT_THROW(contingency_test_2x2(-1, 2, 3, 4), DataIntegrityError);
}

// ===========================================================================
// Kolmogorov-Smirnov
// ===========================================================================
TEST(StatisticalTestsTest, KsIdenticalSamples) {
    std::vector<double> x = {0.1, 0.5, 0.2, 0.9, 0.7};
    auto r = ks_two_sample(x, x);
    EXPECT_DOUBLE_EQ(r.statistic, 0.0);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
}

TEST(StatisticalTestsTest, KsDisjointSamples) {
    std::vector<double> x, y;
    for (int i = 0; i < 50; ++i) {
        x.push_back(i);
        y.push_back(100 + i);
    }
    auto r = ks_two_sample(x, y);
    EXPECT_DOUBLE_EQ(r.statistic, 1.0);
    EXPECT_LT(r.p_value, 1e-10);
}

TEST(StatisticalTestsTest, KsDetectsShift) {
    std::mt19937 rng(5);
    std::normal_distribution<double> a(0.0, 1.0);
    std::normal_distribution<double> b(1.0, 1.0);
    std::vector<double> x, y;
    for (int i = 0; i < 300; ++i) {
        x.push_back(a(rng));
        y.push_back(b(rng));
    }
    auto r = ks_two_sample(x, y);
    EXPECT_GT(r.statistic, 0.2);
    EXPECT_LT(r.p_value, 1e-4);
}

TEST(StatisticalTestsTest, KsExactSmallSamples) {
    // Disjoint samples of three: two of the C(6,3) = 20 splits reach D = 1.
    auto r = ks_two_sample({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0});
    EXPECT_DOUBLE_EQ(r.statistic, 1.0);
    EXPECT_NEAR(r.p_value, 0.1, 1e-12);
    EXPECT_TRUE(r.note.empty());

    r = ks_two_sample({1.0, 2.0, 3.0}, {2.5, 4.0, 5.0});
    EXPECT_NEAR(r.statistic, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(r.p_value, 0.6, 1e-12);

    r = ks_two_sample({1.0, 2.0}, {3.0, 4.0, 5.0});
    EXPECT_NEAR(r.p_value, 0.2, 1e-12);
}

TEST(StatisticalTestsTest, KsExactUnequalSizesMatchesSplitEnumeration) {
    // 188 of the C(12,5) = 792 splits give D >= 4/7.
    auto r = ks_two_sample({0.1, 0.4, 0.5, 0.9, 1.3},
                           {0.2, 0.6, 1.1, 1.5, 1.7, 1.9, 2.4});
    EXPECT_NEAR(r.statistic, 4.0 / 7.0, 1e-12);
    EXPECT_NEAR(r.p_value, 188.0 / 792.0, 1e-12);
}

TEST(StatisticalTestsTest, KsEmptySampleThrows) {
    EXPECT_THROW(ks_two_sample({}, {1.0}), DataIntegrityError);
}

// ===========================================================================
// McNemar
// ===========================================================================
TEST(StatisticalTestsTest, McNemarKnownValue) {
    auto r = mcnemar_test(10, 2);
    EXPECT_NEAR(r.statistic, 49.0 / 12.0, 1e-12);
    EXPECT_NEAR(r.p_value, 0.043308, 1e-5);
}

TEST(StatisticalTestsTest, McNemarNoDiscordantPairs) {
    auto r = mcnemar_test(0, 0);
    EXPECT_TRUE(r.ok());
    EXPECT_DOUBLE_EQ(r.statistic, 0.0);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
}
