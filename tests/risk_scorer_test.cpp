// risk_scorer_test.cpp — tests for the scorer seam and the XGBoost-backed
// risk scorer

#include <gtest/gtest.h>
#include <xgboost/c_api.h>

#include "scoring/gbt_risk_scorer.hpp"
#include "scoring/risk_scorer.hpp"
#include "test_record_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace {

// Sum of the feature row; lets attach_scores be checked without a model.
class SumScorer : public RiskScorer {
public:
    std::vector<double> predict(const FeatureMatrix& features) const override {
        std::vector<double> out;
        for (const auto& row : features) {
            double s = 0.0;
            for (float f : row) s += f;
            out.push_back(s);
        }
        return out;
    }
};

class ShortScorer : public RiskScorer {
public:
    std::vector<double> predict(const FeatureMatrix&) const override { return {0.5}; }
};

class NanScorer : public RiskScorer {
public:
    std::vector<double> predict(const FeatureMatrix& features) const override {
        return std::vector<double>(features.size(), std::numeric_limits<double>::quiet_NaN());
    }
};

std::string temp_model_path(const std::string& suffix) {
    return (std::filesystem::temp_directory_path() / ("risk_scorer_test" + suffix + ".json"))
        .string();
}

// Trains a small booster on one feature: x in [0, 1), label = f(x).
// num_class > 0 trains multi:softprob with label = floor(x * num_class).
void train_model(const std::string& path, int num_class) {
    const int n = 200;
    std::vector<float> x(n), y(n);
    for (int i = 0; i < n; ++i) {
        x[i] = static_cast<float>(i) / n;
        y[i] = num_class > 0 ? std::floor(x[i] * num_class) : x[i];
    }
    DMatrixHandle dmat = nullptr;
    ASSERT_EQ(XGDMatrixCreateFromMat(x.data(), n, 1, std::numeric_limits<float>::quiet_NaN(),
                                     &dmat), 0);
    ASSERT_EQ(XGDMatrixSetFloatInfo(dmat, "label", y.data(), n), 0);

    BoosterHandle booster = nullptr;
    ASSERT_EQ(XGBoosterCreate(&dmat, 1, &booster), 0);
    if (num_class > 0) {
        XGBoosterSetParam(booster, "objective", "multi:softprob");
        XGBoosterSetParam(booster, "num_class", std::to_string(num_class).c_str());
    } else {
        XGBoosterSetParam(booster, "objective", "reg:squarederror");
    }
    XGBoosterSetParam(booster, "max_depth", "3");
    XGBoosterSetParam(booster, "nthread", "1");
    XGBoosterSetParam(booster, "seed", "42");
    for (int it = 0; it < 30; ++it) {
        ASSERT_EQ(XGBoosterUpdateOneIter(booster, it, dmat), 0);
    }
    ASSERT_EQ(XGBoosterSaveModel(booster, path.c_str()), 0);
    XGBoosterFree(booster);
    XGDMatrixFree(dmat);
}

}  // anonymous namespace

// ===========================================================================
// attach_scores
// ===========================================================================
TEST(RiskScorerTest, AttachAppendsOutputColumn) {
    auto rs = test_helpers::make_uniform_records(10);
    auto out = attach_scores(rs, SumScorer{}, {"severity", "noise"}, "model_risk");
    ASSERT_EQ(out.score_names.back(), "model_risk");
    EXPECT_EQ(rs.score_names.size() + 1, out.score_names.size());
    for (size_t i = 0; i < out.size(); ++i) {
        float expect = static_cast<float>(rs.records[i].scores[1]) +
                       static_cast<float>(rs.records[i].scores[2]);
        EXPECT_NEAR(out.records[i].scores.back(), expect, 1e-6);
    }
}

TEST(RiskScorerTest, AttachRejectsBadInputsAndOutputs) {
    auto rs = test_helpers::make_uniform_records(10);
    EXPECT_THROW(attach_scores(rs, SumScorer{}, {"severity"}, "risk_score"), ConfigurationError);
    EXPECT_THROW(attach_scores(rs, SumScorer{}, {"missing"}, "model_risk"), ConfigurationError);
    EXPECT_THROW(attach_scores(rs, SumScorer{}, {}, "model_risk"), ConfigurationError);
    EXPECT_THROW(attach_scores(rs, ShortScorer{}, {"severity"}, "model_risk"), DataIntegrityError);
    EXPECT_THROW(attach_scores(rs, NanScorer{}, {"severity"}, "model_risk"), DataIntegrityError);
}

// ===========================================================================
// GbtRiskScorer
// ===========================================================================
TEST(RiskScorerTest, RegressionModelTracksTarget) {
    auto path = temp_model_path("_reg");
    train_model(path, 0);
    GbtRiskScorer scorer(path);
    EXPECT_EQ(scorer.num_features(), 1u);

    auto scores = scorer.predict({{0.05f}, {0.5f}, {0.95f}});
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_LT(scores[0], scores[1]);
    EXPECT_LT(scores[1], scores[2]);
    EXPECT_NEAR(scores[1], 0.5, 0.1);
    std::filesystem::remove(path);
}

TEST(RiskScorerTest, MultiClassOutputIndexSelectsColumn) {
    auto path = temp_model_path("_multi");
    train_model(path, 3);
    GbtRiskScorer last(path);
    GbtRiskScorer first(path, 0);

    auto p_last = last.predict({{0.9f}, {0.1f}});
    auto p_first = first.predict({{0.9f}, {0.1f}});
    EXPECT_GT(p_last[0], 0.5);
    EXPECT_LT(p_last[1], 0.5);
    EXPECT_GT(p_first[1], 0.5);

    GbtRiskScorer out_of_range(path, 5);
    EXPECT_THROW(out_of_range.predict({{0.5f}}), ConfigurationError);
    std::filesystem::remove(path);
}

TEST(RiskScorerTest, MissingFeaturesAreAccepted) {
    auto path = temp_model_path("_nan");
    train_model(path, 0);
    GbtRiskScorer scorer(path);
    auto scores = scorer.predict({{std::numeric_limits<float>::quiet_NaN()}});
    ASSERT_EQ(scores.size(), 1u);
    EXPECT_TRUE(std::isfinite(scores[0]));
    std::filesystem::remove(path);
}

TEST(RiskScorerTest, ScorerPlugsIntoAttachScores) {
    auto path = temp_model_path("_attach");
    train_model(path, 0);
    GbtRiskScorer scorer(path);
    auto rs = test_helpers::make_uniform_records(20);
    auto out = attach_scores(rs, scorer, {"severity"}, "model_risk");
    EXPECT_EQ(out.score_index("model_risk"), 3);
    std::filesystem::remove(path);
}

TEST(RiskScorerTest, BadModelAndRaggedInputThrow) {
    EXPECT_THROW(GbtRiskScorer("/nonexistent_dir_xyz/model.json"), std::runtime_error);

    auto path = temp_model_path("_ragged");
    train_model(path, 0);
    GbtRiskScorer scorer(path);
    EXPECT_THROW(scorer.predict({{0.1f}, {0.1f, 0.2f}}), DataIntegrityError);
    EXPECT_TRUE(scorer.predict({}).empty());
    std::filesystem::remove(path);
}
