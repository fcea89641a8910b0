#pragma once

#include "scoring/risk_scorer.hpp"

#include <xgboost/c_api.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GbtRiskScorer — XGBoost C API booster loaded from a saved model
//
// Regression and binary models yield one value per row. For multi-class
// probability output, `output_index` picks the class column (-1 = last).
// NaN features are treated as missing.
// ---------------------------------------------------------------------------
class GbtRiskScorer : public RiskScorer {
public:
    explicit GbtRiskScorer(const std::string& model_path, int output_index = -1)
        : booster_(nullptr), output_index_(output_index) {
        check(XGBoosterCreate(nullptr, 0, &booster_));
        int rc = XGBoosterLoadModel(booster_, model_path.c_str());
        if (rc != 0) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
            throw std::runtime_error("Failed to load model from: " + model_path + ": " +
                                     XGBGetLastError());
        }
    }

    ~GbtRiskScorer() override {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }
    }

    // Non-copyable
    GbtRiskScorer(const GbtRiskScorer&) = delete;
    GbtRiskScorer& operator=(const GbtRiskScorer&) = delete;

    GbtRiskScorer(GbtRiskScorer&& other) noexcept
        : booster_(other.booster_), output_index_(other.output_index_) {
        other.booster_ = nullptr;
    }

    std::vector<double> predict(const FeatureMatrix& features) const override {
        if (features.empty()) return {};
        size_t n = features.size();
        size_t dim = features.front().size();
        if (dim == 0) {
            throw ConfigurationError("feature rows are empty");
        }

        std::vector<float> flat;
        flat.reserve(n * dim);
        for (const auto& row : features) {
            if (row.size() != dim) {
                throw DataIntegrityError("ragged feature matrix");
            }
            flat.insert(flat.end(), row.begin(), row.end());
        }

        DMatrixHandle dmat;
        check(XGDMatrixCreateFromMat(flat.data(), static_cast<bst_ulong>(n),
                                     static_cast<bst_ulong>(dim),
                                     std::numeric_limits<float>::quiet_NaN(), &dmat));
        DMatrixGuard guard(dmat);

        bst_ulong out_len = 0;
        const float* out_result = nullptr;
        check(XGBoosterPredict(booster_, guard.handle, 0, 0, 0, &out_len, &out_result));

        if (out_len % n != 0) {
            throw std::runtime_error("XGBoost returned " + std::to_string(out_len) +
                                     " values for " + std::to_string(n) + " rows");
        }
        size_t width = static_cast<size_t>(out_len) / n;
        int col = output_index_ < 0 ? static_cast<int>(width) - 1 : output_index_;
        if (col < 0 || static_cast<size_t>(col) >= width) {
            throw ConfigurationError("output index " + std::to_string(output_index_) +
                                     " outside model output width " + std::to_string(width));
        }

        std::vector<double> scores(n);
        for (size_t i = 0; i < n; ++i) {
            scores[i] = static_cast<double>(out_result[i * width + static_cast<size_t>(col)]);
        }
        return scores;
    }

    size_t num_features() const {
        bst_ulong out = 0;
        check(XGBoosterGetNumFeature(booster_, &out));
        return static_cast<size_t>(out);
    }

private:
    BoosterHandle booster_;
    int output_index_;

    // RAII guard for DMatrixHandle — prevents leaks on exception
    struct DMatrixGuard {
        DMatrixHandle handle = nullptr;
        explicit DMatrixGuard(DMatrixHandle h) : handle(h) {}
        ~DMatrixGuard() { if (handle) XGDMatrixFree(handle); }
        DMatrixGuard(const DMatrixGuard&) = delete;
        DMatrixGuard& operator=(const DMatrixGuard&) = delete;
    };

    static void check(int rc) {
        if (rc != 0) {
            throw std::runtime_error(std::string("XGBoost error: ") + XGBGetLastError());
        }
    }
};
