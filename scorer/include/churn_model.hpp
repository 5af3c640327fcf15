#pragma once
#include "feature_normalizer.hpp"
#include <optional>
#include <vector>
#include <string>

struct Model {
    std::vector<std::string> features;
    std::vector<double> median;
    std::vector<double> mean;
    std::vector<double> scale;     // 0 marks a constant column (standardizes to 0)
    std::vector<double> coef;
    double intercept{};
    double threshold{0.5};
    bool trained{};                // false in the no-label degraded mode
    int iterations{};
    bool converged{};
};

struct FitOptions {
    double c = 1.0;                // inverse L2 strength; intercept is not penalized
    int max_iter = 100;            // Newton steps
    double tol = 1e-8;             // max-abs gradient at convergence
    bool balanced = true;          // weight classes by n / (2 * n_class)
};

struct ScoreResult {
    Model model;
    FeatureMatrix standardized;    // imputed + scaled, same shape as the input
    std::vector<int> predicted;
    std::vector<double> probability;
};

// Median / mean / scale per column. Columns with no observed value impute 0.
Model fitPreprocessing(const FeatureMatrix& X, const std::vector<std::string>& features);

// Imputes and scales X with the model's parameters.
FeatureMatrix standardize(const Model& model, const FeatureMatrix& X);

// Fits on (X, labels) and scores the same rows. Without labels every row gets
// probability 0 and label 0. Throws TrainingError on bad labels or solver failure.
ScoreResult fitPredict(const FeatureMatrix& X,
                       const std::optional<std::vector<int>>& labels,
                       const FitOptions& opts = {},
                       const std::vector<std::string>& features = featureNames());

// probability * 100 rounded to 2 decimals (half to even).
double probabilityPercent(double p);
