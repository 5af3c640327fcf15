#include "churn_model.hpp"
#include "churn_errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>

namespace {

struct Dataset {
  FeatureMatrix X;
  std::vector<int> y;
};

// Label driven by columns 0 and 5; deterministic.
Dataset makeDataset(int n, double positive_bias = 0.0, unsigned seed = 11) {
  std::mt19937 rng{seed};
  std::normal_distribution<double> g(0.0, 1.0);
  Dataset d;
  d.X.resize(n, static_cast<Eigen::Index>(kFeatureCount));
  for (int i = 0; i < n; ++i) {
    for (size_t j = 0; j < kFeatureCount; ++j) d.X(i, static_cast<Eigen::Index>(j)) = g(rng);
    double z = 2.0 * d.X(i, 0) - 1.5 * d.X(i, 5) + positive_bias + 0.5 * g(rng);
    d.y.push_back(z > 0 ? 1 : 0);
  }
  return d;
}

}  // namespace

TEST(ChurnModel, ConstantColumnKeepsProbabilitiesFinite) {
  Dataset d = makeDataset(200);
  d.X.col(3).setConstant(7.0);

  ScoreResult r = fitPredict(d.X, d.y);
  EXPECT_EQ(r.model.scale[3], 0.0);
  EXPECT_TRUE(r.standardized.col(3).isZero());
  for (double p : r.probability) {
    ASSERT_TRUE(std::isfinite(p));
    EXPECT_GE(p, 0.0);
    EXPECT_LE(p, 1.0);
  }
  EXPECT_TRUE(std::isfinite(r.model.coef[3]));
  EXPECT_NEAR(r.model.coef[3], 0.0, 1e-9);
}

TEST(ChurnModel, EntirelyMissingColumnImputesZero) {
  Dataset d = makeDataset(80);
  d.X.col(10).setConstant(std::numeric_limits<double>::quiet_NaN());
  ScoreResult r = fitPredict(d.X, d.y);
  EXPECT_EQ(r.model.median[10], 0.0);
  for (double p : r.probability) EXPECT_TRUE(std::isfinite(p));
}

TEST(ChurnModel, LabelCountMismatchIsATrainingError) {
  Dataset d = makeDataset(20);
  d.y.pop_back();
  EXPECT_THROW(fitPredict(d.X, d.y), TrainingError);
}

TEST(ChurnModel, SingleClassIsATrainingError) {
  Dataset d = makeDataset(20);
  std::fill(d.y.begin(), d.y.end(), 1);
  EXPECT_THROW(fitPredict(d.X, d.y), TrainingError);
}

TEST(ChurnModel, NoLabelsMeansZeroScores) {
  Dataset d = makeDataset(30);
  ScoreResult r = fitPredict(d.X, std::nullopt);
  EXPECT_FALSE(r.model.trained);
  ASSERT_EQ(r.probability.size(), 30u);
  for (size_t i = 0; i < 30; ++i) {
    EXPECT_EQ(r.probability[i], 0.0);
    EXPECT_EQ(r.predicted[i], 0);
  }
  EXPECT_EQ(r.standardized.rows(), 30);
}

TEST(ChurnModel, LearnsTheSignalAndConverges) {
  Dataset d = makeDataset(400);
  ScoreResult r = fitPredict(d.X, d.y);
  EXPECT_TRUE(r.model.trained);
  EXPECT_TRUE(r.model.converged);
  EXPECT_GT(r.model.coef[0], 0.5);
  EXPECT_LT(r.model.coef[5], -0.5);

  int correct = 0;
  for (size_t i = 0; i < d.y.size(); ++i) {
    EXPECT_EQ(r.predicted[i], r.probability[i] >= 0.5 ? 1 : 0);
    correct += r.predicted[i] == d.y[i];
  }
  EXPECT_GT(correct, 320);
}

TEST(ChurnModel, RepeatedFitsAreIdentical) {
  Dataset d = makeDataset(150);
  ScoreResult a = fitPredict(d.X, d.y);
  ScoreResult b = fitPredict(d.X, d.y);
  ASSERT_EQ(a.model.coef.size(), b.model.coef.size());
  for (size_t j = 0; j < a.model.coef.size(); ++j) EXPECT_DOUBLE_EQ(a.model.coef[j], b.model.coef[j]);
  EXPECT_DOUBLE_EQ(a.model.intercept, b.model.intercept);
  EXPECT_EQ(a.predicted, b.predicted);
}

TEST(ChurnModel, BalancedWeightsLiftTheMinorityClass) {
  Dataset d = makeDataset(300, -2.5);
  int pos = 0;
  for (int v : d.y) pos += v;
  ASSERT_GT(pos, 5);
  ASSERT_LT(pos, 100);

  FitOptions plain;
  plain.balanced = false;
  ScoreResult unweighted = fitPredict(d.X, d.y, plain);
  ScoreResult balanced = fitPredict(d.X, d.y);
  EXPECT_GT(balanced.model.intercept, unweighted.model.intercept);
}

TEST(ChurnModel, MedianImputationUsesObservedValues) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  FeatureMatrix X = FeatureMatrix::Zero(4, static_cast<Eigen::Index>(kFeatureCount));
  X(0, 1) = 1.0; X(1, 1) = nan; X(2, 1) = 3.0; X(3, 1) = 10.0;
  X(0, 2) = 1.0; X(1, 2) = 2.0; X(2, 2) = 3.0; X(3, 2) = 4.0;

  Model m = fitPreprocessing(X, featureNames());
  EXPECT_DOUBLE_EQ(m.median[1], 3.0);
  EXPECT_DOUBLE_EQ(m.median[2], 2.5);
  EXPECT_DOUBLE_EQ(m.mean[1], (1.0 + 3.0 + 3.0 + 10.0) / 4.0);

  FeatureMatrix Z = standardize(m, X);
  EXPECT_NEAR(Z.col(2).mean(), 0.0, 1e-12);
  EXPECT_NEAR(std::sqrt(Z.col(2).squaredNorm() / 4.0), 1.0, 1e-12);
}

TEST(ChurnModel, ProbabilityFollowsFittedLinearModel) {
  Dataset d = makeDataset(120);
  d.X(4, 2) = std::numeric_limits<double>::quiet_NaN();
  ScoreResult r = fitPredict(d.X, d.y);
  FeatureMatrix Z = standardize(r.model, d.X);
  for (Eigen::Index i : {0, 4, 77}) {
    double z = r.model.intercept;
    for (size_t j = 0; j < kFeatureCount; ++j) z += r.model.coef[j] * Z(i, static_cast<Eigen::Index>(j));
    EXPECT_NEAR(1.0 / (1.0 + std::exp(-z)), r.probability[static_cast<size_t>(i)], 1e-12);
  }
  EXPECT_THROW(standardize(r.model, FeatureMatrix(2, 3)), std::runtime_error);
}

TEST(ChurnModel, ProbabilityPercentRoundsToTwoDecimals) {
  EXPECT_DOUBLE_EQ(probabilityPercent(0.123456), 12.35);
  EXPECT_DOUBLE_EQ(probabilityPercent(0.5), 50.0);
  EXPECT_DOUBLE_EQ(probabilityPercent(0.0), 0.0);
  EXPECT_DOUBLE_EQ(probabilityPercent(1.0), 100.0);
}
