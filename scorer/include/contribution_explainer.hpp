#pragma once
#include "churn_model.hpp"
#include "feature_schema.hpp"
#include <cstddef>
#include <string>
#include <vector>

enum class AttributionSource {
  Additive,          // coef * (z - background mean)
  WeightTimesValue   // coef * z
};

struct ExplainerOptions {
  bool use_attribution = true;
  std::size_t background_cap = 512;
  unsigned seed = 42;
  std::size_t max_phrases = 3;
};

// Signed per-feature contributions in logit space, rows x features.
struct Contributions {
  Eigen::MatrixXd values;
  AttributionSource source{AttributionSource::WeightTimesValue};
};

enum class RankMode {
  PositiveOnly,      // risk-increasing drivers, largest first
  AbsoluteMagnitude  // strongest drivers either way
};

enum class ExplainStatus {
  Explained,  // at least one phrase rendered
  NoDriver,   // nothing qualified, fallback phrase used
  Degraded    // row could not be explained, fallback phrase used
};

struct RowExplanation {
  ExplainStatus status{ExplainStatus::NoDriver};
  std::vector<std::string> phrases;
  std::string text;
};

extern const char* const kPredictedFallback;  // "elevated churn risk across multiple signals"
extern const char* const kActualFallback;     // "observed churn within 90 days"

// Deterministic subset of row indices of size min(rows, cap), ascending.
std::vector<std::size_t> backgroundSample(std::size_t rows, std::size_t cap, unsigned seed);

// Falls back to WeightTimesValue when attribution is disabled, the model is
// untrained, or the additive result is not finite.
Contributions computeContributions(const Model& model, const FeatureMatrix& standardized,
                                   const ExplainerOptions& opts = {});

std::string formatFeatureValue(const FeatureSpec& spec, double value);

// Phrase for one feature given its raw value and standardized value z, or ""
// when the feature does not point toward risk for this row.
std::string describeFeature(const FeatureSpec& spec, double value, double z);

// Ranks one row's contributions and renders up to max_phrases phrases.
// All three vectors are in schema order.
RowExplanation explainRow(const std::vector<double>& contrib,
                          const std::vector<double>& raw,
                          const std::vector<double>& z,
                          RankMode mode, const char* fallback,
                          std::size_t max_phrases = 3);

// Reasons for every row's predicted label.
std::vector<RowExplanation> explainPredicted(const ScoreResult& scored, const FeatureMatrix& raw,
                                             const Contributions& contrib,
                                             const ExplainerOptions& opts = {});

// Reasons for rows whose actual label is 1; other rows get an empty Explained entry.
std::vector<RowExplanation> explainActual(const ScoreResult& scored, const FeatureMatrix& raw,
                                          const Contributions& contrib,
                                          const std::vector<int>& actual,
                                          const ExplainerOptions& opts = {});
