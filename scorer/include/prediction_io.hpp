#pragma once
#include "scorer_config.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct PredictionRow {
  std::string customer_id;
  std::string snapshot_date;        // as delivered, empty when missing
  int days_since_purchase{};
  int business_churn_now{};
  std::string business_reason;
  bool has_actual{};                // label column was present
  int actual{};
  std::string actual_reason;
  int predicted{};
  double probability{};             // 0..1
  double probability_pct{};         // rounded to 2 decimals
  std::string predicted_reason;
};

struct EvalSummary {
  int tp{}, fp{}, fn{}, tn{};
  double precision() const { return (tp + fp) ? static_cast<double>(tp) / (tp + fp) : 0.0; }
  double recall() const { return (tp + fn) ? static_cast<double>(tp) / (tp + fn) : 0.0; }
};

EvalSummary summarize(const std::vector<PredictionRow>& rows);

std::string predictionHeader(HeaderStyle style, bool with_actual);
// Probability columns follow the header order of `style`.
std::string predictionToCsv(const PredictionRow& r, HeaderStyle style, bool with_actual,
                            const std::string& created_on);

// Whole file in one go. Returns false if the file cannot be opened.
bool writePredictionsCsv(const std::string& path, const std::vector<PredictionRow>& rows,
                         HeaderStyle style, const std::string& created_on);
