#pragma once
#include "contribution_explainer.hpp"
#include "prediction_io.hpp"
#include "record_table.hpp"
#include <string>
#include <vector>

struct ScoringOptions {
  std::string target_col = "churned_hard90";  // labels used when this column exists
  long long today{};                           // business-rule reference day
  FitOptions fit;
  ExplainerOptions explain;
};

// Normalize -> fit/predict -> explain -> business rule, one output row per record.
// SchemaError / TrainingError propagate; explanation problems never do.
std::vector<PredictionRow> scoreRecords(const RecordTable& records, const ScoringOptions& opts);
