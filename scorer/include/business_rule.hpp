#pragma once
#include "record_table.hpp"
#include "feature_normalizer.hpp"
#include <optional>
#include <string>
#include <vector>

constexpr int kBaseChurnDays = 90;
constexpr int kGraceExtensionDays = 30;

struct BusinessRuleResult {
  int days_since_purchase{};
  int threshold_days{kBaseChurnDays};
  int churned_now{};
  std::string reason;
};

// snapshot_day: days since epoch of the last purchase, nullopt when unknown
// (counts as 0 days, so a bad date never flags churn).
BusinessRuleResult evaluateBusinessRule(std::optional<long long> snapshot_day, bool in_grace, long long today);

// One result per record: the snapshot date column plus the renewal-grace
// feature (column j of X). Independent of any model output.
std::vector<BusinessRuleResult> evaluateBusinessRules(const RecordTable& records,
                                                      const FeatureMatrix& X, long long today);
