#include "business_rule.hpp"
#include "civil_time.hpp"
#include <algorithm>
#include <cmath>

BusinessRuleResult evaluateBusinessRule(std::optional<long long> snapshot_day, bool in_grace, long long today) {
  BusinessRuleResult r;
  const long long days = snapshot_day ? std::max(0LL, today - *snapshot_day) : 0LL;
  r.days_since_purchase = static_cast<int>(days);
  r.threshold_days = kBaseChurnDays + (in_grace ? kGraceExtensionDays : 0);
  r.churned_now = days >= r.threshold_days ? 1 : 0;

  if (r.churned_now) {
    r.reason = "No purchases for " + std::to_string(days) + " days";
    if (in_grace && r.threshold_days > kBaseChurnDays) r.reason += "; Grace period exceeded";
  } else if (in_grace && days < r.threshold_days) {
    r.reason = "In renewal grace period (extra 30 days)";
  } else if (days < kBaseChurnDays) {
    r.reason = "Recent purchase within last 90 days";
  } else {
    r.reason = "Within adjusted threshold";
  }
  return r;
}

std::vector<BusinessRuleResult> evaluateBusinessRules(const RecordTable& records,
                                                      const FeatureMatrix& X, long long today) {
  const int grace_col = featureIndex(kRenewalGraceColumn);
  std::vector<BusinessRuleResult> out;
  out.reserve(records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    std::optional<long long> day;
    if (auto date = snapshotDate(records, i)) day = parseIsoDate(*date);

    bool in_grace = false;
    if (grace_col >= 0 && static_cast<Eigen::Index>(i) < X.rows()) {
      double g = X(static_cast<Eigen::Index>(i), grace_col);
      in_grace = !std::isnan(g) && g != 0.0;
    }
    out.push_back(evaluateBusinessRule(day, in_grace, today));
  }
  return out;
}
