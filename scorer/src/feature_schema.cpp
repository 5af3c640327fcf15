#include "feature_schema.hpp"

const char* const kCustomerIdColumn = "customer_id";
const char* const kSnapshotDateColumn = "as_of_date";
const char* const kDefaultTargetColumn = "churned_hard90";
const char* const kRenewalGraceColumn = "in_renewal_grace";

using D = RiskDirection;
using F = ValueFormat;

const std::array<FeatureSpec, kFeatureCount> kFeatures = {{
  {"recency_days",            D::High, "No purchases for",                         nullptr, F::Days,     false},
  {"median_gap_days",         D::High, "Typical gap between purchases",            nullptr, F::Days,     false},
  {"p90_gap_days",            D::High, "Long purchase gaps (90th percentile)",     nullptr, F::Days,     false},
  {"cv_gap",                  D::High, "Irregular buying cadence",                 nullptr, F::Generic,  false},
  {"in_renewal_grace",        D::High, "In renewal grace period",                  nullptr, F::Flag,     false},
  {"rev_180d",                D::Low,  "Revenue in last 180 days",                 "Low recent revenue", F::Money, false},
  {"rev_returns_90d",         D::High, "Returns value in last 90 days",            nullptr, F::Money,    false},
  {"invoices_90d",            D::Low,  "Invoices in last 90 days",                 "Few invoices in last 90 days", F::Count, false},
  {"credit_notes_90d",        D::High, "Credit notes in last 90 days",             nullptr, F::Count,    false},
  {"orders_pos_30d",          D::Low,  "Positive order value in last 30 days",     "Low positive order value (last 30 days)", F::Money, false},
  {"orders_neg_30d",          D::High, "Negative order value in last 30 days",     nullptr, F::Money,    false},
  {"backorder_qty_30d",       D::High, "Backorder quantity in last 30 days",       nullptr, F::Count,    false},
  {"pct_change_3m",           D::Neg,  "Change vs prior 3 months",                 nullptr, F::Percent,  false},
  {"pct_change_6m",           D::Neg,  "Change vs prior 6 months",                 nullptr, F::Percent,  false},
  {"yoy_change_pct",          D::Neg,  "Year-over-year change",                    nullptr, F::Percent,  false},
  {"credit_notes_prev_month", D::High, "Credit notes last month",                  nullptr, F::Count,    false},
  {"invoices_pos_prev_month", D::Low,  "Invoices last month",                      "Few invoices last month", F::Count, false},
  {"credit_notes_ma3",        D::High, "Credit notes per month (3-month average)", nullptr, F::PerMonth, false},
  {"threshold_days",          D::High, "Days past expected purchase threshold",    nullptr, F::Days,     false},
  {"is_maintenance_heavy",    D::High, "Maintenance-heavy profile",                nullptr, F::Flag,     false},
  {"maint_cycle_days",        D::High, "Maintenance cycle length",                 nullptr, F::Days,     false},
  {"severity_score",          D::High, "Issue severity score",                     nullptr, F::Generic,  false},
  {"lateness_component",      D::High, "Late purchase signal",                     nullptr, F::Generic,  true},
  {"credits_component",       D::High, "Credits/returns signal",                   nullptr, F::Generic,  true},
  {"trend_component",         D::High, "Negative trend signal",                    nullptr, F::Generic,  true},
  {"mitigator_component",     D::Low,  "Mitigating signals",                       "Few mitigating signals", F::Generic, true},
}};

const std::vector<std::string>& featureNames() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> v;
    v.reserve(kFeatures.size());
    for (const auto& f : kFeatures) v.emplace_back(f.name);
    return v;
  }();
  return names;
}

int featureIndex(const std::string& name) {
  for (std::size_t i = 0; i < kFeatures.size(); ++i) {
    if (name == kFeatures[i].name) return static_cast<int>(i);
  }
  return -1;
}
