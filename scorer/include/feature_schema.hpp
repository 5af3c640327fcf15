#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <vector>

// Which raw-value direction pushes churn risk up.
enum class RiskDirection { High, Low, Neg };

enum class ValueFormat {
  Days,       // "42 days"
  Count,      // "1,234"
  PerMonth,   // "1.33 per month"
  Percent,    // "+12.5%"
  Money,      // "$1,234.56" / "-$1,234.56"
  Generic,
  Flag        // fixed phrase when true, nothing when false
};

struct FeatureSpec {
  const char* name;
  RiskDirection direction;
  const char* label;
  const char* deficiency_label;  // used by Low features; nullptr keeps label
  ValueFormat format;
  bool signal_only;              // model component: render label without value
};

constexpr std::size_t kFeatureCount = 26;

// Order is a contract with the record source: matrix column j is kFeatures[j].
extern const std::array<FeatureSpec, kFeatureCount> kFeatures;

const std::vector<std::string>& featureNames();
// Index into kFeatures, or -1.
int featureIndex(const std::string& name);

extern const char* const kCustomerIdColumn;   // "customer_id"
extern const char* const kSnapshotDateColumn; // "as_of_date"
extern const char* const kDefaultTargetColumn;// "churned_hard90"
extern const char* const kRenewalGraceColumn; // "in_renewal_grace"
