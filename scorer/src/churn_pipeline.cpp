#include "churn_pipeline.hpp"
#include "business_rule.hpp"
#include "churn_errors.hpp"
#include "log.hpp"

std::vector<PredictionRow> scoreRecords(const RecordTable& records, const ScoringOptions& opts) {
  if (!records.hasColumn(kCustomerIdColumn)) {
    throw SchemaError(std::string("Missing customer id column: ") + kCustomerIdColumn);
  }

  // --- 1) features + labels ---
  const FeatureMatrix X = normalizeFeatures(records);
  std::optional<std::vector<int>> labels;
  if (records.hasColumn(opts.target_col)) {
    labels = labelsFromColumn(records, opts.target_col);
  } else {
    Log::write(LogLevel::Warn, "Target column '%s' not found; scoring without labels", opts.target_col.c_str());
  }

  // --- 2) model ---
  const ScoreResult scored = fitPredict(X, labels, opts.fit);

  // --- 3) reasons ---
  const Contributions contrib = computeContributions(scored.model, scored.standardized, opts.explain);
  const auto predicted_reasons = explainPredicted(scored, X, contrib, opts.explain);
  std::vector<RowExplanation> actual_reasons;
  if (labels) actual_reasons = explainActual(scored, X, contrib, *labels, opts.explain);

  // --- 4) business rule (independent of the model) ---
  const auto rules = evaluateBusinessRules(records, X, opts.today);

  std::vector<PredictionRow> out;
  out.reserve(records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    PredictionRow r;
    r.customer_id = records.cell(i, kCustomerIdColumn);
    r.snapshot_date = snapshotDate(records, i).value_or("");
    r.days_since_purchase = rules[i].days_since_purchase;
    r.business_churn_now = rules[i].churned_now;
    r.business_reason = rules[i].reason;
    if (labels) {
      r.has_actual = true;
      r.actual = (*labels)[i];
      r.actual_reason = actual_reasons[i].text;
    }
    r.predicted = scored.predicted[i];
    r.probability = scored.probability[i];
    r.probability_pct = probabilityPercent(scored.probability[i]);
    r.predicted_reason = predicted_reasons[i].text;
    out.push_back(std::move(r));
  }
  return out;
}
