#include "prediction_io.hpp"
#include "log.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

static std::string csvField(const std::string& s) {
  if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  return out + "\"";
}

static std::string fixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

EvalSummary summarize(const std::vector<PredictionRow>& rows) {
  EvalSummary s;
  for (const auto& r : rows) {
    if (!r.has_actual) continue;
    bool pred = r.predicted == 1, truth = r.actual == 1;
    if (pred && truth) ++s.tp;
    else if (pred && !truth) ++s.fp;
    else if (!pred && truth) ++s.fn;
    else ++s.tn;
  }
  return s;
}

std::string predictionHeader(HeaderStyle style, bool with_actual) {
  if (style == HeaderStyle::Friendly) {
    std::string h = "CustomerId,SnapshotDate,DaysSinceLastPurchaseToday,ChurnedNowBusinessRule,WhyBusinessRule,";
    if (with_actual) h += "ChurnedWithin90DaysActual,WhyTheyChurnedActual,";
    return h + "PredictedToChurnNext90Days,ChurnProbabilityPctNext90Days,ChurnProbabilityNext90Days,"
               "WhyAtRiskPredicted,CreatedOn\n";
  }
  std::string h = "customer_id,as_of_date_t0,days_since_last_purchase_today,business_churn_now,business_churn_reason,";
  if (with_actual) h += "actual_churned_90d,actual_churn_reason_t0,";
  return h + "predicted_churn_90d,predicted_churn_probability_90d,predicted_churn_probability_90d_pct,"
             "predicted_churn_reason_t0,created_on\n";
}

std::string predictionToCsv(const PredictionRow& r, HeaderStyle style, bool with_actual,
                            const std::string& created_on) {
  std::string line = csvField(r.customer_id) + "," +
                     csvField(r.snapshot_date) + "," +
                     std::to_string(r.days_since_purchase) + "," +
                     std::to_string(r.business_churn_now) + "," +
                     csvField(r.business_reason) + ",";
  if (with_actual) line += std::to_string(r.actual) + "," + csvField(r.actual_reason) + ",";
  // friendly puts the percentage first, technical the raw probability
  const std::string pct = fixed(r.probability_pct, 2), prob = fixed(r.probability, 6);
  return line + std::to_string(r.predicted) + "," +
         (style == HeaderStyle::Friendly ? pct + "," + prob : prob + "," + pct) + "," +
         csvField(r.predicted_reason) + "," +
         created_on + "\n";
}

bool writePredictionsCsv(const std::string& path, const std::vector<PredictionRow>& rows,
                         HeaderStyle style, const std::string& created_on) {
  const std::filesystem::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

  std::ofstream f(path, std::ios::trunc);
  if (!f.is_open()) {
    Log::write(LogLevel::Warn, "Could not open %s for writing", path.c_str());
    return false;
  }
  const bool with_actual = !rows.empty() && rows.front().has_actual;
  f << predictionHeader(style, with_actual);
  for (const auto& r : rows) f << predictionToCsv(r, style, with_actual, created_on);
  Log::write(LogLevel::Info, "Wrote %zu prediction rows to %s", rows.size(), path.c_str());
  return static_cast<bool>(f);
}
