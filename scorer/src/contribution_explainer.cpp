#include "contribution_explainer.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <numeric>
#include <random>

const char* const kPredictedFallback = "elevated churn risk across multiple signals";
const char* const kActualFallback = "observed churn within 90 days";

// ---------- value formatting ----------

static std::string groupDigits(const std::string& digits) {
  std::string out;
  const size_t n = digits.size();
  for (size_t i = 0; i < n; ++i) {
    out += digits[i];
    if ((n - i - 1) % 3 == 0 && i + 1 < n) out += ',';
  }
  return out;
}

// |v| below 2^62 survives nearbyint -> long long and the negation after it
static bool fitsInteger(double v) {
  return std::fabs(v) < 4.6e18;
}

static std::string groupedFixed(double v, int decimals);

// "1,234" / "-1,234"
static std::string groupedInt(double v) {
  if (!fitsInteger(v)) return groupedFixed(std::nearbyint(v), 0);
  long long r = static_cast<long long>(std::nearbyint(v));
  std::string digits = std::to_string(r < 0 ? -r : r);
  return (r < 0 ? "-" : "") + groupDigits(digits);
}

// "1,234.50" / "-1,234.50"
static std::string groupedFixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, std::fabs(v));
  std::string s(buf);
  size_t dot = s.find('.');
  std::string head = dot == std::string::npos ? s : s.substr(0, dot);
  std::string tail = dot == std::string::npos ? "" : s.substr(dot);
  return (std::signbit(v) ? "-" : "") + groupDigits(head) + tail;
}

std::string formatFeatureValue(const FeatureSpec& spec, double value) {
  if (!std::isfinite(value)) return "";
  char buf[64];
  switch (spec.format) {
    case ValueFormat::Days:
      if (fitsInteger(value)) {
        std::snprintf(buf, sizeof(buf), "%lld days", static_cast<long long>(std::nearbyint(value)));
      } else {
        std::snprintf(buf, sizeof(buf), "%.0f days", value);
      }
      return buf;
    case ValueFormat::Count:
      return groupedInt(value);
    case ValueFormat::PerMonth:
      std::snprintf(buf, sizeof(buf), "%.2f per month", value);
      return buf;
    case ValueFormat::Percent:
      std::snprintf(buf, sizeof(buf), "%+.1f%%", value);
      return buf;
    case ValueFormat::Money:
      return (value < 0 ? "-$" : "$") + groupedFixed(std::fabs(value), 2);
    case ValueFormat::Generic:
    case ValueFormat::Flag:
      break;
  }
  if (std::fabs(value - std::nearbyint(value)) < 0.5) return groupedInt(value);
  return groupedFixed(value, 2);
}

// ---------- phrases ----------

static bool startsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

static std::string withValue(const std::string& label, const std::string& val) {
  return val.empty() ? label : label + " (" + val + ")";
}

std::string describeFeature(const FeatureSpec& spec, double value, double z) {
  const std::string label = spec.label;
  if (spec.format == ValueFormat::Flag) {
    return (std::isfinite(value) && value != 0.0) ? label : "";
  }
  const std::string val = formatFeatureValue(spec, value);

  switch (spec.direction) {
    case RiskDirection::Neg:
      if (std::isfinite(value) && value < 0) return label + " (" + val + ")";
      return "";
    case RiskDirection::High:
      if (!(z > 0)) return "";
      if (spec.signal_only) return label;
      if (startsWith(label, "No purchases for")) return val.empty() ? label : label + " " + val;
      return withValue(label, val);
    case RiskDirection::Low: {
      if (!(z < 0)) return "";
      const std::string base = spec.deficiency_label ? spec.deficiency_label : label;
      if (spec.signal_only) return base;
      return withValue(base, val);
    }
  }
  return "";
}

// ---------- contributions ----------

std::vector<size_t> backgroundSample(size_t rows, size_t cap, unsigned seed) {
  std::vector<size_t> idx(rows);
  std::iota(idx.begin(), idx.end(), 0);
  if (rows <= cap) return idx;

  std::mt19937 rng{seed};
  for (size_t i = 0; i < cap; ++i) {
    std::uniform_int_distribution<size_t> pick(i, rows - 1);
    std::swap(idx[i], idx[pick(rng)]);
  }
  idx.resize(cap);
  std::sort(idx.begin(), idx.end());
  return idx;
}

static Eigen::RowVectorXd coefRow(const Model& model) {
  Eigen::RowVectorXd w(static_cast<Eigen::Index>(model.coef.size()));
  for (size_t j = 0; j < model.coef.size(); ++j) w(static_cast<Eigen::Index>(j)) = model.coef[j];
  return w;
}

Contributions computeContributions(const Model& model, const FeatureMatrix& standardized,
                                   const ExplainerOptions& opts) {
  Contributions out;
  const Eigen::RowVectorXd w = coefRow(model);
  if (w.size() != standardized.cols()) {
    // explainRow degrades every row on the resulting width mismatch
    Log::write(LogLevel::Warn, "Coefficient count %td does not match %td feature columns",
               static_cast<std::ptrdiff_t>(w.size()), static_cast<std::ptrdiff_t>(standardized.cols()));
    out.values.resize(standardized.rows(), 0);
    return out;
  }

  const bool additive = opts.use_attribution && model.trained && standardized.rows() > 0;
  if (additive) {
    const auto bg = backgroundSample(static_cast<size_t>(standardized.rows()), opts.background_cap, opts.seed);
    Eigen::RowVectorXd mu = Eigen::RowVectorXd::Zero(standardized.cols());
    for (size_t r : bg) mu += standardized.row(static_cast<Eigen::Index>(r));
    mu /= static_cast<double>(bg.size());

    Eigen::MatrixXd phi = ((standardized.rowwise() - mu).array().rowwise() * w.array()).matrix();
    if (phi.allFinite()) {
      out.values = std::move(phi);
      out.source = AttributionSource::Additive;
      Log::write(LogLevel::Info, "Additive attribution against %zu background rows", bg.size());
      return out;
    }
    Log::write(LogLevel::Warn, "Additive attribution produced non-finite values; using weight x value");
  }

  out.values = (standardized.array().rowwise() * w.array()).matrix();
  out.source = AttributionSource::WeightTimesValue;
  return out;
}

// ---------- ranking ----------

static RowExplanation fallbackRow(ExplainStatus status, const char* fallback) {
  RowExplanation r;
  r.status = status;
  r.text = fallback;
  return r;
}

RowExplanation explainRow(const std::vector<double>& contrib,
                          const std::vector<double>& raw,
                          const std::vector<double>& z,
                          RankMode mode, const char* fallback,
                          size_t max_phrases) {
  if (contrib.size() != kFeatureCount || raw.size() != kFeatureCount || z.size() != kFeatureCount) {
    return fallbackRow(ExplainStatus::Degraded, fallback);
  }
  for (size_t j = 0; j < kFeatureCount; ++j) {
    if (!std::isfinite(contrib[j]) || !std::isfinite(z[j])) return fallbackRow(ExplainStatus::Degraded, fallback);
  }

  std::vector<size_t> order(kFeatureCount);
  std::iota(order.begin(), order.end(), 0);
  if (mode == RankMode::PositiveOnly) {
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return contrib[a] > contrib[b]; });
  } else {
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return std::fabs(contrib[a]) > std::fabs(contrib[b]); });
  }

  RowExplanation r;
  for (size_t j : order) {
    if (r.phrases.size() >= max_phrases) break;
    if (mode == RankMode::PositiveOnly && !(contrib[j] > 0)) break;
    std::string phrase = describeFeature(kFeatures[j], raw[j], z[j]);
    if (!phrase.empty()) r.phrases.push_back(std::move(phrase));
  }
  if (r.phrases.empty()) return fallbackRow(ExplainStatus::NoDriver, fallback);

  r.status = ExplainStatus::Explained;
  for (size_t i = 0; i < r.phrases.size(); ++i) {
    if (i) r.text += "; ";
    r.text += r.phrases[i];
  }
  return r;
}

static std::vector<double> rowOf(const Eigen::MatrixXd& m, Eigen::Index i) {
  std::vector<double> v(static_cast<size_t>(m.cols()));
  for (Eigen::Index j = 0; j < m.cols(); ++j) v[static_cast<size_t>(j)] = m(i, j);
  return v;
}

static bool sameShape(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
  return a.rows() == b.rows() && a.cols() == b.cols();
}

std::vector<RowExplanation> explainPredicted(const ScoreResult& scored, const FeatureMatrix& raw,
                                             const Contributions& contrib,
                                             const ExplainerOptions& opts) {
  const size_t n = scored.predicted.size();
  std::vector<RowExplanation> out;
  out.reserve(n);
  const bool usable = scored.model.trained && static_cast<size_t>(raw.rows()) == n &&
                      sameShape(raw, scored.standardized) && sameShape(raw, contrib.values);
  if (!usable) {
    if (n) Log::write(LogLevel::Warn, "Predicted reasons unavailable for %zu rows; using fallback phrase", n);
    for (size_t i = 0; i < n; ++i) out.push_back(fallbackRow(ExplainStatus::Degraded, kPredictedFallback));
    return out;
  }

  size_t degraded = 0;
  for (size_t i = 0; i < n; ++i) {
    const auto row = static_cast<Eigen::Index>(i);
    RankMode mode = scored.predicted[i] == 1 ? RankMode::PositiveOnly : RankMode::AbsoluteMagnitude;
    out.push_back(explainRow(rowOf(contrib.values, row), rowOf(raw, row), rowOf(scored.standardized, row),
                             mode, kPredictedFallback, opts.max_phrases));
    if (out.back().status == ExplainStatus::Degraded) ++degraded;
  }
  if (degraded) Log::write(LogLevel::Warn, "%zu rows fell back to the generic predicted reason", degraded);
  return out;
}

std::vector<RowExplanation> explainActual(const ScoreResult& scored, const FeatureMatrix& raw,
                                          const Contributions& contrib,
                                          const std::vector<int>& actual,
                                          const ExplainerOptions& opts) {
  const size_t n = actual.size();
  std::vector<RowExplanation> out(n);
  for (auto& r : out) r.status = ExplainStatus::Explained;  // empty reason for actual == 0

  const bool usable = scored.model.trained && static_cast<size_t>(raw.rows()) == n &&
                      sameShape(raw, scored.standardized) && sameShape(raw, contrib.values);
  for (size_t i = 0; i < n; ++i) {
    if (actual[i] != 1) continue;
    if (!usable) { out[i] = fallbackRow(ExplainStatus::Degraded, kActualFallback); continue; }
    const auto row = static_cast<Eigen::Index>(i);
    out[i] = explainRow(rowOf(contrib.values, row), rowOf(raw, row), rowOf(scored.standardized, row),
                        RankMode::PositiveOnly, kActualFallback, opts.max_phrases);
  }
  return out;
}
