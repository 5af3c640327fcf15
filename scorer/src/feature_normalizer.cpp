#include "feature_normalizer.hpp"
#include "churn_errors.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

static std::string trimLower(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  std::string out = s.substr(b, e - b);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

double coerceCell(const std::string& text) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const std::string s = trimLower(text);
  if (s.empty()) return nan;
  if (s == "true") return 1.0;
  if (s == "false") return 0.0;

  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return nan;
  if (!std::isfinite(v)) return nan;
  return v;
}

FeatureMatrix normalizeFeatures(const RecordTable& records, const std::vector<std::string>& schema) {
  std::vector<int> cols;
  cols.reserve(schema.size());
  std::string missing;
  for (const auto& name : schema) {
    int c = records.columnIndex(name);
    if (c < 0) missing += (missing.empty() ? "" : ", ") + name;
    cols.push_back(c);
  }
  if (!missing.empty()) {
    throw SchemaError("Missing required feature columns: " + missing);
  }

  FeatureMatrix X(static_cast<Eigen::Index>(records.rows.size()),
                  static_cast<Eigen::Index>(schema.size()));
  for (size_t i = 0; i < records.rows.size(); ++i) {
    const auto& row = records.rows[i];
    for (size_t j = 0; j < cols.size(); ++j) {
      X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
          coerceCell(row[static_cast<size_t>(cols[j])]);
    }
  }
  return X;
}
