#include "record_table.hpp"
#include "churn_errors.hpp"
#include "feature_schema.hpp"
#include "feature_normalizer.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <unordered_map>

static const std::string kEmpty;

int RecordTable::columnIndex(const std::string& name) const {
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == name) return static_cast<int>(i);
  }
  return -1;
}

const std::string& RecordTable::cell(size_t row, const std::string& name) const {
  int c = columnIndex(name);
  if (c < 0) return kEmpty;
  return rows.at(row).at(static_cast<size_t>(c));
}

// Splits one CSV record; returns false if a quoted field never closes on this line.
static bool splitCsvLine(const std::string& line, std::vector<std::string>& out) {
  out.clear();
  std::string field;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') { field += '"'; ++i; }
        else quoted = false;
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  out.push_back(field);
  return !quoted;
}

RecordTable readRecordCsv(std::istream& in, size_t max_rows) {
  RecordTable t;
  std::string line;
  if (!std::getline(in, line)) throw InputError("record source is empty (no header line)");
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
  splitCsvLine(line, t.columns);

  std::vector<std::string> fields;
  size_t line_no = 1;
  std::string pending;
  while (std::getline(in, line)) {
    ++line_no;
    if (!pending.empty()) line = pending + "\n" + line;
    if (!splitCsvLine(line, fields)) { pending = line; continue; }
    pending.clear();
    if (fields.size() == 1 && fields[0].empty()) continue;  // blank line
    if (fields.size() != t.columns.size()) {
      throw InputError("line " + std::to_string(line_no) + ": expected " +
                       std::to_string(t.columns.size()) + " fields, got " +
                       std::to_string(fields.size()));
    }
    t.rows.push_back(fields);
    if (max_rows > 0 && t.rows.size() >= max_rows) break;
  }
  if (!pending.empty()) throw InputError("unterminated quoted field at end of record source");
  return t;
}

RecordTable loadRecordCsv(const std::string& path, size_t max_rows) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw InputError("Could not open record source: " + path);
  }
  RecordTable t = readRecordCsv(f, max_rows);
  Log::write(LogLevel::Info, "Loaded %zu rows x %zu columns from '%s'",
             t.rows.size(), t.columns.size(), path.c_str());
  return t;
}

std::optional<std::string> snapshotDate(const RecordTable& t, size_t row) {
  const std::string& raw = t.cell(row, kSnapshotDateColumn);
  size_t b = raw.find_first_not_of(" \t");
  if (b == std::string::npos) return std::nullopt;
  size_t e = raw.find_last_not_of(" \t");
  std::string s = raw.substr(b, e - b + 1);
  if (s == "None" || s == "NaT" || s == "nan") return std::nullopt;
  return s;
}

RecordTable filterByDate(const RecordTable& t, const std::string& as_of) {
  RecordTable out;
  out.columns = t.columns;
  for (size_t i = 0; i < t.rows.size(); ++i) {
    auto d = snapshotDate(t, i);
    if (d && *d == as_of) out.rows.push_back(t.rows[i]);
  }
  return out;
}

RecordTable dedupeLatestPerCustomer(const RecordTable& t) {
  if (!t.hasColumn(kCustomerIdColumn)) {
    throw SchemaError(std::string("Missing customer id column: ") + kCustomerIdColumn);
  }
  std::vector<std::optional<std::string>> dates(t.rows.size());
  for (size_t i = 0; i < t.rows.size(); ++i) dates[i] = snapshotDate(t, i);

  std::vector<size_t> order(t.rows.size());
  std::iota(order.begin(), order.end(), 0);
  // ISO dates order lexicographically; missing sorts first
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (!dates[a]) return dates[b].has_value();
    if (!dates[b]) return false;
    return *dates[a] < *dates[b];
  });

  const int id_col = t.columnIndex(kCustomerIdColumn);
  std::unordered_map<std::string, size_t> last;
  for (size_t pos = 0; pos < order.size(); ++pos) {
    last[t.rows[order[pos]][static_cast<size_t>(id_col)]] = pos;
  }

  RecordTable out;
  out.columns = t.columns;
  for (size_t pos = 0; pos < order.size(); ++pos) {
    if (last[t.rows[order[pos]][static_cast<size_t>(id_col)]] == pos) {
      out.rows.push_back(t.rows[order[pos]]);
    }
  }
  return out;
}

std::vector<int> labelsFromColumn(const RecordTable& t, const std::string& column) {
  int c = t.columnIndex(column);
  if (c < 0) throw SchemaError("Missing target column: " + column);
  std::vector<int> y;
  y.reserve(t.rows.size());
  for (size_t i = 0; i < t.rows.size(); ++i) {
    double v = coerceCell(t.rows[i][static_cast<size_t>(c)]);
    // truncation toward zero only for values already inside (-1, 2)
    const bool in_range = std::isnan(v) || (v > -1.0 && v < 2.0);
    int label = (in_range && !std::isnan(v)) ? static_cast<int>(v) : 0;
    if (!in_range || (label != 0 && label != 1)) {
      throw TrainingError("Target column '" + column + "' row " + std::to_string(i) +
                          " is not binary: '" + t.rows[i][static_cast<size_t>(c)] + "'");
    }
    y.push_back(label);
  }
  return y;
}
