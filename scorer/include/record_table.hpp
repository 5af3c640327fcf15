#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

// Raw records as delivered by the record source: named columns, string cells.
struct RecordTable {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;

  int columnIndex(const std::string& name) const;  // -1 when absent
  bool hasColumn(const std::string& name) const { return columnIndex(name) >= 0; }
  std::size_t size() const { return rows.size(); }
  // Empty string when the column is absent.
  const std::string& cell(std::size_t row, const std::string& name) const;
};

// Header line followed by data lines; fields may be double-quoted ("" escapes).
// max_rows = 0 reads everything. Throws InputError on open failure, an empty
// source or a ragged row.
RecordTable readRecordCsv(std::istream& in, std::size_t max_rows = 0);
RecordTable loadRecordCsv(const std::string& path, std::size_t max_rows = 0);

// Trimmed snapshot date; "", "None", "NaT", "nan" read as missing.
std::optional<std::string> snapshotDate(const RecordTable& t, std::size_t row);

// Rows whose snapshot date equals as_of exactly.
RecordTable filterByDate(const RecordTable& t, const std::string& as_of);

// Stable sort by snapshot date (missing first), then keep the last row seen
// per customer id. Result stays in date order.
RecordTable dedupeLatestPerCustomer(const RecordTable& t);

// Target column coerced to 0/1: missing or unparseable cells are 0, other
// values truncate toward zero. Throws TrainingError on anything not 0 or 1.
std::vector<int> labelsFromColumn(const RecordTable& t, const std::string& column);
