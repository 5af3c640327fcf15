#include "feature_normalizer.hpp"
#include "churn_errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>

TEST(CoerceCell, BooleansNumbersAndGarbage) {
  EXPECT_EQ(coerceCell("True"), 1.0);
  EXPECT_EQ(coerceCell(" false "), 0.0);
  EXPECT_EQ(coerceCell("42"), 42.0);
  EXPECT_EQ(coerceCell("-3.5e2"), -350.0);
  EXPECT_TRUE(std::isnan(coerceCell("")));
  EXPECT_TRUE(std::isnan(coerceCell("n/a")));
  EXPECT_TRUE(std::isnan(coerceCell("12abc")));
  EXPECT_TRUE(std::isnan(coerceCell("inf")));
  EXPECT_TRUE(std::isnan(coerceCell("nan")));
}

TEST(Normalizer, BuildsMatrixInSchemaOrder) {
  RecordTable t = syntheticPopulation(5);
  // reversed column order in the source must not matter
  RecordTable r;
  r.columns.assign(t.columns.rbegin(), t.columns.rend());
  for (const auto& row : t.rows) r.rows.emplace_back(row.rbegin(), row.rend());

  FeatureMatrix a = normalizeFeatures(t);
  FeatureMatrix b = normalizeFeatures(r);
  ASSERT_EQ(a.rows(), 5);
  ASSERT_EQ(a.cols(), static_cast<Eigen::Index>(kFeatureCount));
  EXPECT_TRUE(a.isApprox(b));
  EXPECT_EQ(a(0, 0), std::stod(t.cell(0, "recency_days")));
}

TEST(Normalizer, MalformedCellsBecomeMissing) {
  RecordTable t = syntheticPopulation(2);
  const int col = t.columnIndex("cv_gap");
  t.rows[0][static_cast<size_t>(col)] = "oops";
  t.rows[1][static_cast<size_t>(t.columnIndex("in_renewal_grace"))] = "True";

  FeatureMatrix X = normalizeFeatures(t);
  EXPECT_TRUE(std::isnan(X(0, featureIndex("cv_gap"))));
  EXPECT_EQ(X(1, featureIndex("in_renewal_grace")), 1.0);
}

TEST(Normalizer, MissingColumnIsASchemaErrorNamingIt) {
  RecordTable t = syntheticPopulation(3);
  const size_t col = static_cast<size_t>(t.columnIndex("severity_score"));
  t.columns.erase(t.columns.begin() + static_cast<long>(col));
  for (auto& row : t.rows) row.erase(row.begin() + static_cast<long>(col));

  try {
    normalizeFeatures(t);
    FAIL() << "expected SchemaError";
  } catch (const SchemaError& e) {
    EXPECT_NE(std::string(e.what()).find("severity_score"), std::string::npos);
  }
}

TEST(Normalizer, DoesNotTouchTheRecords) {
  RecordTable t = syntheticPopulation(4);
  t.rows[2][static_cast<size_t>(t.columnIndex("cv_gap"))] = " TRUE ";
  const RecordTable before = t;
  normalizeFeatures(t);
  EXPECT_EQ(t.columns, before.columns);
  EXPECT_EQ(t.rows, before.rows);
}

TEST(Normalizer, RunningOnItsOwnOutputIsANoOp) {
  RecordTable t = syntheticPopulation(6);
  t.rows[1][static_cast<size_t>(t.columnIndex("rev_180d"))] = "garbage";
  t.rows[3][static_cast<size_t>(t.columnIndex("in_renewal_grace"))] = "False";
  const FeatureMatrix first = normalizeFeatures(t);

  RecordTable again = schemaTable(false);
  for (Eigen::Index i = 0; i < first.rows(); ++i) {
    std::vector<double> f(kFeatureCount);
    for (size_t j = 0; j < kFeatureCount; ++j) f[j] = first(i, static_cast<Eigen::Index>(j));
    again.rows.push_back(recordRow("x", "2025-01-01", f));
  }
  const FeatureMatrix second = normalizeFeatures(again);

  ASSERT_EQ(second.rows(), first.rows());
  for (Eigen::Index i = 0; i < first.rows(); ++i) {
    for (Eigen::Index j = 0; j < first.cols(); ++j) {
      if (std::isnan(first(i, j))) EXPECT_TRUE(std::isnan(second(i, j)));
      else EXPECT_EQ(second(i, j), first(i, j));
    }
  }
}
