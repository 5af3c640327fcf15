#pragma once
#include "record_table.hpp"
#include "feature_schema.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

// rows x features, NaN marks a missing cell.
using FeatureMatrix = Eigen::MatrixXd;

// One cell to a number: true/false (any case) -> 1/0, numeric text -> value,
// everything else (blank, garbage, inf) -> NaN.
double coerceCell(const std::string& text);

// Builds the feature matrix in schema order. The table is only read.
// Throws SchemaError listing every schema column the table lacks.
FeatureMatrix normalizeFeatures(const RecordTable& records,
                                const std::vector<std::string>& schema = featureNames());
