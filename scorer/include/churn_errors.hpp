#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Base error for the scorer. Anything derived from it aborts the run.
class ChurnError : public std::runtime_error {
 public:
  explicit ChurnError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Required feature column absent from the record source.
class SchemaError : public ChurnError {
 public:
  explicit SchemaError(std::string msg) : ChurnError(std::move(msg)) {}
};

// Label/matrix mismatch or a numerically unusable training set.
class TrainingError : public ChurnError {
 public:
  explicit TrainingError(std::string msg) : ChurnError(std::move(msg)) {}
};

// Unreadable record source or bad configuration values.
class InputError : public ChurnError {
 public:
  explicit InputError(std::string msg) : ChurnError(std::move(msg)) {}
};
