#pragma once
#include <stdexcept>
#include <string>

// vectors and metadata disagree in length, or a vector has the wrong dimension
struct ShapeMismatch : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// save failed; the in-memory mutation that triggered it is kept
struct PersistenceError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// persisted state exists but cannot be trusted
struct CorruptIndexError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct EmbeddingError : std::runtime_error {
  using std::runtime_error::runtime_error;
};
