#pragma once

#include <stdexcept>
#include <string>

// Malformed or incomplete input (bad transcript record, missing metadata, empty lyrics).
// Fatal: no output is produced.
class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

// The aligner produced a track that breaks ordering/completeness guarantees.
// Indicates a defect in the alignment passes, never bad input.
class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {}
};
