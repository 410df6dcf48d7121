#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace graphingest::util {

/*
  Central error types.

  The ingestion service maps every one of these to the failed task transition;
  only StructuralError and ResolutionError are expected data problems, the rest
  are infrastructure or programming errors.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit lost against a concurrent writer; safe to retry.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Label or relationship type rejected by the identifier allow-list.
class InvalidIdentifier : public std::runtime_error {
 public:
  explicit InvalidIdentifier(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any failure talking to the graph backend.
class GraphStoreError : public std::runtime_error {
 public:
  explicit GraphStoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// File rejected before any row was processed.
class StructuralError : public std::runtime_error {
 public:
  StructuralError(const std::string& msg, std::vector<std::string> errors, std::vector<std::string> warnings = {})
      : std::runtime_error(msg), errors_(std::move(errors)), warnings_(std::move(warnings)) {
  }

  const std::vector<std::string>& errors() const {
    return errors_;
  }
  const std::vector<std::string>& warnings() const {
    return warnings_;
  }

 private:
  std::vector<std::string> errors_;
  std::vector<std::string> warnings_;
};

} // namespace graphingest::util
