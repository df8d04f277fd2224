#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rollback::util {

/*
  Engine exception taxonomy.

  Lookup failures derive from NotFound, lifecycle violations from
  InvalidState, integrity failures from Corruption. Callers can catch the
  family or the specific type.
*/

class NotFound : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidState : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Corruption : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationFailed : public std::runtime_error {
 public:
  ValidationFailed(const std::string& message, std::vector<std::string> errors)
      : std::runtime_error(message), errors_(std::move(errors)) {
  }

  const std::vector<std::string>& Errors() const {
    return errors_;
  }

 private:
  std::vector<std::string> errors_;
};

class SnapshotNotFound : public NotFound {
 public:
  explicit SnapshotNotFound(const std::string& id) : NotFound("Snapshot not found: " + id) {
  }
};

class CheckpointNotFound : public NotFound {
 public:
  explicit CheckpointNotFound(const std::string& id) : NotFound("Checkpoint not found: " + id) {
  }
};

class RollbackPointNotFound : public NotFound {
 public:
  explicit RollbackPointNotFound(const std::string& id) : NotFound("Rollback point not found: " + id) {
  }
};

class TransactionNotFound : public NotFound {
 public:
  explicit TransactionNotFound(const std::string& id) : NotFound("Transaction not found: " + id) {
  }
};

class StrategyNotFound : public NotFound {
 public:
  explicit StrategyNotFound(const std::string& id) : NotFound("Rollback strategy not found: " + id) {
  }
};

class InvalidTransactionState : public InvalidState {
 public:
  using InvalidState::InvalidState;
};

class SnapshotCorrupted : public Corruption {
 public:
  using Corruption::Corruption;
};

class OperationValidationFailed : public ValidationFailed {
 public:
  using ValidationFailed::ValidationFailed;
};

} // namespace rollback::util
