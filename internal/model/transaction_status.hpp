#pragma once

#include <cstdint>
#include <string_view>

namespace rollback::model {

enum class TransactionStatus : std::uint8_t {
  kPending    = 0,
  kActive     = 1,
  kCommitted  = 2,
  kRolledBack = 3,
  kFailed     = 4,
};

constexpr bool IsTerminal(TransactionStatus status) {
  return status == TransactionStatus::kCommitted || status == TransactionStatus::kRolledBack || status == TransactionStatus::kFailed;
}

/*
  Allowed lifecycle edges:

    PENDING -> ACTIVE      (first execute)
    PENDING -> COMMITTED   (empty batch)
    ACTIVE  -> COMMITTED | ROLLED_BACK | FAILED
    FAILED  -> ROLLED_BACK (caller cleans up after a failed execute)
    any non-final -> FAILED
*/
constexpr bool CanTransition(TransactionStatus from, TransactionStatus to) {
  if (from == to) {
    return from == TransactionStatus::kActive;
  }

  switch (from) {
    case TransactionStatus::kPending:
      return to != TransactionStatus::kPending;
    case TransactionStatus::kActive:
      return to != TransactionStatus::kPending;
    case TransactionStatus::kFailed:
      return to == TransactionStatus::kRolledBack;
    case TransactionStatus::kCommitted:
    case TransactionStatus::kRolledBack:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::kPending:
      return "PENDING";
    case TransactionStatus::kActive:
      return "ACTIVE";
    case TransactionStatus::kCommitted:
      return "COMMITTED";
    case TransactionStatus::kRolledBack:
      return "ROLLED_BACK";
    case TransactionStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

/*
  Descriptive only. The engine stores and reports the level but does not
  lock or version anything based on it.
*/
enum class IsolationLevel : std::uint8_t {
  kReadUncommitted = 0,
  kReadCommitted   = 1,
  kRepeatableRead  = 2,
  kSerializable    = 3,
};

constexpr std::string_view ToString(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kReadUncommitted:
      return "READ_UNCOMMITTED";
    case IsolationLevel::kReadCommitted:
      return "READ_COMMITTED";
    case IsolationLevel::kRepeatableRead:
      return "REPEATABLE_READ";
    case IsolationLevel::kSerializable:
      return "SERIALIZABLE";
  }
  return "UNKNOWN";
}

} // namespace rollback::model
