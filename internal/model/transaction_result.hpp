#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/atomic_operation.hpp"
#include "internal/model/rollback_point.hpp"
#include "internal/model/transaction_status.hpp"

namespace rollback::model {

struct RollbackFailure {
  std::string operation_id;
  std::string operation_name;
  std::string message;
};

/*
  Archived record of a finished transaction. Appended to history and never
  mutated afterwards.
*/
struct TransactionResult {
  std::string                    transaction_id;
  TransactionStatus              status = TransactionStatus::kPending;
  std::optional<OperationOutput> result;
  std::optional<std::string>     error;
  std::vector<RollbackPoint>     rollback_points;
  std::vector<std::string>       executed_operations;
  std::vector<RollbackFailure>   rollback_failures;
  std::string                    user_id;
  util::Timestamp                started_at{};
  util::Timestamp                completed_at{};
  std::chrono::milliseconds      duration{0};
  Metadata                       metadata;
};

} // namespace rollback::model
