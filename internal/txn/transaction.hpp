#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "internal/model/atomic_operation.hpp"
#include "internal/model/rollback_point.hpp"
#include "internal/model/transaction_context.hpp"
#include "internal/model/transaction_result.hpp"
#include "internal/model/transaction_status.hpp"
#include "internal/model/validation_result.hpp"
#include "internal/observability/logging.hpp"

namespace rollback::state {
class StateManager;
}

namespace rollback::txn {

/*
  One unit of atomic work.

  Lifecycle:

    PENDING --Execute()--> ACTIVE --Commit()----> COMMITTED
                                  --Rollback()--> ROLLED_BACK
                                  --error in Execute()--> FAILED --Rollback()--> ROLLED_BACK

  Execute never rolls back on its own; it marks the transaction FAILED and
  rethrows. Rollback undoes added operations in reverse insertion order,
  keeps going past individual failures and reports them.

  Rollback is exclusive: a second Rollback, Commit, Execute or
  AddOperation is refused while one is running. It waits for callbacks
  already inside Execute to return before undoing anything.

  Checkpoints are independent of the status: RollbackToCheckpoint restores
  a snapshot and leaves the status untouched.

  Caller callbacks always run without the internal lock held.
*/
class Transaction {
 public:
  Transaction(model::TransactionContext context, std::shared_ptr<state::StateManager> state_manager, observability::Logger logger = {});

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  const std::string& Id() const {
    return context_.transaction_id;
  }
  const model::TransactionContext& Context() const {
    return context_;
  }

  model::TransactionStatus Status() const;
  bool                     RollbackInProgress() const;

  // Recorded and reported only; no locking is derived from it.
  void                  SetIsolationLevel(model::IsolationLevel level);
  model::IsolationLevel GetIsolationLevel() const;

  template <typename Fn>
  auto Execute(Fn&& fn) -> std::invoke_result_t<Fn&>;

  void AddOperation(model::OperationPtr operation);

  model::RollbackPoint CreateCheckpoint(const std::string&       description,
                                        model::RollbackPointType type = model::RollbackPointType::kCheckpoint);
  void                 RollbackToCheckpoint(const std::string& checkpoint_id);

  void                                Commit();
  std::vector<model::RollbackFailure> Rollback();

  model::ValidationResult Validate();

  std::vector<model::RollbackPoint>   GetRollbackPoints() const;
  std::vector<model::OperationPtr>    Operations() const;
  std::vector<std::string>            ExecutedOperationIds() const;
  std::vector<model::RollbackFailure> RollbackFailures() const;

 private:
  void BeginExecute();
  void EndExecute();
  void MarkFailed();
  void RequireNotTerminal(std::string_view action) const;
  void TransitionLocked(model::TransactionStatus to);

  const model::TransactionContext      context_;
  std::shared_ptr<state::StateManager> state_manager_;
  observability::Logger                logger_;

  mutable std::mutex                  mutex_;
  std::condition_variable             idle_;
  int                                 executing_    = 0;
  bool                                rolling_back_ = false;
  model::TransactionStatus            status_       = model::TransactionStatus::kPending;
  model::IsolationLevel               isolation_ = model::IsolationLevel::kReadCommitted;
  std::vector<model::OperationPtr>    operations_;
  std::vector<model::RollbackPoint>   rollback_points_;
  std::vector<model::RollbackFailure> rollback_failures_;
};

template <typename Fn>
auto Transaction::Execute(Fn&& fn) -> std::invoke_result_t<Fn&> {
  BeginExecute();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
      std::invoke(fn);
      EndExecute();
    } else {
      auto output = std::invoke(fn);
      EndExecute();
      return output;
    }
  } catch (...) {
    MarkFailed();
    throw;
  }
}

using TransactionPtr = std::shared_ptr<Transaction>;

} // namespace rollback::txn
