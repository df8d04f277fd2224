#include "internal/txn/transaction.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace rollback::txn {

using model::TransactionStatus;
using observability::StringField;

Transaction::Transaction(model::TransactionContext context, std::shared_ptr<state::StateManager> state_manager, observability::Logger logger)
    : context_(std::move(context)), state_manager_(std::move(state_manager)), logger_(std::move(logger)) {
  if (!state_manager_) throw std::invalid_argument("Transaction requires a state manager");
}

TransactionStatus Transaction::Status() const {
  std::lock_guard lock(mutex_);
  return status_;
}

bool Transaction::RollbackInProgress() const {
  std::lock_guard lock(mutex_);
  return rolling_back_;
}

void Transaction::SetIsolationLevel(model::IsolationLevel level) {
  {
    std::lock_guard lock(mutex_);
    isolation_ = level;
  }
  logger_.Info("Setting transaction " + Id() + " isolation level to " + std::string(model::ToString(level)));
}

model::IsolationLevel Transaction::GetIsolationLevel() const {
  std::lock_guard lock(mutex_);
  return isolation_;
}

void Transaction::TransitionLocked(TransactionStatus to) {
  if (!model::CanTransition(status_, to)) {
    throw util::InvalidTransactionState("Transaction " + Id() + " cannot move from " + std::string(model::ToString(status_)) + " to " +
                                        std::string(model::ToString(to)));
  }
  status_ = to;
}

void Transaction::RequireNotTerminal(std::string_view action) const {
  std::lock_guard lock(mutex_);
  if (model::IsTerminal(status_)) {
    throw util::InvalidTransactionState("Cannot " + std::string(action) + " on transaction " + Id() + " in status " +
                                        std::string(model::ToString(status_)));
  }
}

void Transaction::BeginExecute() {
  std::lock_guard lock(mutex_);
  if (rolling_back_) {
    throw util::InvalidTransactionState("Cannot execute on transaction " + Id() + " while it is being rolled back");
  }
  TransitionLocked(TransactionStatus::kActive);
  ++executing_;
}

void Transaction::EndExecute() {
  {
    std::lock_guard lock(mutex_);
    --executing_;
  }
  idle_.notify_all();
}

void Transaction::MarkFailed() {
  {
    std::lock_guard lock(mutex_);
    --executing_;
    if (!model::IsTerminal(status_)) status_ = TransactionStatus::kFailed;
  }
  idle_.notify_all();
}

void Transaction::AddOperation(model::OperationPtr operation) {
  if (!operation) throw std::invalid_argument("operation is null");

  {
    std::lock_guard lock(mutex_);
    if (model::IsTerminal(status_)) {
      throw util::InvalidTransactionState("Cannot add operation to transaction " + Id() + " in status " +
                                          std::string(model::ToString(status_)));
    }
    if (rolling_back_) {
      throw util::InvalidTransactionState("Cannot add operation to transaction " + Id() + " while it is being rolled back");
    }
    operations_.push_back(operation);
  }
  logger_.Info("Added operation " + operation->Name() + " to transaction " + Id());
}

model::RollbackPoint Transaction::CreateCheckpoint(const std::string& description, model::RollbackPointType type) {
  RequireNotTerminal("create checkpoint");

  auto snapshot = state_manager_->CreateSnapshot(model::SnapshotType::kIncremental);

  model::RollbackPoint point;
  point.id             = util::GenerateRollbackPointID();
  point.transaction_id = Id();
  point.type           = type;
  point.created_at     = util::Clock::now();
  point.description    = description;
  point.snapshots.emplace(model::kDatabaseSnapshot, snapshot.Metadata());
  point.metadata["user_id"] = context_.user_id;

  {
    std::lock_guard lock(mutex_);
    rollback_points_.push_back(point);
  }

  logger_.Info("Created checkpoint " + point.id + " for transaction " + Id(), {StringField("description", description)});
  return point;
}

void Transaction::RollbackToCheckpoint(const std::string& checkpoint_id) {
  model::RollbackPoint checkpoint;
  {
    std::lock_guard lock(mutex_);
    auto            it = std::find_if(rollback_points_.begin(), rollback_points_.end(),
                                      [&](const model::RollbackPoint& point) { return point.id == checkpoint_id; });
    if (it == rollback_points_.end()) {
      throw util::CheckpointNotFound(checkpoint_id);
    }
    checkpoint = *it;
  }

  try {
    for (const auto& [name, snapshot] : checkpoint.snapshots) {
      state_manager_->RestoreFromSnapshot(snapshot.id);
    }
  } catch (const std::exception& e) {
    logger_.Error("Failed to rollback to checkpoint " + checkpoint_id, e);
    throw;
  }

  logger_.Info("Rolled back to checkpoint " + checkpoint_id + " in transaction " + Id());
}

void Transaction::Commit() {
  {
    std::lock_guard lock(mutex_);
    if (status_ == TransactionStatus::kFailed) {
      throw util::InvalidTransactionState("Cannot commit failed transaction " + Id());
    }
    if (rolling_back_) {
      throw util::InvalidTransactionState("Cannot commit transaction " + Id() + " while it is being rolled back");
    }
    TransitionLocked(TransactionStatus::kCommitted);
  }
  logger_.Info("Transaction " + Id() + " committed successfully");
}

std::vector<model::RollbackFailure> Transaction::Rollback() {
  std::vector<model::OperationPtr> operations;
  {
    std::unique_lock lock(mutex_);
    if (status_ == TransactionStatus::kCommitted || status_ == TransactionStatus::kRolledBack) {
      throw util::InvalidTransactionState("Cannot rollback transaction " + Id() + " in status " + std::string(model::ToString(status_)));
    }
    if (rolling_back_) {
      throw util::InvalidTransactionState("Transaction " + Id() + " is already being rolled back");
    }

    // AddOperation is refused from here on, so the copy stays complete.
    operations    = operations_;
    rolling_back_ = true;
    idle_.wait(lock, [this] { return executing_ == 0; });
  }

  std::vector<model::RollbackFailure> failures;
  for (auto it = operations.rbegin(); it != operations.rend(); ++it) {
    const auto& operation = *it;
    try {
      operation->Rollback(context_);
    } catch (const std::exception& e) {
      logger_.Error("Failed to rollback operation " + operation->Name(), e, {StringField("transaction_id", Id())});
      failures.push_back({operation->Id(), operation->Name(), e.what()});
    } catch (...) {
      logger_.Error("Failed to rollback operation " + operation->Name(), {StringField("transaction_id", Id())});
      failures.push_back({operation->Id(), operation->Name(), "unknown error"});
    }
  }

  {
    std::lock_guard lock(mutex_);
    status_            = TransactionStatus::kRolledBack;
    rolling_back_      = false;
    rollback_failures_ = failures;
  }

  if (failures.empty()) {
    logger_.Info("Transaction " + Id() + " rolled back successfully");
  } else {
    logger_.Warn("Transaction " + Id() + " rolled back with failures",
                 {observability::IntField("failed_operations", static_cast<std::int64_t>(failures.size()))});
  }
  return failures;
}

model::ValidationResult Transaction::Validate() {
  model::ValidationResult aggregate;
  for (const auto& operation : Operations()) {
    try {
      aggregate.Merge(operation->Validate(context_));
    } catch (const std::exception& e) {
      aggregate.Merge(model::ValidationResult::Invalid("Validation failed for operation " + operation->Name() + ": " + e.what()));
    }
  }
  return aggregate;
}

std::vector<model::RollbackPoint> Transaction::GetRollbackPoints() const {
  std::lock_guard lock(mutex_);
  return rollback_points_;
}

std::vector<model::OperationPtr> Transaction::Operations() const {
  std::lock_guard lock(mutex_);
  return operations_;
}

std::vector<std::string> Transaction::ExecutedOperationIds() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(operations_.size());
  for (const auto& operation : operations_) ids.push_back(operation->Id());
  return ids;
}

std::vector<model::RollbackFailure> Transaction::RollbackFailures() const {
  std::lock_guard lock(mutex_);
  return rollback_failures_;
}

} // namespace rollback::txn
