#include "internal/txn/transaction_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/spans.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace rollback::txn {

using model::TransactionStatus;
using observability::IntField;
using observability::SpanScope;
using observability::StringField;

namespace {

constexpr const char* kAnonymousUser = "anonymous";
constexpr const char* kUnknownError  = "unknown error";

std::chrono::milliseconds Since(util::Timestamp started_at) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(util::Clock::now() - started_at);
}

} // namespace

TransactionManager::TransactionManager(std::shared_ptr<state::StateManager>       state_manager,
                                       std::shared_ptr<recovery::RollbackManager> rollback_manager, observability::Logger logger,
                                       EngineOptions options)
    : state_manager_(std::move(state_manager)),
      rollback_manager_(std::move(rollback_manager)),
      logger_(std::move(logger)),
      options_(options) {
  if (!state_manager_) throw std::invalid_argument("TransactionManager requires a state manager");
  if (!rollback_manager_) throw std::invalid_argument("TransactionManager requires a rollback manager");
}

TransactionPtr TransactionManager::BeginTransaction(const model::TransactionOptions& options) {
  model::TransactionContext context;
  context.transaction_id = util::GenerateTransactionID();
  context.user_id        = options.user_id.value_or(kAnonymousUser);
  context.session_id     = options.session_id.value_or("session_" + std::to_string(util::NowMillis()));
  context.created_at     = util::Clock::now();
  context.metadata       = options.metadata;

  auto transaction = std::make_shared<Transaction>(std::move(context), state_manager_, logger_);
  if (options.isolation_level) transaction->SetIsolationLevel(*options.isolation_level);

  {
    std::lock_guard lock(mutex_);
    active_.emplace(transaction->Id(), transaction);
  }

  logger_.Info("Started transaction " + transaction->Id(), {StringField("user_id", transaction->Context().user_id)});
  return transaction;
}

std::optional<model::TransactionResult> TransactionManager::Archive(const Transaction& transaction, util::Timestamp started_at,
                                                                    std::vector<std::string>              executed,
                                                                    std::optional<model::OperationOutput> output,
                                                                    std::optional<std::string> error, const model::Metadata& metadata) {
  model::TransactionResult result;
  result.transaction_id      = transaction.Id();
  result.status              = transaction.Status();
  result.result              = std::move(output);
  result.error               = std::move(error);
  result.rollback_points     = transaction.GetRollbackPoints();
  result.executed_operations = std::move(executed);
  result.rollback_failures   = transaction.RollbackFailures();
  result.user_id             = transaction.Context().user_id;
  result.started_at          = started_at;
  result.completed_at        = util::Clock::now();
  result.duration            = std::chrono::duration_cast<std::chrono::milliseconds>(result.completed_at - started_at);
  result.metadata            = metadata;

  std::vector<model::TransactionResult> evicted;
  {
    std::lock_guard lock(mutex_);
    if (active_.erase(result.transaction_id) == 0) {
      return std::nullopt;
    }
    history_.push_back(result);
    while (options_.max_history_entries > 0 && history_.size() > options_.max_history_entries) {
      evicted.push_back(std::move(history_.front()));
      history_.pop_front();
    }
  }

  for (const auto& point : result.rollback_points) {
    rollback_manager_->RegisterRollbackPoint(point, result.user_id);
  }
  for (const auto& old : evicted) {
    for (const auto& point : old.rollback_points) rollback_manager_->ForgetRollbackPoint(point.id);
  }

  return result;
}

model::TransactionResult TransactionManager::ArchiveCommitted(const Transaction& transaction, util::Timestamp started_at,
                                                              std::vector<std::string>              executed,
                                                              std::optional<model::OperationOutput> output, const model::Metadata& metadata) {
  auto result = Archive(transaction, started_at, std::move(executed), std::move(output), std::nullopt, metadata);
  if (!result) {
    throw util::InvalidTransactionState("Transaction " + transaction.Id() + " was archived concurrently");
  }
  return std::move(*result);
}

bool TransactionManager::Abort(const TransactionPtr& transaction, util::Timestamp started_at, std::vector<std::string> executed,
                               const std::string& error, const model::Metadata& metadata) {
  const auto status = transaction->Status();
  if (status != TransactionStatus::kCommitted && status != TransactionStatus::kRolledBack) {
    try {
      transaction->Rollback();
    } catch (const util::InvalidTransactionState& e) {
      // The concurrent rollback or commit archives the transaction itself.
      logger_.Warn("Transaction " + transaction->Id() + " was not aborted", {StringField("reason", e.what()), StringField("error", error)});
      return false;
    }
  }
  return Archive(*transaction, started_at, std::move(executed), std::nullopt, error, metadata).has_value();
}

void TransactionManager::UndoDetached(const Transaction& transaction, const model::OperationPtr& operation) {
  try {
    operation->Rollback(transaction.Context());
    logger_.Info("Rolled back operation " + operation->Name() + " refused by transaction " + transaction.Id());
  } catch (const std::exception& e) {
    logger_.Error("Failed to rollback operation " + operation->Name(), e, {StringField("transaction_id", transaction.Id())});
  } catch (...) {
    logger_.Error("Failed to rollback operation " + operation->Name(), {StringField("transaction_id", transaction.Id())});
  }
}

model::TransactionResult TransactionManager::ExecuteAtomicOperation(const model::OperationPtr&       operation,
                                                                    const model::TransactionOptions& options) {
  if (!operation) throw std::invalid_argument("operation is null");

  SpanScope span("transaction.execute_operation");
  span.SetAttribute("operation.id", operation->Id());

  auto       transaction = BeginTransaction(options);
  const auto started_at  = util::Clock::now();
  const auto& ctx        = transaction->Context();
  span.SetAttribute("transaction.id", transaction->Id());

  try {
    auto validation = operation->Validate(ctx);
    if (!validation.is_valid) {
      throw util::OperationValidationFailed("Operation validation failed: " + validation.JoinedErrors(), validation.errors);
    }

    if (options.create_checkpoint) {
      transaction->CreateCheckpoint("Before " + operation->Name());
    }

    transaction->AddOperation(operation);
    auto output = transaction->Execute([&] { return operation->Execute(ctx); });
    transaction->Commit();

    return ArchiveCommitted(*transaction, started_at, {operation->Id()}, std::move(output), options.metadata);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    logger_.Error("Transaction " + transaction->Id() + " failed", e, {StringField("operation", operation->Name())});
    Abort(transaction, started_at, {}, e.what(), options.metadata);
    throw;
  } catch (...) {
    span.RecordException(kUnknownError);
    Abort(transaction, started_at, {}, kUnknownError, options.metadata);
    throw;
  }
}

model::TransactionResult TransactionManager::ExecuteAtomicOperations(const std::vector<model::OperationPtr>& operations,
                                                                     const model::TransactionOptions&        options) {
  for (const auto& operation : operations) {
    if (!operation) throw std::invalid_argument("operation is null");
  }

  SpanScope span("transaction.execute_operations");
  span.SetAttribute("operations.count", static_cast<std::int64_t>(operations.size()));

  auto                     transaction = BeginTransaction(options);
  const auto               started_at  = util::Clock::now();
  const auto&              ctx         = transaction->Context();
  std::vector<std::string> executed;
  span.SetAttribute("transaction.id", transaction->Id());

  try {
    for (const auto& operation : operations) {
      auto validation = operation->Validate(ctx);
      if (!validation.is_valid) {
        throw util::OperationValidationFailed("Operation " + operation->Name() + " validation failed: " + validation.JoinedErrors(),
                                              validation.errors);
      }
    }

    if (options.create_checkpoint) {
      transaction->CreateCheckpoint("Before " + std::to_string(operations.size()) + " operations");
    }

    std::optional<model::OperationOutput> last_output;
    for (const auto& operation : operations) {
      last_output = transaction->Execute([&] { return operation->Execute(ctx); });
      try {
        transaction->AddOperation(operation);
      } catch (const util::InvalidTransactionState&) {
        UndoDetached(*transaction, operation);
        throw;
      }
      executed.push_back(operation->Id());
    }

    transaction->Commit();
    return ArchiveCommitted(*transaction, started_at, std::move(executed), std::move(last_output), options.metadata);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    logger_.Error("Transaction " + transaction->Id() + " failed", e,
                  {IntField("executed_operations", static_cast<std::int64_t>(executed.size()))});
    Abort(transaction, started_at, std::move(executed), e.what(), options.metadata);
    throw;
  } catch (...) {
    span.RecordException(kUnknownError);
    Abort(transaction, started_at, std::move(executed), kUnknownError, options.metadata);
    throw;
  }
}

void TransactionManager::RollbackPhase(std::vector<CompletedStep>& completed, model::MigrationResult& result) {
  const auto mode = options_.parallel_rollback ? recovery::RollbackExecutionMode::kParallel : recovery::RollbackExecutionMode::kSequential;

  for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
    const auto& step = *it->step;
    logger_.Info("Rolling back completed migration step: " + step.name);

    std::vector<model::OperationPtr> reversed(step.operations.rbegin(), step.operations.rend());
    auto strategy = rollback_manager_->CreateRollbackStrategy(reversed, mode, it->context);
    bool undone   = rollback_manager_->ExecuteRollbackStrategy(strategy.id, true);
    rollback_manager_->DiscardRollbackStrategy(strategy.id);

    try {
      for (const auto& [name, snapshot] : it->checkpoint.snapshots) {
        state_manager_->RestoreFromSnapshot(snapshot.id);
      }
    } catch (const std::exception& e) {
      logger_.Error("Failed to restore checkpoint for migration step " + step.name, e);
      undone = false;
    }

    if (undone) {
      auto& steps = result.completed_steps;
      steps.erase(std::remove(steps.begin(), steps.end(), step.id), steps.end());
    } else {
      result.metadata["phase_rollback"] = "incomplete";
      logger_.Error("Phase rollback left migration step " + step.name + " in place", {StringField("migration_id", result.migration_id)});
    }
  }
  completed.clear();
}

model::MigrationResult TransactionManager::ExecuteMigration(const std::vector<model::MigrationStep>& steps,
                                                            const model::TransactionOptions&         options) {
  const auto started_at = util::Clock::now();

  model::MigrationResult result;
  result.migration_id = util::GenerateID("migration");
  result.metadata     = options.metadata;

  SpanScope span("migration.execute");
  span.SetAttribute("migration.id", result.migration_id);

  std::vector<CompletedStep> completed;

  auto fail = [&](const model::MigrationStep* step, const std::string& error) {
    span.RecordException(error);
    if (step) result.failed_step = step->id;
    result.success  = false;
    result.error    = error;
    result.duration = Since(started_at);
  };

  try {
    logger_.Info("Starting migration " + result.migration_id, {IntField("steps", static_cast<std::int64_t>(steps.size()))});

    for (const auto& step : steps) {
      SpanScope step_span("migration.step");
      step_span.SetAttribute("step.id", step.id);
      logger_.Info("Executing migration step: " + step.name);

      auto       transaction  = BeginTransaction(options);
      const auto step_started = util::Clock::now();
      bool       archived     = false;

      auto step_failed = [&](const std::string& error) {
        step_span.RecordException(error);
        logger_.Error("Migration step failed: " + step.name, {StringField("error", error)});
        if (!archived) Abort(transaction, step_started, {}, error, options.metadata);
        if (step.rollback_strategy == model::StepRollbackStrategy::kPhase) RollbackPhase(completed, result);
        fail(&step, error);
      };

      try {
        for (const auto& prerequisite : step.prerequisites) {
          if (std::find(result.completed_steps.begin(), result.completed_steps.end(), prerequisite) == result.completed_steps.end()) {
            throw util::InvalidState("Prerequisite " + prerequisite + " not completed for step " + step.name);
          }
        }

        auto checkpoint = transaction->CreateCheckpoint("Before step: " + step.name, model::RollbackPointType::kMigrationStep);
        result.rollback_points.push_back(checkpoint);

        ExecuteAtomicOperations(step.operations, options);

        transaction->Commit();
        ArchiveCommitted(*transaction, step_started, {}, std::nullopt, options.metadata);
        archived = true;

        result.completed_steps.push_back(step.id);
        completed.push_back({&step, checkpoint, transaction->Context()});
        logger_.Info("Completed migration step: " + step.name);
      } catch (const std::exception& e) {
        step_failed(e.what());
        return result;
      } catch (...) {
        step_failed(kUnknownError);
        return result;
      }
    }
  } catch (const std::exception& e) {
    logger_.Error("Migration " + result.migration_id + " failed", e);
    fail(nullptr, e.what());
    return result;
  }

  result.success  = true;
  result.duration = Since(started_at);
  logger_.Info("Migration " + result.migration_id + " completed successfully",
               {IntField("duration_ms", static_cast<std::int64_t>(result.duration.count()))});
  return result;
}

model::RollbackPoint TransactionManager::CreateRollbackPoint(const std::string& transaction_id, model::RollbackPointType type,
                                                             const std::string& description) {
  auto transaction = GetTransaction(transaction_id);
  if (!transaction) throw util::TransactionNotFound(transaction_id);

  auto point = transaction->CreateCheckpoint(description, type);
  rollback_manager_->RegisterRollbackPoint(point, transaction->Context().user_id);
  return point;
}

bool TransactionManager::ExecuteRollback(const std::string& rollback_point_id) {
  for (const auto& transaction : GetActiveTransactions()) {
    const auto points = transaction->GetRollbackPoints();
    const bool owns   = std::any_of(points.begin(), points.end(), [&](const model::RollbackPoint& p) { return p.id == rollback_point_id; });
    if (!owns) continue;

    try {
      transaction->RollbackToCheckpoint(rollback_point_id);
      return true;
    } catch (const std::exception& e) {
      logger_.Error("Failed to execute rollback " + rollback_point_id, e);
      return false;
    }
  }

  std::optional<model::RollbackPoint> archived;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : history_) {
      for (const auto& point : entry.rollback_points) {
        if (point.id == rollback_point_id) archived = point;
      }
    }
  }
  if (!archived) throw util::RollbackPointNotFound(rollback_point_id);

  try {
    for (const auto& [name, snapshot] : archived->snapshots) {
      state_manager_->RestoreFromSnapshot(snapshot.id);
    }
  } catch (const std::exception& e) {
    logger_.Error("Failed to execute rollback " + rollback_point_id, e);
    return false;
  }

  logger_.Info("Restored archived rollback point " + rollback_point_id);
  return true;
}

TransactionStatus TransactionManager::GetTransactionStatus(const std::string& transaction_id) const {
  std::lock_guard lock(mutex_);
  if (auto it = active_.find(transaction_id); it != active_.end()) return it->second->Status();

  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->transaction_id == transaction_id) return it->status;
  }
  throw util::TransactionNotFound(transaction_id);
}

TransactionPtr TransactionManager::GetTransaction(const std::string& transaction_id) const {
  std::lock_guard lock(mutex_);
  auto            it = active_.find(transaction_id);
  return it == active_.end() ? nullptr : it->second;
}

std::vector<TransactionPtr> TransactionManager::GetActiveTransactions() const {
  std::lock_guard             lock(mutex_);
  std::vector<TransactionPtr> out;
  out.reserve(active_.size());
  for (const auto& [id, transaction] : active_) out.push_back(transaction);
  return out;
}

bool TransactionManager::CancelTransaction(const std::string& transaction_id) {
  auto transaction = GetTransaction(transaction_id);
  if (!transaction) return false;

  if (!Abort(transaction, transaction->Context().created_at, transaction->ExecutedOperationIds(), "Transaction cancelled",
             transaction->Context().metadata)) {
    return false;
  }
  logger_.Info("Transaction " + transaction_id + " cancelled");
  return true;
}

std::vector<model::TransactionResult> TransactionManager::GetTransactionHistory(const std::optional<std::string>& user_id) const {
  std::lock_guard                       lock(mutex_);
  std::vector<model::TransactionResult> out;
  for (const auto& entry : history_) {
    if (!user_id || entry.user_id == *user_id) out.push_back(entry);
  }
  return out;
}

std::size_t TransactionManager::CleanupTransactions(util::Timestamp older_than) {
  std::vector<model::TransactionResult> removed;
  {
    std::lock_guard lock(mutex_);
    std::deque<model::TransactionResult> kept;
    for (auto& entry : history_) {
      if (entry.completed_at < older_than) {
        removed.push_back(std::move(entry));
      } else {
        kept.push_back(std::move(entry));
      }
    }
    history_.swap(kept);
  }

  for (const auto& entry : removed) {
    for (const auto& point : entry.rollback_points) rollback_manager_->ForgetRollbackPoint(point.id);
  }

  logger_.Info("Cleaned up transaction history", {IntField("removed", static_cast<std::int64_t>(removed.size()))});
  return removed.size();
}

model::ValidationResult TransactionManager::ValidateRollbackFeasibility(const std::string& rollback_point_id) {
  return rollback_manager_->ValidateRollbackFeasibility(rollback_point_id);
}

recovery::RollbackImpactAnalysis TransactionManager::GetRollbackImpactAnalysis(const std::string& rollback_point_id) {
  return rollback_manager_->GetRollbackImpactAnalysis(rollback_point_id);
}

} // namespace rollback::txn
