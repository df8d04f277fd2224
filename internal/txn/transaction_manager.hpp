#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/atomic_operation.hpp"
#include "internal/model/migration.hpp"
#include "internal/model/rollback_point.hpp"
#include "internal/model/transaction_options.hpp"
#include "internal/model/transaction_result.hpp"
#include "internal/model/transaction_status.hpp"
#include "internal/model/validation_result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recovery/rollback_manager.hpp"
#include "internal/txn/transaction.hpp"
#include "internal/util/time.hpp"

namespace rollback::state {
class StateManager;
}

namespace rollback::txn {

struct EngineOptions {
  // 0 keeps every result.
  std::size_t max_history_entries = 0;
  // Strategy type for migration phase rollback.
  bool parallel_rollback = false;
};

/*
  Top-level orchestrator.

  Owns the active-transaction map and the result history. Every
  transaction that reaches a terminal status through this class is
  archived exactly once, failures included, before any error is rethrown
  to the caller.

  Ownership:
    - active transactions are shared with callers (BeginTransaction,
      GetTransaction); the manager drops its reference on archive.
    - history entries are copies and never mutated.

  No internal lock is held while operation callbacks run, so operations
  may call back into the manager.
*/
class TransactionManager {
 public:
  TransactionManager(std::shared_ptr<state::StateManager> state_manager, std::shared_ptr<recovery::RollbackManager> rollback_manager,
                     observability::Logger logger = {}, EngineOptions options = {});

  TransactionPtr BeginTransaction(const model::TransactionOptions& options = {});

  // Throws OperationValidationFailed before any side effect, or rethrows
  // the execution error after rollback; a result is archived either way.
  model::TransactionResult ExecuteAtomicOperation(const model::OperationPtr& operation, const model::TransactionOptions& options = {});

  // All operations are validated before the first one runs. result holds
  // the output of the last operation.
  model::TransactionResult ExecuteAtomicOperations(const std::vector<model::OperationPtr>& operations,
                                                   const model::TransactionOptions&        options = {});

  // Never throws; the outcome is reported through the MigrationResult.
  model::MigrationResult ExecuteMigration(const std::vector<model::MigrationStep>& steps, const model::TransactionOptions& options = {});

  model::RollbackPoint CreateRollbackPoint(const std::string& transaction_id, model::RollbackPointType type, const std::string& description);

  // False when restoration failed; throws RollbackPointNotFound when the id
  // is unknown to active transactions and history alike.
  bool ExecuteRollback(const std::string& rollback_point_id);

  model::TransactionStatus    GetTransactionStatus(const std::string& transaction_id) const;
  TransactionPtr              GetTransaction(const std::string& transaction_id) const;
  std::vector<TransactionPtr> GetActiveTransactions() const;
  bool                        CancelTransaction(const std::string& transaction_id);

  std::vector<model::TransactionResult> GetTransactionHistory(const std::optional<std::string>& user_id = std::nullopt) const;
  std::size_t                           CleanupTransactions(util::Timestamp older_than);

  model::ValidationResult          ValidateRollbackFeasibility(const std::string& rollback_point_id);
  recovery::RollbackImpactAnalysis GetRollbackImpactAnalysis(const std::string& rollback_point_id);

 private:
  struct CompletedStep {
    const model::MigrationStep* step;
    model::RollbackPoint        checkpoint;
    model::TransactionContext   context;
  };

  // Moves the transaction from active to history. Empty when another path
  // archived it first.
  std::optional<model::TransactionResult> Archive(const Transaction& transaction, util::Timestamp started_at,
                                                  std::vector<std::string> executed, std::optional<model::OperationOutput> output,
                                                  std::optional<std::string> error, const model::Metadata& metadata);
  model::TransactionResult                ArchiveCommitted(const Transaction& transaction, util::Timestamp started_at,
                                                           std::vector<std::string> executed, std::optional<model::OperationOutput> output,
                                                           const model::Metadata& metadata);

  // Rolls the transaction back (if still open) and archives it. False when a
  // concurrent rollback or commit owns the transaction.
  bool Abort(const TransactionPtr& transaction, util::Timestamp started_at, std::vector<std::string> executed, const std::string& error,
             const model::Metadata& metadata);

  // Undoes an executed operation the transaction refused to take.
  void UndoDetached(const Transaction& transaction, const model::OperationPtr& operation);

  void RollbackPhase(std::vector<CompletedStep>& completed, model::MigrationResult& result);

  std::shared_ptr<state::StateManager>       state_manager_;
  std::shared_ptr<recovery::RollbackManager> rollback_manager_;
  observability::Logger                      logger_;
  EngineOptions                              options_;

  mutable std::mutex                              mutex_;
  std::unordered_map<std::string, TransactionPtr> active_;
  std::deque<model::TransactionResult>            history_;
};

} // namespace rollback::txn
