#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/atomic_operation.hpp"
#include "internal/model/rollback_point.hpp"
#include "internal/model/transaction_context.hpp"
#include "internal/model/validation_result.hpp"
#include "internal/observability/logging.hpp"

namespace rollback::state {
class StateManager;
}

namespace rollback::recovery {

enum class RollbackExecutionMode : std::uint8_t {
  kSequential = 0,
  kParallel   = 1,
};

constexpr std::string_view ToString(RollbackExecutionMode mode) {
  return mode == RollbackExecutionMode::kParallel ? "parallel" : "sequential";
}

enum class RiskLevel : std::uint8_t {
  kLow    = 0,
  kMedium = 1,
  kHigh   = 2,
};

constexpr std::string_view ToString(RiskLevel risk) {
  switch (risk) {
    case RiskLevel::kLow:
      return "low";
    case RiskLevel::kMedium:
      return "medium";
    case RiskLevel::kHigh:
      return "high";
  }
  return "unknown";
}

// Undo of one already-executed operation.
struct RollbackStep {
  std::string               id;
  std::string               name;
  model::OperationPtr       operation;
  std::chrono::milliseconds estimated_duration{0};
  RiskLevel                 risk = RiskLevel::kMedium;
};

/*
  Undo plan built from executed operations.

  estimated_duration is the plain sum of the step estimates for both modes;
  it does not model any parallel speedup.
*/
struct RollbackStrategy {
  std::string               id;
  RollbackExecutionMode     mode = RollbackExecutionMode::kSequential;
  std::vector<RollbackStep> steps;
  std::chrono::milliseconds estimated_duration{0};
  RiskLevel                 risk = RiskLevel::kLow;
  std::vector<std::string>  dependencies;
  model::TransactionContext context;
};

struct RollbackImpactAnalysis {
  std::vector<std::string>  affected_services;
  std::uint32_t             affected_users = 0;
  RiskLevel                 data_loss_risk = RiskLevel::kLow;
  std::chrono::milliseconds estimated_downtime{0};
  std::vector<std::string>  dependencies;
  std::vector<std::string>  recommendations;
};

struct RollbackManagerOptions {
  std::vector<std::string>  affected_services;
  std::uint64_t             restore_bytes_per_second = 0;
  std::chrono::milliseconds base_restore_downtime{0};
};

/*
  Builds and runs undo plans, and judges whether a rollback point can
  still be restored to.

  Points become known to the manager through RegisterRollbackPoint; their
  registration order defines which points are "newer" for impact
  analysis.
*/
class RollbackManager {
 public:
  RollbackManager(std::shared_ptr<state::StateManager> state_manager, observability::Logger logger = {},
                  RollbackManagerOptions options = {});

  RollbackStrategy CreateRollbackStrategy(const std::vector<model::OperationPtr>& operations, RollbackExecutionMode mode,
                                          const model::TransactionContext& context = {});

  // False when any step failed; throws StrategyNotFound for unknown ids.
  // A sequential strategy stops at the first failed step unless
  // continue_on_failure is set.
  bool ExecuteRollbackStrategy(const std::string& strategy_id, bool continue_on_failure = false);
  bool DiscardRollbackStrategy(const std::string& strategy_id);

  model::ValidationResult ValidateRollbackFeasibility(const std::string& rollback_point_id);
  RollbackImpactAnalysis  GetRollbackImpactAnalysis(const std::string& rollback_point_id);

  void RegisterRollbackPoint(const model::RollbackPoint& point, const std::string& user_id);
  bool ForgetRollbackPoint(const std::string& rollback_point_id);

 private:
  struct RegisteredPoint {
    model::RollbackPoint point;
    std::string          user_id;
  };

  bool RunStep(const RollbackStrategy& strategy, const RollbackStep& step) const;

  std::shared_ptr<state::StateManager> state_manager_;
  observability::Logger                logger_;
  RollbackManagerOptions               options_;

  mutable std::mutex                                mutex_;
  std::unordered_map<std::string, RollbackStrategy> strategies_;
  std::vector<RegisteredPoint>                      points_;
};

} // namespace rollback::recovery
