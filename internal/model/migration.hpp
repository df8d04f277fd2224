#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/atomic_operation.hpp"
#include "internal/model/rollback_point.hpp"

namespace rollback::model {

enum class StepRollbackStrategy : std::uint8_t {
  // undo only the failing step
  kStep  = 0,
  // undo the failing step and every step completed before it
  kPhase = 1,
};

constexpr std::string_view ToString(StepRollbackStrategy strategy) {
  return strategy == StepRollbackStrategy::kPhase ? "phase" : "step";
}

struct MigrationStep {
  std::string               id;
  std::string               name;
  std::string               description;
  std::string               phase;
  std::vector<OperationPtr> operations;
  std::vector<std::string>  prerequisites;
  StepRollbackStrategy      rollback_strategy = StepRollbackStrategy::kStep;
  std::vector<std::string>  validation_rules;
  std::chrono::milliseconds estimated_duration{0};
};

struct MigrationResult {
  std::string                migration_id;
  bool                       success = false;
  std::vector<std::string>   completed_steps;
  std::optional<std::string> failed_step;
  std::vector<RollbackPoint> rollback_points;
  std::optional<std::string> error;
  std::chrono::milliseconds  duration{0};
  Metadata                   metadata;
};

} // namespace rollback::model
