#include "internal/recovery/rollback_manager.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>

#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace rollback::recovery {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kMediumRiskNewerPoints = 5;

} // namespace

RollbackManager::RollbackManager(std::shared_ptr<state::StateManager> state_manager, observability::Logger logger,
                                 RollbackManagerOptions options)
    : state_manager_(std::move(state_manager)), logger_(std::move(logger)), options_(std::move(options)) {
  if (!state_manager_) throw std::invalid_argument("RollbackManager requires a state manager");
}

RollbackStrategy RollbackManager::CreateRollbackStrategy(const std::vector<model::OperationPtr>& operations, RollbackExecutionMode mode,
                                                         const model::TransactionContext& context) {
  RollbackStrategy strategy;
  strategy.id      = util::GenerateID("strategy");
  strategy.mode    = mode;
  strategy.context = context;

  for (const auto& operation : operations) {
    if (!operation) throw std::invalid_argument("operation is null");

    RollbackStep step;
    step.id                 = "rollback_" + operation->Id();
    step.name               = "Rollback " + operation->Name();
    step.operation          = operation;
    step.estimated_duration = operation->Descriptor().timeout / 2;
    step.risk               = RiskLevel::kMedium;

    strategy.estimated_duration += step.estimated_duration;
    strategy.risk = std::max(strategy.risk, step.risk);
    strategy.dependencies.push_back(operation->Id());
    strategy.steps.push_back(std::move(step));
  }

  {
    std::lock_guard lock(mutex_);
    strategies_[strategy.id] = strategy;
  }

  logger_.Debug("Created rollback strategy " + strategy.id,
                {StringField("mode", ToString(mode)), IntField("steps", static_cast<std::int64_t>(strategy.steps.size()))});
  return strategy;
}

bool RollbackManager::RunStep(const RollbackStrategy& strategy, const RollbackStep& step) const {
  try {
    step.operation->Rollback(strategy.context);
    return true;
  } catch (const std::exception& e) {
    logger_.Error("Rollback step " + step.name + " failed", e, {StringField("strategy_id", strategy.id)});
  } catch (...) {
    logger_.Error("Rollback step " + step.name + " failed with unknown error", {StringField("strategy_id", strategy.id)});
  }
  return false;
}

bool RollbackManager::ExecuteRollbackStrategy(const std::string& strategy_id, bool continue_on_failure) {
  RollbackStrategy strategy;
  {
    std::lock_guard lock(mutex_);
    auto            it = strategies_.find(strategy_id);
    if (it == strategies_.end()) throw util::StrategyNotFound(strategy_id);
    strategy = it->second;
  }

  bool ok = true;
  if (strategy.mode == RollbackExecutionMode::kSequential) {
    for (const auto& step : strategy.steps) {
      if (!RunStep(strategy, step)) {
        ok = false;
        if (!continue_on_failure) break;
      }
    }
  } else {
    std::vector<char>        results(strategy.steps.size(), 0);
    std::vector<std::thread> workers;
    workers.reserve(strategy.steps.size());
    for (std::size_t i = 0; i < strategy.steps.size(); ++i) {
      workers.emplace_back([this, &strategy, &results, i] { results[i] = RunStep(strategy, strategy.steps[i]) ? 1 : 0; });
    }
    for (auto& worker : workers) worker.join();
    ok = std::all_of(results.begin(), results.end(), [](char r) { return r != 0; });
  }

  if (ok) {
    logger_.Info("Rollback strategy " + strategy_id + " executed successfully");
  } else {
    logger_.Error("Rollback strategy " + strategy_id + " failed", {StringField("mode", ToString(strategy.mode))});
  }
  return ok;
}

bool RollbackManager::DiscardRollbackStrategy(const std::string& strategy_id) {
  std::lock_guard lock(mutex_);
  return strategies_.erase(strategy_id) > 0;
}

void RollbackManager::RegisterRollbackPoint(const model::RollbackPoint& point, const std::string& user_id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(points_.begin(), points_.end(), [&](const RegisteredPoint& p) { return p.point.id == point.id; });
  if (it != points_.end()) {
    it->user_id = user_id;
    return;
  }
  points_.push_back({point, user_id});
}

bool RollbackManager::ForgetRollbackPoint(const std::string& rollback_point_id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(points_.begin(), points_.end(), [&](const RegisteredPoint& p) { return p.point.id == rollback_point_id; });
  if (it == points_.end()) return false;
  points_.erase(it);
  return true;
}

model::ValidationResult RollbackManager::ValidateRollbackFeasibility(const std::string& rollback_point_id) {
  std::optional<model::RollbackPoint> point;
  {
    std::lock_guard lock(mutex_);
    for (const auto& registered : points_) {
      if (registered.point.id == rollback_point_id) {
        point = registered.point;
        break;
      }
    }
  }
  if (!point) return model::ValidationResult::Invalid("Rollback point not found: " + rollback_point_id);

  model::ValidationResult result;
  std::set<std::string>   referenced;
  for (const auto& [name, snapshot] : point->snapshots) {
    referenced.insert(snapshot.id);
    auto check = state_manager_->ValidateSnapshot(snapshot.id);
    if (!check.is_valid) {
      result.is_valid = false;
      result.errors.push_back("Snapshot " + name + " (" + snapshot.id + ") is not restorable: " + check.JoinedErrors());
    }
    result.warnings.insert(result.warnings.end(), check.warnings.begin(), check.warnings.end());
  }

  std::size_t newer = 0;
  for (const auto& metadata : state_manager_->ListSnapshotMetadata()) {
    if (referenced.count(metadata.id) == 0 && metadata.created_at >= point->created_at) ++newer;
  }
  if (newer > 0) {
    result.warnings.push_back(std::to_string(newer) + " snapshot(s) were taken after rollback point " + rollback_point_id +
                              "; state has moved on since");
  }

  return result;
}

RollbackImpactAnalysis RollbackManager::GetRollbackImpactAnalysis(const std::string& rollback_point_id) {
  model::RollbackPoint  point;
  std::set<std::string> newer_users;
  std::size_t           newer_points = 0;
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(points_.begin(), points_.end(), [&](const RegisteredPoint& p) { return p.point.id == rollback_point_id; });
    if (it == points_.end()) throw util::RollbackPointNotFound(rollback_point_id);
    point = it->point;
    for (auto next = std::next(it); next != points_.end(); ++next) {
      ++newer_points;
      if (!next->user_id.empty()) newer_users.insert(next->user_id);
    }
  }

  RollbackImpactAnalysis analysis;
  analysis.affected_services = options_.affected_services;
  analysis.dependencies      = point.dependencies;

  bool          snapshot_invalid = false;
  std::uint64_t restore_bytes    = 0;
  for (const auto& [name, metadata] : point.snapshots) {
    if (std::find(analysis.affected_services.begin(), analysis.affected_services.end(), name) == analysis.affected_services.end()) {
      analysis.affected_services.push_back(name);
    }
    if (!state_manager_->ValidateSnapshot(metadata.id).is_valid) snapshot_invalid = true;
    restore_bytes += metadata.size_bytes;
  }

  analysis.affected_users = static_cast<std::uint32_t>(newer_users.size());

  if (snapshot_invalid || newer_points > kMediumRiskNewerPoints) {
    analysis.data_loss_risk = RiskLevel::kHigh;
  } else if (newer_points > 0) {
    analysis.data_loss_risk = RiskLevel::kMedium;
  } else {
    analysis.data_loss_risk = RiskLevel::kLow;
  }

  analysis.estimated_downtime = options_.base_restore_downtime;
  if (options_.restore_bytes_per_second > 0) {
    analysis.estimated_downtime += std::chrono::milliseconds(restore_bytes * 1000 / options_.restore_bytes_per_second);
  }

  analysis.recommendations.push_back("Create backup before rollback");
  if (analysis.affected_users > 0) analysis.recommendations.push_back("Notify affected users");
  if (snapshot_invalid) analysis.recommendations.push_back("Verify snapshot integrity before restoring");

  return analysis;
}

} // namespace rollback::recovery
