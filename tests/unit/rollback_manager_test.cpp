#include "internal/recovery/rollback_manager.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/state/memory/memory_snapshot_store.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "tests/support/test_operations.hpp"

namespace {

using rollback::model::OperationPtr;
using rollback::model::RollbackPoint;
using rollback::recovery::RiskLevel;
using rollback::recovery::RollbackExecutionMode;
using rollback::recovery::RollbackManager;
using rollback::recovery::RollbackManagerOptions;
using rollback::testing::CallLog;
using rollback::testing::MakeOperation;
using rollback::testing::StringStateProvider;

struct Fixture {
  std::shared_ptr<rollback::state::memory::MemorySnapshotStore> store = std::make_shared<rollback::state::memory::MemorySnapshotStore>();
  std::shared_ptr<StringStateProvider>            provider = std::make_shared<StringStateProvider>(std::string(1000, 'x'));
  std::shared_ptr<rollback::state::StateManager> state    = std::make_shared<rollback::state::StateManager>(store, provider);
  std::shared_ptr<CallLog>                        log      = std::make_shared<CallLog>();
  RollbackManager                                 manager{state, {}, Options()};

  static RollbackManagerOptions Options() {
    RollbackManagerOptions options;
    options.affected_services        = {"documents"};
    options.restore_bytes_per_second = 500;
    options.base_restore_downtime    = std::chrono::milliseconds(100);
    return options;
  }

  RollbackPoint Point(const std::string& user) {
    RollbackPoint point;
    point.id             = rollback::util::GenerateRollbackPointID();
    point.transaction_id = "txn_test";
    point.created_at     = rollback::util::Clock::now();
    point.snapshots.emplace("database", state->CreateSnapshot(rollback::model::SnapshotType::kIncremental).Metadata());
    manager.RegisterRollbackPoint(point, user);
    return point;
  }
};

bool Contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void TestStrategyDescribesEachUndoStep() {
  Fixture                   f;
  std::vector<OperationPtr> ops = {MakeOperation("a", f.log), MakeOperation("b", f.log)};

  auto strategy = f.manager.CreateRollbackStrategy(ops, RollbackExecutionMode::kParallel);

  assert(strategy.id.rfind("strategy_", 0) == 0);
  assert(strategy.steps.size() == 2);
  assert(strategy.steps[0].id == "rollback_a");
  assert(strategy.steps[1].name == "Rollback op b");
  assert(strategy.steps[0].estimated_duration == std::chrono::milliseconds(500));
  assert(strategy.estimated_duration == std::chrono::milliseconds(1000));
  assert(strategy.risk == RiskLevel::kMedium);
  assert((strategy.dependencies == std::vector<std::string>{"a", "b"}));
  assert(f.log->Entries().empty());
}

void TestSequentialStrategyRunsInOrder() {
  Fixture f;
  auto    strategy = f.manager.CreateRollbackStrategy({MakeOperation("c", f.log), MakeOperation("b", f.log), MakeOperation("a", f.log)},
                                                      RollbackExecutionMode::kSequential);

  assert(f.manager.ExecuteRollbackStrategy(strategy.id));
  assert((f.log->Entries() == std::vector<std::string>{"rollback:c", "rollback:b", "rollback:a"}));
}

void TestSequentialStrategyReportsFailure() {
  Fixture f;
  auto    strategy = f.manager.CreateRollbackStrategy({MakeOperation("a", f.log, {false, true}), MakeOperation("b", f.log)},
                                                      RollbackExecutionMode::kSequential);

  assert(!f.manager.ExecuteRollbackStrategy(strategy.id));
}

void TestSequentialStrategyCanContinuePastFailure() {
  Fixture f;
  auto    strategy = f.manager.CreateRollbackStrategy({MakeOperation("b", f.log, {false, true}), MakeOperation("a", f.log)},
                                                      RollbackExecutionMode::kSequential);

  assert(!f.manager.ExecuteRollbackStrategy(strategy.id, true));
  assert((f.log->Entries() == std::vector<std::string>{"rollback:b", "rollback:a"}));
}

void TestParallelStrategyRunsEveryStep() {
  Fixture f;
  auto    strategy = f.manager.CreateRollbackStrategy(
      {MakeOperation("a", f.log), MakeOperation("b", f.log, {false, true}), MakeOperation("c", f.log)}, RollbackExecutionMode::kParallel);

  assert(!f.manager.ExecuteRollbackStrategy(strategy.id));
  assert(f.log->Count("rollback:a") == 1);
  assert(f.log->Count("rollback:b") == 1);
  assert(f.log->Count("rollback:c") == 1);
}

void TestUnknownStrategyThrows() {
  Fixture f;
  auto    strategy = f.manager.CreateRollbackStrategy({}, RollbackExecutionMode::kSequential);
  assert(f.manager.DiscardRollbackStrategy(strategy.id));

  bool threw = false;
  try {
    (void)f.manager.ExecuteRollbackStrategy(strategy.id);
  } catch (const rollback::util::StrategyNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestFeasibility() {
  Fixture f;

  auto unknown = f.manager.ValidateRollbackFeasibility("rbp_unknown");
  assert(!unknown.is_valid);
  assert(unknown.errors[0] == "Rollback point not found: rbp_unknown");

  auto point = f.Point("alice");
  auto fresh = f.manager.ValidateRollbackFeasibility(point.id);
  assert(fresh.is_valid);
  assert(fresh.warnings.empty());

  (void)f.state->CreateSnapshot(rollback::model::SnapshotType::kFull);
  auto moved_on = f.manager.ValidateRollbackFeasibility(point.id);
  assert(moved_on.is_valid);
  assert(moved_on.warnings.size() == 1);

  auto tampered = *f.store->Get(point.snapshots.at("database").id);
  tampered.data = "changed";
  assert(f.store->Put(tampered));
  assert(!f.manager.ValidateRollbackFeasibility(point.id).is_valid);
}

void TestImpactWithNothingNewer() {
  Fixture f;
  auto    point = f.Point("alice");

  auto impact = f.manager.GetRollbackImpactAnalysis(point.id);
  assert(impact.data_loss_risk == RiskLevel::kLow);
  assert(impact.affected_users == 0);
  assert(Contains(impact.affected_services, "documents"));
  assert(Contains(impact.affected_services, "database"));
  // 100ms base + 1000 bytes at 500 B/s
  assert(impact.estimated_downtime == std::chrono::milliseconds(2100));
  assert((impact.recommendations == std::vector<std::string>{"Create backup before rollback"}));
}

void TestImpactGrowsWithNewerPoints() {
  Fixture f;
  auto    point = f.Point("alice");
  (void)f.Point("bob");
  (void)f.Point("carol");
  (void)f.Point("bob");

  auto medium = f.manager.GetRollbackImpactAnalysis(point.id);
  assert(medium.data_loss_risk == RiskLevel::kMedium);
  assert(medium.affected_users == 2);
  assert(Contains(medium.recommendations, "Notify affected users"));

  for (int i = 0; i < 3; ++i) (void)f.Point("dave");
  assert(f.manager.GetRollbackImpactAnalysis(point.id).data_loss_risk == RiskLevel::kHigh);

  assert(f.manager.ForgetRollbackPoint(point.id));
  bool threw = false;
  try {
    (void)f.manager.GetRollbackImpactAnalysis(point.id);
  } catch (const rollback::util::RollbackPointNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestImpactOfCorruptedSnapshotIsHigh() {
  Fixture f;
  auto    point = f.Point("alice");
  f.store->Remove(point.snapshots.at("database").id);

  auto impact = f.manager.GetRollbackImpactAnalysis(point.id);
  assert(impact.data_loss_risk == RiskLevel::kHigh);
  assert(Contains(impact.recommendations, "Verify snapshot integrity before restoring"));
}

} // namespace

int main() {
  TestStrategyDescribesEachUndoStep();
  TestSequentialStrategyRunsInOrder();
  TestSequentialStrategyReportsFailure();
  TestSequentialStrategyCanContinuePastFailure();
  TestParallelStrategyRunsEveryStep();
  TestUnknownStrategyThrows();
  TestFeasibility();
  TestImpactWithNothingNewer();
  TestImpactGrowsWithNewerPoints();
  TestImpactOfCorruptedSnapshotIsHigh();

  std::cout << "rollback_engine_unit_rollback_manager: pass\n";
  return 0;
}
