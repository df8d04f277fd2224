#include "internal/txn/transaction.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/state/memory/memory_snapshot_store.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "tests/support/test_operations.hpp"

namespace {

using rollback::model::TransactionContext;
using rollback::model::TransactionStatus;
using rollback::state::StateManager;
using rollback::testing::CallLog;
using rollback::testing::GatedOperation;
using rollback::testing::MakeOperation;
using rollback::testing::StringStateProvider;
using rollback::txn::Transaction;

struct Fixture {
  std::shared_ptr<StringStateProvider> provider = std::make_shared<StringStateProvider>("v1");
  std::shared_ptr<StateManager>        state =
      std::make_shared<StateManager>(std::make_shared<rollback::state::memory::MemorySnapshotStore>(), provider);
  std::shared_ptr<CallLog> log = std::make_shared<CallLog>();

  std::unique_ptr<Transaction> Make() {
    TransactionContext ctx;
    ctx.transaction_id = rollback::util::GenerateTransactionID();
    ctx.user_id        = "alice";
    ctx.session_id     = "session_1";
    ctx.created_at     = rollback::util::Clock::now();
    return std::make_unique<Transaction>(ctx, state);
  }
};

template <typename Fn>
bool ThrowsInvalidState(Fn&& fn) {
  try {
    fn();
  } catch (const rollback::util::InvalidTransactionState&) {
    return true;
  }
  return false;
}

void TestExecuteActivatesAndReturnsValue() {
  Fixture f;
  auto    txn = f.Make();
  assert(txn->Status() == TransactionStatus::kPending);

  auto value = txn->Execute([] { return 42; });
  assert(value == 42);
  assert(txn->Status() == TransactionStatus::kActive);

  txn->Commit();
  assert(txn->Status() == TransactionStatus::kCommitted);
}

void TestExecuteErrorMarksFailedAndRethrows() {
  Fixture f;
  auto    txn = f.Make();

  bool threw = false;
  try {
    txn->Execute([]() -> int { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  assert(threw);
  assert(txn->Status() == TransactionStatus::kFailed);

  assert(ThrowsInvalidState([&] { txn->Execute([] { return 1; }); }));
  assert(ThrowsInvalidState([&] { txn->AddOperation(MakeOperation("late", f.log)); }));
  assert(ThrowsInvalidState([&] { txn->Commit(); }));

  txn->Rollback();
  assert(txn->Status() == TransactionStatus::kRolledBack);
}

void TestRollbackUndoesInReverseAndCollectsFailures() {
  Fixture f;
  auto    txn = f.Make();

  txn->Execute([] { return 0; });
  txn->AddOperation(MakeOperation("a", f.log));
  txn->AddOperation(MakeOperation("b", f.log, {false, true}));
  txn->AddOperation(MakeOperation("c", f.log));

  auto failures = txn->Rollback();

  const std::vector<std::string> expected = {"rollback:c", "rollback:b", "rollback:a"};
  assert(f.log->Entries() == expected);
  assert(txn->Status() == TransactionStatus::kRolledBack);
  assert(failures.size() == 1);
  assert(failures[0].operation_id == "b");
  assert(failures[0].message == "rollback of b failed");
  assert(txn->RollbackFailures().size() == 1);

  assert(ThrowsInvalidState([&] { txn->Rollback(); }));
}

void TestCommittedTransactionRejectsRollback() {
  Fixture f;
  auto    txn = f.Make();
  txn->Commit();
  assert(ThrowsInvalidState([&] { txn->Rollback(); }));
  assert(ThrowsInvalidState([&] { (void)txn->CreateCheckpoint("too late"); }));
}

void TestRollbackWaitsForExecuteAndIsExclusive() {
  Fixture f;
  auto    txn  = f.Make();
  auto    gate = std::make_shared<GatedOperation>("slow", f.log);
  txn->AddOperation(gate);

  std::thread executor([&] { (void)txn->Execute([&] { return gate->Execute(txn->Context()); }); });
  gate->WaitUntilStarted();

  std::thread roller([&] { (void)txn->Rollback(); });
  while (!txn->RollbackInProgress()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  assert(ThrowsInvalidState([&] { txn->Rollback(); }));
  assert(ThrowsInvalidState([&] { txn->Commit(); }));
  assert(ThrowsInvalidState([&] { txn->AddOperation(MakeOperation("late", f.log)); }));
  assert(ThrowsInvalidState([&] { (void)txn->Execute([] { return 0; }); }));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(f.log->Count("rollback:slow") == 0);

  gate->Release();
  executor.join();
  roller.join();

  assert(txn->Status() == TransactionStatus::kRolledBack);
  assert(!txn->RollbackInProgress());
  assert((f.log->Entries() == std::vector<std::string>{"execute:slow", "rollback:slow"}));
  assert(ThrowsInvalidState([&] { txn->Rollback(); }));
}

void TestCheckpointRestoreKeepsStatusAndFullRollbackStillRuns() {
  Fixture f;
  auto    txn = f.Make();

  txn->Execute([] { return 0; });
  txn->AddOperation(MakeOperation("x", f.log));

  auto checkpoint = txn->CreateCheckpoint("before X");
  assert(checkpoint.transaction_id == txn->Id());
  assert(checkpoint.id.rfind("rbp_", 0) == 0);
  assert(checkpoint.snapshots.count("database") == 1);
  assert(txn->GetRollbackPoints().size() == 1);

  f.provider->Set("v2");
  txn->RollbackToCheckpoint(checkpoint.id);
  assert(f.provider->Value() == "v1");
  assert(txn->Status() == TransactionStatus::kActive);

  txn->Rollback();
  assert(txn->Status() == TransactionStatus::kRolledBack);
  assert(f.log->Count("rollback:x") == 1);
}

void TestUnknownCheckpointIsNotFound() {
  Fixture f;
  auto    txn = f.Make();

  bool threw = false;
  try {
    txn->RollbackToCheckpoint("rbp_unknown");
  } catch (const rollback::util::CheckpointNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestValidateAggregatesEveryOperation() {
  Fixture f;
  auto    txn = f.Make();

  txn->AddOperation(MakeOperation("a", f.log, {false, false, true}));
  txn->AddOperation(MakeOperation("b", f.log));
  txn->AddOperation(MakeOperation("c", f.log, {false, false, true}));

  auto result = txn->Validate();
  assert(!result.is_valid);
  assert(result.errors.size() == 2);
  assert(f.log->Count("validate:b") == 1);
}

void TestIsolationLevelIsRecorded() {
  Fixture f;
  auto    txn = f.Make();
  txn->SetIsolationLevel(rollback::model::IsolationLevel::kSerializable);
  assert(txn->GetIsolationLevel() == rollback::model::IsolationLevel::kSerializable);
}

} // namespace

int main() {
  TestExecuteActivatesAndReturnsValue();
  TestExecuteErrorMarksFailedAndRethrows();
  TestRollbackUndoesInReverseAndCollectsFailures();
  TestCommittedTransactionRejectsRollback();
  TestRollbackWaitsForExecuteAndIsExclusive();
  TestCheckpointRestoreKeepsStatusAndFullRollbackStillRuns();
  TestUnknownCheckpointIsNotFound();
  TestValidateAggregatesEveryOperation();
  TestIsolationLevelIsRecorded();

  std::cout << "rollback_engine_unit_transaction: pass\n";
  return 0;
}
