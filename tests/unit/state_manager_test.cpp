#include "internal/state/state_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/state/memory/memory_snapshot_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_operations.hpp"

namespace {

using rollback::model::SnapshotType;
using rollback::state::StateManager;
using rollback::state::memory::MemorySnapshotStore;
using rollback::testing::StringStateProvider;

struct Fixture {
  std::shared_ptr<MemorySnapshotStore> store    = std::make_shared<MemorySnapshotStore>();
  std::shared_ptr<StringStateProvider> provider = std::make_shared<StringStateProvider>("{\"rooms\":3}");
  StateManager                         manager{store, provider, {}, "none"};
};

class FailingProvider final : public rollback::state::StateProvider {
 public:
  std::string Collect(SnapshotType) override {
    throw std::runtime_error("state unavailable");
  }
  void Apply(const std::string&) override {
  }
};

void TestFreshSnapshotValidates() {
  Fixture f;
  auto    snapshot = f.manager.CreateSnapshot(SnapshotType::kFull);

  assert(snapshot.id.rfind("snapshot_", 0) == 0);
  assert(snapshot.data == "{\"rooms\":3}");
  assert(snapshot.size_bytes == snapshot.data.size());
  assert(snapshot.compression == "none");

  auto result = f.manager.ValidateSnapshot(snapshot.id);
  assert(result.is_valid);
  assert(result.errors.empty());
}

void TestRestoreAppliesStoredState() {
  Fixture f;
  auto    snapshot = f.manager.CreateSnapshot(SnapshotType::kIncremental);

  f.provider->Set("{\"rooms\":7}");
  f.manager.RestoreFromSnapshot(snapshot.id);

  assert(f.provider->Value() == "{\"rooms\":3}");
  assert(f.provider->Restores() == 1);
}

void TestCorruptedSnapshotIsReportedAndNeverApplied() {
  Fixture f;
  auto    snapshot = f.manager.CreateSnapshot(SnapshotType::kFull);

  auto tampered = snapshot;
  tampered.data = "{\"rooms\":4}";
  assert(f.store->Put(tampered));

  auto result = f.manager.ValidateSnapshot(snapshot.id);
  assert(!result.is_valid);
  assert(result.errors.size() == 1);
  assert(result.errors[0] == "Snapshot checksum validation failed");

  f.provider->Set("live");
  bool threw = false;
  try {
    f.manager.RestoreFromSnapshot(snapshot.id);
  } catch (const rollback::util::SnapshotCorrupted&) {
    threw = true;
  }
  assert(threw);
  assert(f.provider->Value() == "live");
  assert(f.provider->Restores() == 0);
}

void TestMissingSnapshotIsNotFound() {
  Fixture f;

  auto result = f.manager.ValidateSnapshot("snapshot_missing");
  assert(!result.is_valid);
  assert(result.errors[0] == "Snapshot not found: snapshot_missing");

  bool threw = false;
  try {
    f.manager.RestoreFromSnapshot("snapshot_missing");
  } catch (const rollback::util::SnapshotNotFound& e) {
    threw = std::string(e.what()) == "Snapshot not found: snapshot_missing";
  }
  assert(threw);
}

void TestEnumerationAndDeletion() {
  Fixture f;
  auto    first  = f.manager.CreateSnapshot(SnapshotType::kFull);
  auto    second = f.manager.CreateSnapshot(SnapshotType::kIncremental);

  assert(f.manager.GetSnapshots().size() == 2);

  auto metadata = f.manager.GetSnapshotMetadata(second.id);
  assert(metadata.has_value());
  assert(metadata->checksum == second.checksum);
  assert(metadata->type == SnapshotType::kIncremental);
  assert(!f.manager.GetSnapshotMetadata("nope").has_value());

  assert(f.manager.DeleteSnapshot(first.id));
  assert(!f.manager.DeleteSnapshot(first.id));

  auto listed = f.manager.ListSnapshotMetadata();
  assert(listed.size() == 1 && listed[0].id == second.id);
}

void TestCollectionErrorPropagates() {
  auto         store = std::make_shared<MemorySnapshotStore>();
  StateManager manager(store, std::make_shared<FailingProvider>());

  bool threw = false;
  try {
    (void)manager.CreateSnapshot(SnapshotType::kFull);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "state unavailable";
  }
  assert(threw);
  assert(store->List().empty());
}

} // namespace

int main() {
  TestFreshSnapshotValidates();
  TestRestoreAppliesStoredState();
  TestCorruptedSnapshotIsReportedAndNeverApplied();
  TestMissingSnapshotIsNotFound();
  TestEnumerationAndDeletion();
  TestCollectionErrorPropagates();

  std::cout << "rollback_engine_unit_state_manager: pass\n";
  return 0;
}
