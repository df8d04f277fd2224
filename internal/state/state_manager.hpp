#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_snapshot.hpp"
#include "internal/model/validation_result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/snapshot_store.hpp"
#include "internal/state/state_provider.hpp"

namespace rollback::state {

/*
  Owns the snapshot lifecycle.

  - CreateSnapshot collects live state through the StateProvider, stamps
    size and checksum, and stores it under a generated id.
  - RestoreFromSnapshot refuses to apply anything that is missing
    (SnapshotNotFound) or fails checksum validation (SnapshotCorrupted).
  - Validation never repairs a snapshot; a mismatch is only reported.

  Thread-safe as long as the store and provider are.
*/
class StateManager {
 public:
  StateManager(std::shared_ptr<SnapshotStore> store, std::shared_ptr<StateProvider> provider, observability::Logger logger = {},
               std::string compression = "none");

  model::StateSnapshot CreateSnapshot(model::SnapshotType type);
  void                 RestoreFromSnapshot(const std::string& snapshot_id);

  model::ValidationResult ValidateSnapshot(const std::string& snapshot_id);
  bool                    DeleteSnapshot(const std::string& snapshot_id);

  std::vector<model::StateSnapshot>      GetSnapshots();
  std::optional<model::StateSnapshot>    GetSnapshot(const std::string& snapshot_id);
  std::optional<model::SnapshotMetadata> GetSnapshotMetadata(const std::string& snapshot_id);
  std::vector<model::SnapshotMetadata>   ListSnapshotMetadata();

 private:
  static model::ValidationResult Validate(const std::string& snapshot_id, const std::optional<model::StateSnapshot>& snapshot);

  std::shared_ptr<SnapshotStore> store_;
  std::shared_ptr<StateProvider> provider_;
  observability::Logger          logger_;
  std::string                    compression_;
};

} // namespace rollback::state
