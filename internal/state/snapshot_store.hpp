#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_snapshot.hpp"
#include "internal/state/result.hpp"

namespace rollback::state {

/*
  Snapshot store abstraction.

  GUARANTEES for all backends:

  - Put stores the snapshot byte-for-byte, including its checksum; the
    store never recomputes or repairs checksums
  - Put on an existing id replaces the stored snapshot
  - List/ListMetadata return snapshots in creation order
  - Calls for different ids may run concurrently
*/
class SnapshotStore {
 public:
  virtual ~SnapshotStore() = default;

  virtual Result                              Put(const model::StateSnapshot& snapshot) = 0;
  virtual std::optional<model::StateSnapshot> Get(const std::string& id)                = 0;
  virtual bool                                Remove(const std::string& id)             = 0;

  virtual std::vector<model::StateSnapshot>    List()         = 0;
  virtual std::vector<model::SnapshotMetadata> ListMetadata() = 0;
};

} // namespace rollback::state
