#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/state/snapshot_store.hpp"

namespace rollback::state::memory {

/*
  Process-local snapshot store. Snapshots are lost on exit.
*/
class MemorySnapshotStore final : public state::SnapshotStore {
 public:
  MemorySnapshotStore();

  Result                              Put(const model::StateSnapshot& snapshot) override;
  std::optional<model::StateSnapshot> Get(const std::string& id) override;
  bool                                Remove(const std::string& id) override;

  std::vector<model::StateSnapshot>    List() override;
  std::vector<model::SnapshotMetadata> ListMetadata() override;

 private:
  std::mutex mutex_;

  std::unordered_map<std::string, model::StateSnapshot> snapshots_;
  std::vector<std::string>                              order_;
};

} // namespace rollback::state::memory
