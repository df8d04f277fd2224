#include "memory_snapshot_store.hpp"

#include <algorithm>

namespace rollback::state::memory {

MemorySnapshotStore::MemorySnapshotStore() = default;

Result MemorySnapshotStore::Put(const model::StateSnapshot& snapshot) {
  if (snapshot.id.empty()) return Result::Err(ErrorCode::InternalError, "snapshot id is empty");

  std::lock_guard lock(mutex_);
  auto [it, inserted] = snapshots_.insert_or_assign(snapshot.id, snapshot);
  if (inserted) order_.push_back(it->first);
  return Result::Ok();
}

std::optional<model::StateSnapshot> MemorySnapshotStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = snapshots_.find(id);
  if (it == snapshots_.end()) return std::nullopt;
  return it->second;
}

bool MemorySnapshotStore::Remove(const std::string& id) {
  std::lock_guard lock(mutex_);
  if (snapshots_.erase(id) == 0) return false;
  order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
  return true;
}

std::vector<model::StateSnapshot> MemorySnapshotStore::List() {
  std::lock_guard                   lock(mutex_);
  std::vector<model::StateSnapshot> snapshots;
  snapshots.reserve(order_.size());
  for (const auto& id : order_) {
    snapshots.push_back(snapshots_.at(id));
  }
  return snapshots;
}

std::vector<model::SnapshotMetadata> MemorySnapshotStore::ListMetadata() {
  std::lock_guard                      lock(mutex_);
  std::vector<model::SnapshotMetadata> metadata;
  metadata.reserve(order_.size());
  for (const auto& id : order_) {
    metadata.push_back(snapshots_.at(id).Metadata());
  }
  return metadata;
}

} // namespace rollback::state::memory
