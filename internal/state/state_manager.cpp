#include "internal/state/state_manager.hpp"

#include <stdexcept>

#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace rollback::state {

using observability::StringField;

namespace {

void ThrowIfStoreError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Corruption:
      throw util::Corruption(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

StateManager::StateManager(std::shared_ptr<SnapshotStore> store, std::shared_ptr<StateProvider> provider, observability::Logger logger,
                           std::string compression)
    : store_(std::move(store)), provider_(std::move(provider)), logger_(std::move(logger)), compression_(std::move(compression)) {
  if (!store_) throw std::invalid_argument("StateManager requires a snapshot store");
  if (!provider_) throw std::invalid_argument("StateManager requires a state provider");
  if (compression_.empty()) compression_ = "none";
}

model::StateSnapshot StateManager::CreateSnapshot(model::SnapshotType type) {
  model::StateSnapshot snapshot;
  snapshot.id   = util::GenerateSnapshotID();
  snapshot.type = type;

  try {
    snapshot.data        = provider_->Collect(type);
    snapshot.created_at  = util::Clock::now();
    snapshot.checksum    = util::Checksum(snapshot.data);
    snapshot.size_bytes  = snapshot.data.size();
    snapshot.compression = compression_;

    ThrowIfStoreError(store_->Put(snapshot), "store snapshot " + snapshot.id);
  } catch (const std::exception& e) {
    logger_.Error("Failed to create state snapshot", e, {StringField("type", model::ToString(type))});
    throw;
  }

  logger_.Info("Created " + std::string(model::ToString(type)) + " state snapshot: " + snapshot.id,
               {observability::IntField("size_bytes", static_cast<std::int64_t>(snapshot.size_bytes))});
  return snapshot;
}

void StateManager::RestoreFromSnapshot(const std::string& snapshot_id) {
  auto snapshot = store_->Get(snapshot_id);
  if (!snapshot) {
    throw util::SnapshotNotFound(snapshot_id);
  }

  try {
    auto validation = Validate(snapshot_id, snapshot);
    if (!validation.is_valid) {
      throw util::SnapshotCorrupted("Snapshot validation failed: " + validation.JoinedErrors());
    }

    provider_->Apply(snapshot->data);
  } catch (const std::exception& e) {
    logger_.Error("Failed to restore from snapshot " + snapshot_id, e);
    throw;
  }

  logger_.Info("Restored state from snapshot: " + snapshot_id);
}

model::ValidationResult StateManager::ValidateSnapshot(const std::string& snapshot_id) {
  try {
    return Validate(snapshot_id, store_->Get(snapshot_id));
  } catch (const std::exception& e) {
    return model::ValidationResult::Invalid("Snapshot validation error: " + std::string(e.what()));
  }
}

model::ValidationResult StateManager::Validate(const std::string& snapshot_id, const std::optional<model::StateSnapshot>& snapshot) {
  if (!snapshot) {
    return model::ValidationResult::Invalid("Snapshot not found: " + snapshot_id);
  }

  if (util::Checksum(snapshot->data) != snapshot->checksum) {
    return model::ValidationResult::Invalid("Snapshot checksum validation failed");
  }

  model::ValidationResult result;
  if (snapshot->size_bytes != snapshot->data.size()) {
    result.warnings.push_back("Recorded size " + std::to_string(snapshot->size_bytes) + " differs from payload size " +
                              std::to_string(snapshot->data.size()));
  }
  return result;
}

bool StateManager::DeleteSnapshot(const std::string& snapshot_id) {
  const bool deleted = store_->Remove(snapshot_id);
  if (deleted) {
    logger_.Info("Deleted snapshot: " + snapshot_id);
  }
  return deleted;
}

std::vector<model::StateSnapshot> StateManager::GetSnapshots() {
  return store_->List();
}

std::optional<model::StateSnapshot> StateManager::GetSnapshot(const std::string& snapshot_id) {
  return store_->Get(snapshot_id);
}

std::optional<model::SnapshotMetadata> StateManager::GetSnapshotMetadata(const std::string& snapshot_id) {
  auto snapshot = store_->Get(snapshot_id);
  if (!snapshot) return std::nullopt;
  return snapshot->Metadata();
}

std::vector<model::SnapshotMetadata> StateManager::ListSnapshotMetadata() {
  return store_->ListMetadata();
}

} // namespace rollback::state
