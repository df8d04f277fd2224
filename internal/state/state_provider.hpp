#pragma once

#include <string>

#include "internal/model/state_snapshot.hpp"

namespace rollback::state {

/*
  Deployment-specific access to the live state protected by snapshots.

  Collect serializes the current state (the provider decides what an
  incremental capture contains); Apply replaces the live state with a
  previously collected payload. Both may throw; the StateManager
  propagates the error.
*/
class StateProvider {
 public:
  virtual ~StateProvider() = default;

  virtual std::string Collect(model::SnapshotType type) = 0;
  virtual void        Apply(const std::string& data)    = 0;
};

/*
  Provider for engines that only rely on operation-level rollback.
  Collects a fixed empty document and ignores restores.
*/
class NullStateProvider final : public StateProvider {
 public:
  std::string Collect(model::SnapshotType) override {
    return "{}";
  }

  void Apply(const std::string&) override {
  }
};

} // namespace rollback::state
