#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/recovery/rollback_manager.hpp"
#include "internal/state/snapshot_store.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/state/state_provider.hpp"
#include "internal/txn/transaction_manager.hpp"

namespace rollback::factory {

/*
  Engine

  Owns one independent engine instance. Several may coexist in a process
  (per test, per tenant); nothing here is global.
*/
struct Engine {
  std::shared_ptr<state::SnapshotStore>      store;
  std::shared_ptr<state::StateManager>       state_manager;
  std::shared_ptr<recovery::RollbackManager> rollback_manager;
  std::shared_ptr<txn::TransactionManager>   transaction_manager;
};

/*
  Build

  Composition root. The only place that knows concrete snapshot store
  types. A null provider is replaced by NullStateProvider.
*/
std::shared_ptr<state::SnapshotStore> BuildSnapshotStore(const rollback::runtime::config::RuntimeConfig& config);

Engine Build(const rollback::runtime::config::RuntimeConfig& config, std::shared_ptr<state::StateProvider> provider = nullptr);

} // namespace rollback::factory
