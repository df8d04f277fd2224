#include "internal/factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/state/memory/memory_snapshot_store.hpp"
#include "internal/state/sqlite/sqlite_db.hpp"
#include "internal/state/sqlite/sqlite_snapshot_store.hpp"

namespace rollback::factory {

namespace {

constexpr const char* kDefaultCompression = "none";

recovery::RollbackManagerOptions BuildRollbackOptions(const rollback::runtime::config::EngineConfig& engine) {
  recovery::RollbackManagerOptions options;
  options.affected_services.assign(engine.affected_services().begin(), engine.affected_services().end());
  options.restore_bytes_per_second = engine.restore_bytes_per_second();
  options.base_restore_downtime    = std::chrono::milliseconds(engine.base_restore_downtime_ms());
  return options;
}

} // namespace

std::shared_ptr<state::SnapshotStore> BuildSnapshotStore(const rollback::runtime::config::RuntimeConfig& config) {
  const auto& snapshots = config.snapshots();
  if (snapshots.has_sqlite()) {
    const auto& sqlite = snapshots.sqlite();
    if (sqlite.path().empty()) throw std::runtime_error("snapshots.sqlite.path must be set");

    auto db = std::make_shared<state::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    return std::make_shared<state::sqlite::SqliteSnapshotStore>(std::move(db));
  }

  return std::make_shared<state::memory::MemorySnapshotStore>();
}

/*
    Build full engine dependency graph
*/
Engine Build(const rollback::runtime::config::RuntimeConfig& config, std::shared_ptr<state::StateProvider> provider) {
  Engine engine;

  if (!provider) provider = std::make_shared<state::NullStateProvider>();

  observability::Logger logger;

  // ------------------------------------------------------------------
  // Snapshots
  // ------------------------------------------------------------------
  const auto& compression = config.snapshots().compression();

  engine.store         = BuildSnapshotStore(config);
  engine.state_manager = std::make_shared<state::StateManager>(engine.store, std::move(provider), logger,
                                                               compression.empty() ? std::string(kDefaultCompression) : compression);

  // ------------------------------------------------------------------
  // Rollback and transactions
  // ------------------------------------------------------------------
  engine.rollback_manager = std::make_shared<recovery::RollbackManager>(engine.state_manager, logger, BuildRollbackOptions(config.engine()));

  txn::EngineOptions options;
  options.max_history_entries = config.engine().max_history_entries();
  options.parallel_rollback   = config.engine().parallel_rollback();

  engine.transaction_manager = std::make_shared<txn::TransactionManager>(engine.state_manager, engine.rollback_manager, logger, options);

  observability::LogInfo("Engine assembled", {observability::StringField("snapshot_store", config.snapshots().has_sqlite() ? "sqlite" : "memory")});
  return engine;
}

} // namespace rollback::factory
