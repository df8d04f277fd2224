#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/state_snapshot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/state/state_provider.hpp"
#include "internal/util/time.hpp"

using rollback::model::SnapshotMetadata;

static void Usage() {
  std::cout << "Usage:\n"
            << "  snapshotctl <config.yaml> list\n"
            << "  snapshotctl <config.yaml> show <snapshot_id>\n"
            << "  snapshotctl <config.yaml> validate <snapshot_id>\n"
            << "  snapshotctl <config.yaml> delete <snapshot_id>\n";
}

static void PrintMetadata(const SnapshotMetadata& metadata) {
  std::cout << metadata.id << " type=" << rollback::model::ToString(metadata.type)
            << " created_at_ms=" << rollback::util::ToUnixMillis(metadata.created_at) << " size=" << metadata.size_bytes
            << " checksum=" << metadata.checksum << " compression=" << metadata.compression << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  const bool needs_id = cmd == "show" || cmd == "validate" || cmd == "delete";
  if (cmd != "list" && !needs_id) {
    Usage();
    return 1;
  }
  if (needs_id && argc < 4) {
    Usage();
    return 1;
  }

  try {
    auto config = rollback::config::ConfigLoader::LoadFromYaml(config_path);
    rollback::observability::InitializeLogging(config);

    auto store = rollback::factory::BuildSnapshotStore(config);
    // Read-only view: nothing is ever restored from here.
    rollback::state::StateManager manager(store, std::make_shared<rollback::state::NullStateProvider>(), {},
                                          config.snapshots().compression().empty() ? "none" : config.snapshots().compression());

    int rc = 0;
    if (cmd == "list") {
      for (const auto& metadata : manager.ListSnapshotMetadata()) PrintMetadata(metadata);
    } else if (cmd == "show") {
      auto snapshot = manager.GetSnapshot(argv[3]);
      if (!snapshot) {
        std::cerr << "snapshot not found: " << argv[3] << "\n";
        rc = 2;
      } else {
        PrintMetadata(snapshot->Metadata());
        std::cout << snapshot->data << "\n";
      }
    } else if (cmd == "validate") {
      auto result = manager.ValidateSnapshot(argv[3]);
      std::cout << (result.is_valid ? "valid" : "invalid") << "\n";
      for (const auto& error : result.errors) std::cout << "  error: " << error << "\n";
      for (const auto& warning : result.warnings) std::cout << "  warning: " << warning << "\n";
      rc = result.is_valid ? 0 : 2;
    } else {
      if (manager.DeleteSnapshot(argv[3])) {
        std::cout << "deleted " << argv[3] << "\n";
      } else {
        std::cerr << "snapshot not found: " << argv[3] << "\n";
        rc = 2;
      }
    }

    rollback::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    ROLLBACK_LOG_ERROR("snapshotctl failed", {rollback::observability::StringField("error", e.what())});
    rollback::observability::ShutdownLogging();
    return 2;
  }
}
