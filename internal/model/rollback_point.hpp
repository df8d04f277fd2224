#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/state_snapshot.hpp"
#include "internal/model/transaction_context.hpp"
#include "internal/util/time.hpp"

namespace rollback::model {

enum class RollbackPointType : std::uint8_t {
  kCheckpoint    = 0,
  kSavepoint     = 1,
  kMigrationStep = 2,
  kManual        = 3,
};

constexpr std::string_view ToString(RollbackPointType type) {
  switch (type) {
    case RollbackPointType::kCheckpoint:
      return "CHECKPOINT";
    case RollbackPointType::kSavepoint:
      return "SAVEPOINT";
    case RollbackPointType::kMigrationStep:
      return "MIGRATION_STEP";
    case RollbackPointType::kManual:
      return "MANUAL";
  }
  return "UNKNOWN";
}

// Name of the snapshot reference every checkpoint carries.
inline constexpr const char* kDatabaseSnapshot = "database";

/*
  Snapshot-backed marker inside a transaction. Immutable once created.
*/
struct RollbackPoint {
  std::string                             id;
  std::string                             transaction_id;
  RollbackPointType                       type = RollbackPointType::kCheckpoint;
  util::Timestamp                         created_at{};
  std::string                             description;
  std::map<std::string, SnapshotMetadata> snapshots;
  std::vector<std::string>                dependencies;
  std::vector<std::string>                validation_checks;
  Metadata                                metadata;
};

} // namespace rollback::model
