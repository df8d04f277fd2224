#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace rollback::model {

enum class SnapshotType : std::uint8_t {
  kFull        = 0,
  kIncremental = 1,
};

constexpr std::string_view ToString(SnapshotType type) {
  return type == SnapshotType::kFull ? "full" : "incremental";
}

/*
  Snapshot fields without the payload, for cheap listing.
*/
struct SnapshotMetadata {
  std::string     id;
  util::Timestamp created_at{};
  SnapshotType    type = SnapshotType::kFull;
  std::string     checksum;
  std::uint64_t   size_bytes = 0;
  std::string     compression;
};

/*
  Checksummed capture of state.

  checksum is computed over data when the snapshot is taken and is never
  recomputed in place; validation compares a fresh checksum against it.
*/
struct StateSnapshot {
  std::string     id;
  util::Timestamp created_at{};
  SnapshotType    type = SnapshotType::kFull;
  std::string     data;
  std::string     checksum;
  std::uint64_t   size_bytes = 0;
  std::string     compression;

  SnapshotMetadata Metadata() const {
    return {id, created_at, type, checksum, size_bytes, compression};
  }
};

} // namespace rollback::model
