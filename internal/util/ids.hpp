#pragma once

#include <string>
#include <string_view>

namespace rollback::util {

/*
  Process-unique identifiers of the form <prefix>_<unix_ms>_<random>.

  The random suffix is 9 base-36 characters drawn from a per-thread
  generator.
*/
std::string GenerateID(std::string_view prefix);

inline std::string GenerateTransactionID() {
  return GenerateID("txn");
}

inline std::string GenerateRollbackPointID() {
  return GenerateID("rbp");
}

inline std::string GenerateSnapshotID() {
  return GenerateID("snapshot");
}

} // namespace rollback::util
