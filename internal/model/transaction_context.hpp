#pragma once

#include <map>
#include <string>

#include "internal/util/time.hpp"

namespace rollback::model {

using Metadata = std::map<std::string, std::string>;

/*
  Immutable per-transaction context.

  Handed to every operation's Execute/Rollback/Validate so operations can
  be context-aware without global state. Built once by the
  TransactionManager (or a test) and never modified.
*/
struct TransactionContext {
  std::string     transaction_id;
  std::string     user_id;
  std::string     session_id;
  util::Timestamp created_at{};
  Metadata        metadata;
};

} // namespace rollback::model
