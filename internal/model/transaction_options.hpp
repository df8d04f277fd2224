#pragma once

#include <optional>
#include <string>

#include "internal/model/transaction_context.hpp"
#include "internal/model/transaction_status.hpp"

namespace rollback::model {

/*
  Recognised per-call options.

  user_id and session_id come from the caller's auth/session layer; the
  engine does not invent an identity for the user.
*/
struct TransactionOptions {
  bool                          create_checkpoint = false;
  std::optional<std::string>    user_id;
  std::optional<std::string>    session_id;
  std::optional<IsolationLevel> isolation_level;
  Metadata                      metadata;
};

} // namespace rollback::model
