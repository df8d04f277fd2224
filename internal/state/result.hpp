#pragma once

#include <string>
#include <utility>

namespace rollback::state {

/*
  Portable snapshot store result codes.

  Store backends translate their native errors into these; the
  StateManager turns them into engine exceptions.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace rollback::state
