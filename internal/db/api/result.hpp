#pragma once

#include <string>

namespace bookrec::db {

/*
  Portable result codes for writes to external stores.

  Backends translate pqxx/sqlite errors into these; upper layers never
  depend on backend exception types. Conflict means a guard rejected the
  write and retrying will not help.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Unavailable,

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

  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::Unavailable || code == ErrorCode::InternalError;
  }
};

} // namespace bookrec::db
