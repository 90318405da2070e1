#pragma once

#include <string>

namespace checkout::db {

/*
  Backend-neutral outcome of a repository write.

  Backends map their native failures (sqlite3 codes, pqxx exceptions)
  onto ErrorCode; nothing above internal/db sees a driver type.
  Conflict is special: it means a guard (stock, version, status) did not
  hold and the caller lost a race.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  // retryable contention inside the driver
  Busy,
  SerializationFailure,

  ConstraintViolation,
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

} // namespace checkout::db
