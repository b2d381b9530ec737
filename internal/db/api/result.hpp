#pragma once

#include <string>

namespace jobguard::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
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

  // Another writer got there first; the caller may retry the transaction.
  bool IsConflict() const {
    return code == ErrorCode::AlreadyExists || code == ErrorCode::Conflict || code == ErrorCode::Busy ||
           code == ErrorCode::ConstraintViolation || code == ErrorCode::SerializationFailure;
  }
};

} // namespace jobguard::db
