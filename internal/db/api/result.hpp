#pragma once

#include <string>
#include <utility>

namespace reservation::db {

// Backend failures as seen by the reservation core. ThrowIfDbError turns these
// into the engine's exceptions; pqxx and sqlite3 error types stay inside db/.
enum class ErrorCode {
  OK = 0,

  NotFound,       // reservation or blocked date id absent
  AlreadyExists,  // reservation id reused

  Busy,  // sqlite lock held past the busy timeout
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

} // namespace reservation::db
