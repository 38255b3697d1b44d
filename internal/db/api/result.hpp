#pragma once

#include <string>
#include <utility>

namespace batch::db {

// Backend failures as the job store sees them. Backends map their native
// error codes onto these; anything not OK becomes a PersistenceError.
enum class ErrorCode {
  OK = 0,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError,
  ReadOnly,
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
    case ErrorCode::ReadOnly:
      return "read-only transaction";
  }
  return "unknown";
}

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

} // namespace batch::db
