#pragma once

#include <string>
#include <string_view>

namespace edgestore::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  // conditional write lost (stored row is at least as new)
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  // mutation attempted through a read-only repository
  PermissionDenied,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::Conflict:
      return "Conflict";
    case ErrorCode::Busy:
      return "Busy";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::SerializationFailure:
      return "SerializationFailure";
    case ErrorCode::PermissionDenied:
      return "PermissionDenied";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::Corruption:
      return "Corruption";
    case ErrorCode::Unsupported:
      return "Unsupported";
    case ErrorCode::InternalError:
      return "InternalError";
  }
  return "Unknown";
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

} // namespace edgestore::db
