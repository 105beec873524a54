#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace geocache::db {

/*
  Backend-neutral outcome of a repository call.

  Backends translate sqlite3/pqxx errors into these codes;
  RecordStore maps them onto util exceptions.
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

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
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

  // Another writer got there first; the whole transaction may be retried.
  bool Retryable() const {
    return code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure || code == ErrorCode::Busy;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace geocache::db
