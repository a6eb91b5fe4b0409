#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace livetv::db {

/*
  Outcome of one session-store call. Backends map sqlite3 result codes
  and pqxx exceptions onto ErrorCode; the broker only looks at the code
  and logs the message.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  ConstraintViolation,

  // Another writer holds the lock or won the race; the call may succeed later.
  Busy,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError,
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  bool Transient() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace livetv::db
