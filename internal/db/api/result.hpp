#pragma once

#include <string>
#include <string_view>

namespace fraudit::db {

/*
  Outcome of a repository call. Backends map their native failures onto
  ErrorCode; nothing above internal/db sees sqlite return codes.
  db::ThrowIfDbError turns a failed Result into the util exception types.
*/

enum class ErrorCode {
  OK = 0,
  NotFound,
  // unique open alert already present
  AlreadyExists,
  Conflict,
  // lock not acquired within the busy timeout
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
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

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace fraudit::db
