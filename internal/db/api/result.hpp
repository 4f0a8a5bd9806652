#pragma once

#include <string>
#include <utility>

namespace arena::db {

/*
  Outcome of a repository write.

  Backends map their native failures onto ErrorCode; nothing above the
  repository sees sqlite status values. The service layer turns a failed
  Result into util::InfrastructureError, which aborts the affected run.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // run id unknown
  AlreadyExists, // run id reused
  Conflict,      // Run Result offset is not the next one for the run
  Busy,          // database locked past the busy timeout

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

const char* ToString(ErrorCode code);

} // namespace arena::db
