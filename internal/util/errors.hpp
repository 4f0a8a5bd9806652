#pragma once

#include <stdexcept>
#include <string>

namespace arena::util {

/*
  Central error types.

  Strategy-code failures never surface as these; they are Fault values.
  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Failure of something the run depends on (impression source, worker spawn).
// Fatal to a run, never to the process.
class InfrastructureError : public std::runtime_error {
 public:
  explicit InfrastructureError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public InfrastructureError {
 public:
  explicit ConfigError(const std::string& msg) : InfrastructureError(msg) {
  }
};

} // namespace arena::util
