#pragma once

#include <stdexcept>
#include <string>

namespace arena::script {

/*
  Error raised by the BidScript toolchain.

  kSyntax comes from the lexer/parser, every other kind from the interpreter.
  Messages never carry host details; they are safe to show verbatim.
*/
class ScriptError : public std::runtime_error {
 public:
  enum class Kind {
    kSyntax,
    kRuntime,
    kTimeout,
    kResourceExceeded,
  };

  ScriptError(Kind kind, std::string message, int line = 0);

  Kind kind() const {
    return kind_;
  }

  int line() const {
    return line_;
  }

  const std::string& message() const {
    return message_;
  }

 private:
  Kind        kind_;
  std::string message_;
  int         line_;
};

} // namespace arena::script
