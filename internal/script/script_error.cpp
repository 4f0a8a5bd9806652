#include "script_error.hpp"

namespace arena::script {

namespace {

std::string Render(const std::string& message, int line) {
  if (line <= 0) {
    return message;
  }
  return message + " (line " + std::to_string(line) + ")";
}

} // namespace

ScriptError::ScriptError(Kind kind, std::string message, int line)
    : std::runtime_error(Render(message, line)), kind_(kind), message_(std::move(message)), line_(line) {
}

} // namespace arena::script
