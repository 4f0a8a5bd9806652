#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ast.hpp"
#include "value.hpp"

namespace arena::script {

struct Limits {
  std::uint64_t             max_steps      = 1'000'000;
  std::uint32_t             max_call_depth = 32;
  std::chrono::milliseconds timeout{0}; // 0 = no wall-clock deadline
};

/*
  Tree-walking BidScript interpreter.

  The interpreter exposes no I/O: the only callable names are the program's
  own functions, the fixed builtin set and the members of imported modules
  ("math" is the only module). Every statement and expression costs one step.
  Running out of steps or crossing the deadline raises ScriptError(kTimeout);
  nesting calls deeper than max_call_depth or outgrowing the Heap budget
  raises ScriptError(kResourceExceeded); everything else the script gets
  wrong raises ScriptError(kRuntime).

  One Interpreter serves one strategy and is not safe for concurrent Call()s.
*/
class Interpreter {
 public:
  Interpreter(std::shared_ptr<const Program> program, Limits limits);

  // Values returned (and args passed) must live in `heap`.
  Value Call(Heap& heap, const std::string& function, std::vector<Value> args);

  // Steps consumed by the most recent Call(), including a failed one.
  std::uint64_t last_steps() const {
    return last_steps_;
  }

  const Limits& limits() const {
    return limits_;
  }

 private:
  std::shared_ptr<const Program>                       program_;
  Limits                                               limits_;
  std::unordered_map<std::string, const FunctionDecl*> functions_;
  std::uint64_t                                        last_steps_ = 0;
};

bool IsBuiltin(std::string_view name);

bool IsImportableModule(std::string_view name);

} // namespace arena::script
