#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/sandbox/executor.hpp"
#include "internal/script/interpreter.hpp"

namespace arena::sandbox {

/*
  Thread isolation: the interpreter runs in the calling thread and enforces
  the deadline cooperatively. Memory is bounded only by the interpreter's
  own accounting.
*/
class InProcessExecutor : public Executor {
 public:
  explicit InProcessExecutor(arena::sandbox::v1::Limits limits);

  void              Load(StrategyId id, const std::string& source) override;
  InvocationOutcome Invoke(StrategyId id, const arena::sandbox::v1::Invocation& invocation) override;
  void              Unload(StrategyId id) override;

 private:
  struct Slot {
    std::mutex          mutex;
    script::Interpreter interpreter;

    explicit Slot(script::Interpreter interp) : interpreter(std::move(interp)) {
    }
  };

  arena::sandbox::v1::Limits limits_;

  std::mutex                                            mutex_;
  std::unordered_map<StrategyId, std::shared_ptr<Slot>> slots_;
};

} // namespace arena::sandbox
