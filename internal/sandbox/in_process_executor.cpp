#include "internal/sandbox/in_process_executor.hpp"

#include "internal/sandbox/evaluation.hpp"
#include "internal/script/parser.hpp"
#include "internal/script/script_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace arena::sandbox {

InProcessExecutor::InProcessExecutor(arena::sandbox::v1::Limits limits) : limits_(std::move(limits)) {
}

void InProcessExecutor::Load(StrategyId id, const std::string& source) {
  std::shared_ptr<const script::Program> program;
  try {
    program = std::make_shared<const script::Program>(script::Parse(source));
  } catch (const script::ScriptError& e) {
    throw util::InvalidArgument(std::string("strategy source does not parse: ") + e.what());
  }

  auto slot = std::make_shared<Slot>(script::Interpreter(std::move(program), ToScriptLimits(limits_)));

  std::lock_guard lock(mutex_);
  slots_[id] = std::move(slot);
}

InvocationOutcome InProcessExecutor::Invoke(StrategyId id, const arena::sandbox::v1::Invocation& invocation) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(mutex_);
    auto            it = slots_.find(id);
    if (it == slots_.end()) {
      throw util::NotFound("strategy " + std::to_string(id) + " is not loaded");
    }
    slot = it->second;
  }

  std::lock_guard lock(slot->mutex);
  const auto      start   = util::SteadyClock::now();
  InvocationOutcome outcome = FromResponse(Evaluate(slot->interpreter, invocation, limits_.memory_limit_bytes()));
  outcome.latency_ms        = util::ElapsedMs(start);
  return outcome;
}

void InProcessExecutor::Unload(StrategyId id) {
  std::lock_guard lock(mutex_);
  slots_.erase(id);
}

} // namespace arena::sandbox
