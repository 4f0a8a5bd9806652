#include "internal/sandbox/executor.hpp"

#include "internal/sandbox/in_process_executor.hpp"
#include "internal/sandbox/process_executor.hpp"

namespace arena::sandbox {

InvocationOutcome InvocationOutcome::Bid(double amount) {
  InvocationOutcome outcome;
  outcome.kind   = Kind::kBid;
  outcome.amount = amount;
  return outcome;
}

InvocationOutcome InvocationOutcome::NoBid() {
  return InvocationOutcome{};
}

InvocationOutcome InvocationOutcome::Fault(arena::core::v1::FaultKind kind, std::string reason) {
  InvocationOutcome outcome;
  outcome.kind         = Kind::kFault;
  outcome.fault_kind   = kind;
  outcome.fault_reason = std::move(reason);
  return outcome;
}

arena::sandbox::v1::Limits LimitsFromRunConfig(const arena::runtime::config::RunConfig& run) {
  arena::sandbox::v1::Limits limits;
  limits.set_max_steps(run.max_steps_per_invocation());
  limits.set_max_call_depth(run.max_call_depth());
  limits.set_memory_limit_bytes(run.per_invocation_memory_limit_bytes());
  limits.set_timeout_ms(run.per_invocation_timeout_ms());
  return limits;
}

std::unique_ptr<Executor> MakeExecutor(arena::runtime::config::IsolationMode mode, const arena::sandbox::v1::Limits& limits) {
  if (mode == arena::runtime::config::ISOLATION_MODE_IN_PROCESS) {
    return std::make_unique<InProcessExecutor>(limits);
  }
  return std::make_unique<ProcessExecutor>(limits);
}

const char* OutcomeLabel(const InvocationOutcome& outcome) {
  switch (outcome.kind) {
    case InvocationOutcome::Kind::kBid: return "bid";
    case InvocationOutcome::Kind::kNoBid: return "no_bid";
    case InvocationOutcome::Kind::kFault: break;
  }
  switch (outcome.fault_kind) {
    case arena::core::v1::FAULT_KIND_TIMEOUT: return "timeout";
    case arena::core::v1::FAULT_KIND_RESOURCE_EXCEEDED: return "resource_exceeded";
    case arena::core::v1::FAULT_KIND_MALFORMED_BID: return "malformed_bid";
    default: return "runtime_exception";
  }
}

} // namespace arena::sandbox
