#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "arena/core/v1/types.pb.h"
#include "arena/sandbox/v1/worker.pb.h"
#include "config/config.pb.h"

namespace arena::sandbox {

using StrategyId = std::uint32_t;

struct InvocationOutcome {
  enum class Kind {
    kBid,
    kNoBid,
    kFault,
  };

  Kind                       kind   = Kind::kNoBid;
  double                     amount = 0.0;
  arena::core::v1::FaultKind fault_kind = arena::core::v1::FAULT_KIND_UNSPECIFIED;
  std::string                fault_reason;
  std::uint64_t              steps      = 0;
  double                     latency_ms = 0.0;

  static InvocationOutcome Bid(double amount);
  static InvocationOutcome NoBid();
  static InvocationOutcome Fault(arena::core::v1::FaultKind kind, std::string reason);
};

/*
  Isolation boundary around untrusted strategy code.

  Strategy misbehaviour (exceptions, limits, bad return values, crashed
  workers) always comes back as a Fault outcome; Invoke throws only for
  infrastructure failures (util::InfrastructureError) and unknown ids
  (util::NotFound).

  Invoke may run concurrently for different strategies and is never called
  concurrently for the same strategy.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  // Throws util::InvalidArgument when the source does not parse.
  virtual void Load(StrategyId id, const std::string& source) = 0;

  virtual InvocationOutcome Invoke(StrategyId id, const arena::sandbox::v1::Invocation& invocation) = 0;

  // Releases the strategy's interpreter or worker. Unknown ids are ignored.
  virtual void Unload(StrategyId id) = 0;
};

arena::sandbox::v1::Limits LimitsFromRunConfig(const arena::runtime::config::RunConfig& run);

std::unique_ptr<Executor> MakeExecutor(arena::runtime::config::IsolationMode mode, const arena::sandbox::v1::Limits& limits);

// Metric label for an outcome ("bid", "no_bid", "timeout", ...).
const char* OutcomeLabel(const InvocationOutcome& outcome);

} // namespace arena::sandbox
