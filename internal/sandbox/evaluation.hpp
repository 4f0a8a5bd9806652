#pragma once

#include <vector>

#include "arena/sandbox/v1/worker.pb.h"
#include "internal/sandbox/executor.hpp"
#include "internal/script/interpreter.hpp"

namespace arena::sandbox {

script::Limits ToScriptLimits(const arena::sandbox::v1::Limits& limits);

// Builds the read-only (ctx, state) maps handed to bidding_strategy.
std::vector<script::Value> BindArguments(script::Heap& heap, const arena::sandbox::v1::Invocation& invocation);

/*
  Runs bidding_strategy once inside the current process and classifies the
  result. Never throws for anything the script does; the response carries a
  bid amount, a no-bid or a fault. Shared by the in-process executor and the
  forked worker so both isolation modes judge scripts identically.
*/
arena::sandbox::v1::WorkerResponse Evaluate(script::Interpreter&                   interpreter,
                                            const arena::sandbox::v1::Invocation& invocation,
                                            std::uint64_t                         memory_limit_bytes);

InvocationOutcome FromResponse(const arena::sandbox::v1::WorkerResponse& response);

} // namespace arena::sandbox
