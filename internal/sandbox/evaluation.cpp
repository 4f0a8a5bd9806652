#include "internal/sandbox/evaluation.hpp"

#include <cmath>
#include <new>
#include <string>

#include "internal/script/script_error.hpp"
#include "internal/validation/static_validator.hpp"

namespace arena::sandbox {

namespace {

using arena::core::v1::FaultKind;
using arena::sandbox::v1::WorkerResponse;

void Put(script::Heap& heap, script::Map& map, const std::string& key, script::Value value) {
  heap.Charge(script::kValueCost + key.size());
  map.entries.emplace(key, std::move(value));
}

const script::Map* BindContext(script::Heap& heap, const arena::sandbox::v1::AuctionContext& context) {
  const auto& impression = context.impression();
  script::Map* ctx       = heap.NewMap();

  script::Map* features = heap.NewMap();
  for (const auto& [name, feature] : impression.features()) {
    if (feature.kind_case() == arena::core::v1::FeatureValue::kNumber) {
      Put(heap, *features, name, feature.number());
    } else {
      Put(heap, *features, name, heap.String(feature.text()));
    }
  }

  script::Map* percentiles = heap.NewMap();
  for (const auto& [percentile, price] : context.market().price_percentiles()) {
    Put(heap, *percentiles, std::to_string(percentile), price);
  }

  Put(heap, *ctx, "floor_price", impression.floor_price());
  Put(heap, *ctx, "sequence", static_cast<double>(impression.sequence()));
  Put(heap, *ctx, "timestamp", static_cast<double>(impression.timestamp()));
  Put(heap, *ctx, "features", static_cast<const script::Map*>(features));
  Put(heap, *ctx, "initial_budget", context.initial_budget());
  Put(heap, *ctx, "total_duration", static_cast<double>(context.total_duration()));
  Put(heap, *ctx, "remaining_time", static_cast<double>(context.remaining_time()));
  Put(heap, *ctx, "percentiles", static_cast<const script::Map*>(percentiles));
  Put(heap, *ctx, "conversion_rate", context.market().conversion_rate());
  return ctx;
}

const script::Map* BindState(script::Heap& heap, const arena::sandbox::v1::StateView& state) {
  script::Map* view = heap.NewMap();
  Put(heap, *view, "budget_remaining", state.budget_remaining());
  Put(heap, *view, "impressions_seen", static_cast<double>(state.impressions_seen()));
  Put(heap, *view, "impressions_won", static_cast<double>(state.impressions_won()));
  Put(heap, *view, "total_spend", state.total_spend());
  Put(heap, *view, "conversions", static_cast<double>(state.conversions()));
  Put(heap, *view, "consecutive_faults", static_cast<double>(state.consecutive_faults()));
  return view;
}

FaultKind ToFaultKind(script::ScriptError::Kind kind) {
  switch (kind) {
    case script::ScriptError::Kind::kTimeout: return arena::core::v1::FAULT_KIND_TIMEOUT;
    case script::ScriptError::Kind::kResourceExceeded: return arena::core::v1::FAULT_KIND_RESOURCE_EXCEEDED;
    default: return arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION;
  }
}

void SetFault(WorkerResponse& response, FaultKind kind, std::string reason) {
  auto* fault = response.mutable_fault();
  fault->set_kind(kind);
  fault->set_reason(std::move(reason));
}

} // namespace

script::Limits ToScriptLimits(const arena::sandbox::v1::Limits& limits) {
  script::Limits out;
  if (limits.max_steps() > 0) out.max_steps = limits.max_steps();
  if (limits.max_call_depth() > 0) out.max_call_depth = limits.max_call_depth();
  out.timeout = std::chrono::milliseconds(limits.timeout_ms());
  return out;
}

std::vector<script::Value> BindArguments(script::Heap& heap, const arena::sandbox::v1::Invocation& invocation) {
  std::vector<script::Value> args;
  args.reserve(2);
  args.emplace_back(BindContext(heap, invocation.context()));
  args.emplace_back(BindState(heap, invocation.state()));
  return args;
}

WorkerResponse Evaluate(script::Interpreter& interpreter, const arena::sandbox::v1::Invocation& invocation,
                        std::uint64_t memory_limit_bytes) {
  WorkerResponse response;
  response.set_invocation_id(invocation.invocation_id());

  try {
    script::Heap  heap(memory_limit_bytes);
    script::Value result =
        interpreter.Call(heap, std::string(validation::kEntryPointName), BindArguments(heap, invocation));

    if (std::holds_alternative<std::monostate>(result)) {
      response.mutable_no_bid();
    } else if (const auto* amount = std::get_if<double>(&result)) {
      if (!std::isfinite(*amount) || *amount < 0.0) {
        SetFault(response, arena::core::v1::FAULT_KIND_MALFORMED_BID,
                 "bid must be a finite non-negative number, got " + script::Display(result));
      } else {
        response.set_bid_amount(*amount);
      }
    } else {
      SetFault(response, arena::core::v1::FAULT_KIND_MALFORMED_BID,
               "bid must be a number or none, got " + std::string(script::TypeName(result)));
    }
  } catch (const script::ScriptError& e) {
    SetFault(response, ToFaultKind(e.kind()), e.what());
  } catch (const std::bad_alloc&) {
    SetFault(response, arena::core::v1::FAULT_KIND_RESOURCE_EXCEEDED, "out of memory");
  }

  response.set_steps(interpreter.last_steps());
  return response;
}

InvocationOutcome FromResponse(const WorkerResponse& response) {
  InvocationOutcome outcome;
  switch (response.result_case()) {
    case WorkerResponse::kBidAmount: {
      const double amount = response.bid_amount();
      // Re-checked on this side of the channel: a worker is not trusted.
      if (!std::isfinite(amount) || amount < 0.0) {
        outcome = InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_MALFORMED_BID, "bid must be a finite non-negative number");
      } else {
        outcome = InvocationOutcome::Bid(amount);
      }
      break;
    }
    case WorkerResponse::kNoBid:
      outcome = InvocationOutcome::NoBid();
      break;
    case WorkerResponse::kFault: {
      FaultKind kind = response.fault().kind();
      if (kind == arena::core::v1::FAULT_KIND_UNSPECIFIED) kind = arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION;
      outcome = InvocationOutcome::Fault(kind, response.fault().reason());
      break;
    }
    default:
      outcome = InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_MALFORMED_BID, "worker returned no result");
      break;
  }
  outcome.steps = response.steps();
  return outcome;
}

} // namespace arena::sandbox
