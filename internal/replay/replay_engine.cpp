#include "internal/replay/replay_engine.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "internal/auction/auction_model.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/replay/bid_worker_pool.hpp"
#include "internal/util/errors.hpp"

namespace arena::replay {

namespace {

using arena::core::v1::BidEntry;
using arena::core::v1::ImpressionRecord;
using arena::core::v1::RunResult;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

const char* FaultKindName(arena::core::v1::FaultKind kind) {
  switch (kind) {
    case arena::core::v1::FAULT_KIND_TIMEOUT: return "Timeout";
    case arena::core::v1::FAULT_KIND_RESOURCE_EXCEEDED: return "ResourceExceeded";
    case arena::core::v1::FAULT_KIND_MALFORMED_BID: return "MalformedBid";
    default: return "RuntimeException";
  }
}

// Strategies see neither the market price nor whether the impression converts.
ImpressionRecord WithoutHindsight(const ImpressionRecord& impression) {
  ImpressionRecord out = impression;
  out.clear_market_price();
  out.clear_is_conversion();
  return out;
}

} // namespace

ReplayEngine::ReplayEngine(std::string run_id, arena::runtime::config::RunConfig config,
                           std::unique_ptr<sandbox::Executor> executor)
    : run_id_(std::move(run_id)),
      config_(config::ConfigLoader::WithDefaults(config)),
      executor_(std::move(executor)) {
}

ReplayEngine::~ReplayEngine() = default;

arena::core::v1::ValidationResult ReplayEngine::Register(const StrategySubmission& submission) {
  if (state() != model::RunState::kInitialized) {
    throw util::InvalidState("strategies can only be registered before the run starts");
  }
  if (submission.name.empty()) {
    throw util::InvalidArgument("strategy name is empty");
  }
  const bool taken =
      std::any_of(slots_.begin(), slots_.end(), [&](const Slot& s) { return s.state.name == submission.name; }) ||
      std::any_of(rejections_.begin(), rejections_.end(), [&](const Rejection& r) { return r.name == submission.name; });
  if (taken) {
    throw util::AlreadyExists("strategy " + submission.name + " is already registered");
  }

  const double budget = submission.starting_budget.value_or(config_.starting_budget_per_strategy());
  if (!std::isfinite(budget) || budget < 0.0) {
    throw util::InvalidArgument("starting budget of " + submission.name + " must be a non-negative number");
  }

  std::string source = validation::StripCodeFences(submission.source);
  auto        result = validator_.Validate(source);
  if (!result.accepted()) {
    ARENA_LOG_WARN("strategy rejected", {StringField("strategy", submission.name), StringField("reason", result.reason())});
    rejections_.push_back(Rejection{submission.name, result});
    return result;
  }

  Slot slot;
  slot.state.index            = static_cast<std::uint32_t>(slots_.size());
  slot.state.name             = submission.name;
  slot.state.source           = std::move(source);
  slot.state.initial_budget   = budget;
  slot.state.budget_remaining = budget;
  slots_.push_back(std::move(slot));

  ARENA_LOG_INFO("strategy registered", {StringField("strategy", submission.name), DoubleField("budget", budget)});
  return result;
}

void ReplayEngine::Attach(std::shared_ptr<ImpressionSource> source) {
  if (state() != model::RunState::kInitialized) {
    throw util::InvalidState("impression source can only be attached before the run starts");
  }
  source_ = std::move(source);
}

void ReplayEngine::Cancel() {
  cancelled_ = true;
}

model::RunState ReplayEngine::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::vector<std::string> ReplayEngine::strategy_names() const {
  std::vector<std::string> names;
  names.reserve(slots_.size());
  for (const auto& slot : slots_) {
    names.push_back(slot.state.name);
  }
  return names;
}

void ReplayEngine::Transition(model::RunState to) {
  std::lock_guard lock(mutex_);
  if (!model::CanTransition(state_, to)) {
    throw util::InvalidState("run " + run_id_ + " cannot go from " + std::string(model::ToString(state_)) + " to " +
                             std::string(model::ToString(to)));
  }
  state_ = to;
}

void ReplayEngine::Prepare() {
  config::ConfigLoader::ValidateRunConfig(config_);

  auction_ = std::make_unique<auction::AuctionModel>(config_.clearing_rule());

  if (!executor_) {
    executor_ = sandbox::MakeExecutor(config_.isolation(), sandbox::LimitsFromRunConfig(config_));
  }
  for (auto& slot : slots_) {
    try {
      executor_->Load(slot.state.index, slot.state.source);
    } catch (const util::InvalidArgument& e) {
      throw util::InfrastructureError("cannot load strategy " + slot.state.name + ": " + e.what());
    }
    if (slot.state.budget_remaining <= 0.0) {
      slot.state.phase = model::phase::BudgetExhausted{};
    }
  }

  std::size_t workers = config_.bid_workers();
  if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
  workers = std::clamp<std::size_t>(workers, 1, std::max<std::size_t>(slots_.size(), 1));
  pool_   = std::make_unique<BidWorkerPool>(workers);

  market_.Clear();
  total_duration_ = 0;
  if (config_.compute_market_summary()) {
    market_         = ComputeMarketSummary(*source_);
    total_duration_ = market_.last_timestamp() - market_.first_timestamp();
    if (total_duration_ == 0) total_duration_ = 1;
  } else {
    source_->Rewind();
  }
}

RunSummary ReplayEngine::Run(const ResultSink& sink) {
  if (!source_) {
    throw util::InvalidState("run " + run_id_ + " has no impression source");
  }

  observability::RunLogScope log_scope(run_id_);
  observability::SpanScope   span("arena.replay.run");
  span.SetAttribute("run.id", run_id_);
  span.SetAttribute("run.strategies", static_cast<std::int64_t>(slots_.size()));

  Transition(model::RunState::kRunning);
  ARENA_LOG_INFO("run started", {IntField("strategies", static_cast<std::int64_t>(slots_.size())),
                                 IntField("rejected", static_cast<std::int64_t>(rejections_.size()))});

  RunSummary summary;
  bool       aborted = false;
  try {
    Prepare();
    while (true) {
      if (cancelled_) {
        aborted              = true;
        summary.abort_reason = "cancelled";
        break;
      }
      auto impression = source_->Next();
      if (!impression) break;

      auto result = ProcessImpression(*impression);
      sink(result);
      ++summary.results_emitted;
    }
  } catch (const std::exception& e) {
    aborted              = true;
    summary.abort_reason = e.what();
    span.RecordException(e.what());
  }

  if (executor_) {
    for (const auto& slot : slots_) {
      executor_->Unload(slot.state.index);
    }
  }
  pool_.reset();

  if (!aborted) {
    Transition(model::RunState::kCompleted);
    summary.state = model::RunState::kCompleted;
    ARENA_LOG_INFO("run completed", {IntField("results", static_cast<std::int64_t>(summary.results_emitted))});
  } else {
    Transition(model::RunState::kAborted);
    summary.state = model::RunState::kAborted;
    ARENA_LOG_ERROR("run aborted", {StringField("reason", summary.abort_reason),
                                    IntField("results", static_cast<std::int64_t>(summary.results_emitted))});
  }
  span.SetAttribute("run.state", model::ToString(summary.state));
  return summary;
}

void ReplayEngine::CollectBids(const ImpressionRecord& impression) {
  arena::sandbox::v1::AuctionContext context;
  *context.mutable_impression() = WithoutHindsight(impression);
  *context.mutable_market()     = market_;
  if (total_duration_ > 0) {
    context.set_total_duration(total_duration_);
    context.set_remaining_time(total_duration_ - (impression.timestamp() - market_.first_timestamp()));
  }

  std::vector<BidTask> tasks;
  for (auto& slot : slots_) {
    slot.invoked = slot.state.IsActive();
    if (!slot.invoked) continue;

    arena::sandbox::v1::Invocation invocation;
    invocation.set_invocation_id(impression.sequence());
    *invocation.mutable_context() = context;
    invocation.mutable_context()->set_initial_budget(slot.state.initial_budget);
    *invocation.mutable_state() = model::ToStateView(slot.state);

    tasks.push_back([this, &slot, invocation = std::move(invocation)] {
      slot.outcome = executor_->Invoke(slot.state.index, invocation);
    });
  }
  pool_->RunBatch(std::move(tasks));
}

RunResult ReplayEngine::ProcessImpression(const ImpressionRecord& impression) {
  CollectBids(impression);

  RunResult result;
  result.set_sequence(impression.sequence());
  result.set_timestamp(impression.timestamp());
  result.set_floor_price(impression.floor_price());

  auto&                     metrics = observability::Metrics::Instance();
  std::vector<auction::Bid> bids;

  for (auto& slot : slots_) {
    auto& state = slot.state;
    auto* entry = result.add_bids();
    entry->set_strategy(state.name);
    entry->set_strategy_index(state.index);

    if (state.IsDisqualified()) {
      entry->set_disposition(arena::core::v1::BID_DISPOSITION_SKIPPED_DISQUALIFIED);
      continue;
    }
    ++state.impressions_seen;
    if (!slot.invoked) {
      entry->set_disposition(arena::core::v1::BID_DISPOSITION_SKIPPED_EXHAUSTED);
      continue;
    }

    const auto& outcome = slot.outcome;
    entry->set_steps(outcome.steps);
    metrics.RecordInvocation(sandbox::OutcomeLabel(outcome));
    metrics.ObserveInvocationLatencyMs(outcome.latency_ms);

    if (outcome.kind == sandbox::InvocationOutcome::Kind::kFault) {
      ApplyFault(slot, *entry);
      continue;
    }
    state.consecutive_faults = 0;

    if (outcome.kind == sandbox::InvocationOutcome::Kind::kNoBid) {
      entry->set_disposition(arena::core::v1::BID_DISPOSITION_NO_BID);
      continue;
    }

    ++state.bids_placed;
    entry->set_amount(outcome.amount);
    if (outcome.amount > state.budget_remaining) {
      entry->set_disposition(arena::core::v1::BID_DISPOSITION_CLAMPED);
      ARENA_LOG_DEBUG("bid clamped", {StringField("strategy", state.name), DoubleField("bid", outcome.amount),
                                      DoubleField("budget_remaining", state.budget_remaining)});
      continue;
    }
    entry->set_disposition(arena::core::v1::BID_DISPOSITION_BID);
    bids.push_back(auction::Bid{state.index, outcome.amount});
  }

  std::optional<double> market_price;
  if (impression.has_market_price()) market_price = impression.market_price();
  const auto resolved = auction_->Resolve(impression.floor_price(), bids, market_price);

  auto* outcome = result.mutable_outcome();
  outcome->set_market_won(resolved.market_won);
  if (resolved.has_winner) {
    auto& state = slots_[resolved.winner_index].state;

    state.budget_remaining = std::max(0.0, state.budget_remaining - resolved.clearing_price);
    state.total_spend += resolved.clearing_price;
    ++state.impressions_won;
    if (impression.is_conversion()) ++state.conversions;
    result.mutable_bids(static_cast<int>(resolved.winner_index))->set_won(true);

    outcome->set_has_winner(true);
    outcome->set_winner(state.name);
    outcome->set_winner_index(resolved.winner_index);
    outcome->set_clearing_price(resolved.clearing_price);

    if (state.budget_remaining <= 0.0) {
      state.phase = model::phase::BudgetExhausted{};
      ARENA_LOG_INFO("strategy budget exhausted", {StringField("strategy", state.name),
                                                   IntField("sequence", static_cast<std::int64_t>(impression.sequence()))});
    }
    metrics.RecordAuction("strategy_won");
  } else {
    metrics.RecordAuction(resolved.market_won ? "market_won" : "no_winner");
  }

  for (const auto& slot : slots_) {
    *result.add_strategies() = model::ToSnapshot(slot.state);
  }
  return result;
}

void ReplayEngine::ApplyFault(Slot& slot, BidEntry& entry) {
  auto&       state   = slot.state;
  const auto& outcome = slot.outcome;

  entry.set_disposition(arena::core::v1::BID_DISPOSITION_FAULT);
  entry.set_fault_kind(outcome.fault_kind);
  entry.set_fault_reason(outcome.fault_reason);

  ++state.consecutive_faults;
  ++state.total_faults;
  state.last_error = std::string(FaultKindName(outcome.fault_kind)) + ": " + outcome.fault_reason;

  ARENA_LOG_WARN("strategy fault", {StringField("strategy", state.name), StringField("fault", state.last_error),
                                    IntField("consecutive", state.consecutive_faults)});

  const auto threshold = config_.disqualify_after_n_faults();
  if (threshold > 0 && state.consecutive_faults >= threshold) {
    Disqualify(slot, std::to_string(state.consecutive_faults) + " consecutive faults, last " + state.last_error);
  }
}

void ReplayEngine::Disqualify(Slot& slot, const std::string& reason) {
  slot.state.phase = model::phase::Disqualified{reason};
  executor_->Unload(slot.state.index);
  ARENA_LOG_WARN("strategy disqualified", {StringField("strategy", slot.state.name), StringField("reason", reason)});
}

} // namespace arena::replay
