#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "arena/core/v1/types.pb.h"
#include "arena/sandbox/v1/worker.pb.h"

namespace arena::model {

namespace phase {

struct Active {};

// budget_remaining reached zero; the strategy keeps being offered impressions as an automatic no bid.
struct BudgetExhausted {};

// Terminal. The strategy is never invoked again in this run.
struct Disqualified {
  std::string reason;
};

} // namespace phase

using StrategyPhase = std::variant<phase::Active, phase::BudgetExhausted, phase::Disqualified>;

/*
  Runtime state of one registered strategy, owned by the replay engine and
  indexed by registration order.
*/
struct StrategyState {
  std::uint32_t index = 0;
  std::string   name;
  std::string   source;

  double        initial_budget     = 0.0;
  double        budget_remaining   = 0.0;
  std::uint64_t impressions_seen   = 0;
  std::uint64_t impressions_won    = 0;
  double        total_spend        = 0.0;
  std::uint64_t conversions        = 0;
  std::uint64_t bids_placed        = 0;
  std::uint32_t consecutive_faults = 0;
  std::uint64_t total_faults       = 0;
  std::string   last_error;

  StrategyPhase phase = phase::Active{};

  bool IsActive() const {
    return std::holds_alternative<phase::Active>(phase);
  }

  bool IsExhausted() const {
    return std::holds_alternative<phase::BudgetExhausted>(phase);
  }

  bool IsDisqualified() const {
    return std::holds_alternative<phase::Disqualified>(phase);
  }
};

inline arena::core::v1::StrategyStatus ToStatus(const StrategyPhase& phase) {
  if (std::holds_alternative<phase::BudgetExhausted>(phase)) return arena::core::v1::STRATEGY_STATUS_BUDGET_EXHAUSTED;
  if (std::holds_alternative<phase::Disqualified>(phase)) return arena::core::v1::STRATEGY_STATUS_DISQUALIFIED;
  return arena::core::v1::STRATEGY_STATUS_ACTIVE;
}

inline arena::core::v1::StrategySnapshot ToSnapshot(const StrategyState& state) {
  arena::core::v1::StrategySnapshot out;
  out.set_name(state.name);
  out.set_index(state.index);
  out.set_status(ToStatus(state.phase));
  out.set_budget_remaining(state.budget_remaining);
  out.set_impressions_seen(state.impressions_seen);
  out.set_impressions_won(state.impressions_won);
  out.set_total_spend(state.total_spend);
  out.set_conversions(state.conversions);
  out.set_consecutive_faults(state.consecutive_faults);
  out.set_total_faults(state.total_faults);
  out.set_last_error(state.last_error);
  return out;
}

// What a strategy may see of itself when it is invoked.
inline arena::sandbox::v1::StateView ToStateView(const StrategyState& state) {
  arena::sandbox::v1::StateView view;
  view.set_budget_remaining(state.budget_remaining);
  view.set_impressions_seen(state.impressions_seen);
  view.set_impressions_won(state.impressions_won);
  view.set_total_spend(state.total_spend);
  view.set_conversions(state.conversions);
  view.set_consecutive_faults(state.consecutive_faults);
  return view;
}

} // namespace arena::model
