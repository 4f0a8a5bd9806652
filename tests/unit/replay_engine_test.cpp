#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/replay/impression_source.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using arena::core::v1::ImpressionRecord;
using arena::core::v1::RunResult;
using arena::model::RunState;
using arena::replay::ReplayEngine;
using arena::replay::StrategySubmission;
using arena::replay::VectorImpressionSource;
using arena::runtime::config::RunConfig;

RunConfig InProcessConfig(arena::core::v1::ClearingRule rule = arena::core::v1::CLEARING_RULE_SECOND_PRICE) {
  RunConfig config;
  config.set_clearing_rule(rule);
  config.set_isolation(arena::runtime::config::ISOLATION_MODE_IN_PROCESS);
  config.set_per_invocation_timeout_ms(200);
  config.set_bid_workers(4);
  return config;
}

ImpressionRecord Impression(std::uint64_t sequence, double floor, std::int64_t timestamp = 0) {
  ImpressionRecord record;
  record.set_sequence(sequence);
  record.set_timestamp(timestamp == 0 ? static_cast<std::int64_t>(1000 + sequence) : timestamp);
  record.set_floor_price(floor);
  return record;
}

std::string Constant(double amount) {
  return "fn bidding_strategy(ctx, state) { return " + std::to_string(amount) + "; }";
}

StrategySubmission Strategy(std::string name, std::string source, std::optional<double> budget = std::nullopt) {
  return StrategySubmission{std::move(name), std::move(source), budget};
}

struct Replay {
  arena::replay::RunSummary summary;
  std::vector<RunResult>    results;
};

Replay RunToEnd(ReplayEngine& engine, std::vector<ImpressionRecord> impressions) {
  engine.Attach(std::make_shared<VectorImpressionSource>(std::move(impressions)));
  Replay replay;
  replay.summary = engine.Run([&](const RunResult& result) { replay.results.push_back(result); });
  return replay;
}

void TestSecondPriceScenario() {
  ReplayEngine engine("second-price", InProcessConfig());
  assert(engine.Register(Strategy("A", Constant(2.0))).accepted());
  assert(engine.Register(Strategy("B", Constant(1.5))).accepted());

  auto replay = RunToEnd(engine, {Impression(0, 1.0)});
  assert(replay.summary.state == RunState::kCompleted);
  assert(engine.state() == RunState::kCompleted);
  assert(replay.results.size() == 1);

  const auto& result = replay.results[0];
  assert(result.outcome().has_winner());
  assert(result.outcome().winner() == "A");
  assert(result.outcome().clearing_price() == 1.5);
  assert(result.bids(0).won());
  assert(!result.bids(1).won());
  assert(result.bids(0).disposition() == arena::core::v1::BID_DISPOSITION_BID);
  assert(result.strategies(0).budget_remaining() == 1000.0 - 1.5);
  assert(result.strategies(1).budget_remaining() == 1000.0);
  assert(result.strategies(0).impressions_won() == 1);
  assert(result.strategies(1).impressions_seen() == 1);
}

void TestBelowFloorScenario() {
  ReplayEngine engine("below-floor", InProcessConfig());
  engine.Register(Strategy("A", Constant(0.5), 10.0));

  auto replay = RunToEnd(engine, {Impression(0, 1.0)});
  const auto& result = replay.results[0];
  assert(!result.outcome().has_winner());
  assert(result.strategies(0).budget_remaining() == 10.0);
  assert(result.strategies(0).total_spend() == 0.0);
}

void TestBudgetExhaustionScenario() {
  ReplayEngine engine("exhaustion", InProcessConfig(arena::core::v1::CLEARING_RULE_FIRST_PRICE));
  engine.Register(Strategy("A", Constant(3.0), 3.0));

  auto replay = RunToEnd(engine, {Impression(0, 1.0), Impression(1, 1.0), Impression(2, 1.0)});
  assert(replay.results.size() == 3);

  const auto& first = replay.results[0];
  assert(first.outcome().clearing_price() == 3.0);
  assert(first.strategies(0).budget_remaining() == 0.0);
  assert(first.strategies(0).status() == arena::core::v1::STRATEGY_STATUS_BUDGET_EXHAUSTED);

  for (std::size_t i = 1; i < replay.results.size(); ++i) {
    const auto& later = replay.results[i];
    assert(later.bids(0).disposition() == arena::core::v1::BID_DISPOSITION_SKIPPED_EXHAUSTED);
    assert(!later.outcome().has_winner());
    assert(later.strategies(0).impressions_seen() == i + 1);
  }
}

void TestOverBudgetBidIsClamped() {
  ReplayEngine engine("clamped", InProcessConfig());
  engine.Register(Strategy("A", Constant(5.0), 2.0));
  engine.Register(Strategy("B", Constant(1.2)));

  auto replay = RunToEnd(engine, {Impression(0, 1.0)});
  const auto& result = replay.results[0];
  assert(result.bids(0).disposition() == arena::core::v1::BID_DISPOSITION_CLAMPED);
  assert(result.bids(0).amount() == 5.0);
  assert(result.outcome().winner() == "B");
  assert(result.outcome().clearing_price() == 1.0);
  assert(result.strategies(0).budget_remaining() == 2.0);
}

void TestRepeatedFaultsDisqualify() {
  auto config = InProcessConfig();
  config.set_disqualify_after_n_faults(3);

  ReplayEngine engine("faults", config);
  engine.Register(Strategy("broken", "fn bidding_strategy(ctx, state) { return [][1]; }"));
  engine.Register(Strategy("steady", Constant(1.0)));

  std::vector<ImpressionRecord> impressions;
  for (std::uint64_t i = 0; i < 5; ++i) impressions.push_back(Impression(i, 0.5));

  auto replay = RunToEnd(engine, impressions);
  assert(replay.summary.state == RunState::kCompleted);
  assert(replay.results.size() == 5);

  for (int i = 0; i < 3; ++i) {
    const auto& bid = replay.results[i].bids(0);
    assert(bid.disposition() == arena::core::v1::BID_DISPOSITION_FAULT);
    assert(bid.fault_kind() == arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION);
  }
  assert(replay.results[2].strategies(0).status() == arena::core::v1::STRATEGY_STATUS_DISQUALIFIED);

  for (int i = 3; i < 5; ++i) {
    assert(replay.results[i].bids(0).disposition() == arena::core::v1::BID_DISPOSITION_SKIPPED_DISQUALIFIED);
    // The healthy strategy keeps winning.
    assert(replay.results[i].outcome().winner() == "steady");
  }

  const auto& last = replay.results.back().strategies(0);
  assert(last.total_faults() == 3);
  assert(last.consecutive_faults() == 3);
  assert(last.impressions_seen() == 3);
  assert(last.last_error().rfind("RuntimeException: ", 0) == 0);
}

void TestSuccessResetsConsecutiveFaults() {
  auto config = InProcessConfig();
  config.set_disqualify_after_n_faults(2);

  // Faults on odd sequences only, so it never reaches two in a row.
  ReplayEngine engine("flaky", config);
  engine.Register(Strategy("flaky", "fn bidding_strategy(ctx, state) { if (ctx.sequence % 2 == 1) { return 1 / 0; } return 1; }"));

  std::vector<ImpressionRecord> impressions;
  for (std::uint64_t i = 0; i < 6; ++i) impressions.push_back(Impression(i, 0.5));

  auto replay = RunToEnd(engine, impressions);
  const auto& last = replay.results.back().strategies(0);
  assert(last.status() == arena::core::v1::STRATEGY_STATUS_ACTIVE);
  assert(last.total_faults() == 3);
  assert(last.consecutive_faults() == 1);
}

void TestHindsightIsHiddenAndTimeIsExposed() {
  ReplayEngine engine("context", InProcessConfig());
  engine.Register(Strategy("timer", "fn bidding_strategy(ctx, state) { return ctx.remaining_time; }"));

  auto first = Impression(0, 0.0, 100);
  first.set_market_price(50.0);
  first.set_is_conversion(true);
  auto second = Impression(1, 0.0, 110);

  auto replay = RunToEnd(engine, {first, second});
  assert(replay.results[0].bids(0).amount() == 10.0);
  assert(replay.results[1].bids(0).amount() == 0.0);
  // The market outbid the strategy, so no conversion is credited.
  assert(replay.results[0].outcome().market_won());
  assert(replay.results[0].strategies(0).conversions() == 0);
}

void TestRunsAreDeterministic() {
  std::mt19937                           rng(7);
  std::uniform_real_distribution<double> price(0.1, 3.0);
  std::bernoulli_distribution            converts(0.2);

  std::vector<ImpressionRecord> impressions;
  for (std::uint64_t i = 0; i < 200; ++i) {
    auto record = Impression(i, price(rng));
    if (i % 3 == 0) record.set_market_price(price(rng));
    record.set_is_conversion(converts(rng));
    (*record.mutable_features())["ctr"].set_number(price(rng) / 10.0);
    impressions.push_back(record);
  }

  const std::vector<StrategySubmission> strategies = {
      Strategy("pacer", R"(
        fn bidding_strategy(ctx, state) {
          let share = state.budget_remaining / ctx.initial_budget;
          return ctx.floor_price * (1 + share) + ctx.features.ctr;
        }
      )", 40.0),
      Strategy("percentile", "fn bidding_strategy(ctx, state) { return max(ctx.floor_price, ctx.percentiles[50]); }", 60.0),
      Strategy("flaky", "fn bidding_strategy(ctx, state) { if (ctx.sequence % 17 == 0) { return \"x\"; } return 1.1; }"),
  };

  auto run_once = [&](arena::runtime::config::IsolationMode isolation) {
    auto config = InProcessConfig();
    config.set_isolation(isolation);
    ReplayEngine engine("determinism", config);
    for (const auto& strategy : strategies) engine.Register(strategy);
    auto replay = RunToEnd(engine, impressions);
    assert(replay.summary.state == RunState::kCompleted);

    std::vector<std::string> encoded;
    for (const auto& result : replay.results) encoded.push_back(arena::db::SerializeRunResult(result));
    return std::make_pair(replay.results, encoded);
  };

  const auto [results, first]   = run_once(arena::runtime::config::ISOLATION_MODE_IN_PROCESS);
  const auto [unused, second]   = run_once(arena::runtime::config::ISOLATION_MODE_IN_PROCESS);
  const auto [unused2, process] = run_once(arena::runtime::config::ISOLATION_MODE_PROCESS);
  assert(first == second);
  assert(first == process);

  // Budgets never go up and never go negative.
  std::vector<double> previous = {40.0, 60.0, 1000.0};
  for (const auto& result : results) {
    for (const auto& snapshot : result.strategies()) {
      assert(snapshot.budget_remaining() >= 0.0);
      assert(snapshot.budget_remaining() <= previous[snapshot.index()]);
      previous[snapshot.index()] = snapshot.budget_remaining();
    }
    if (result.outcome().has_winner()) {
      assert(result.outcome().clearing_price() >= result.floor_price());
      assert(result.outcome().clearing_price() <= result.bids(static_cast<int>(result.outcome().winner_index())).amount());
    }
  }
}

void TestCancelAbortsBetweenImpressions() {
  ReplayEngine engine("cancel", InProcessConfig());
  engine.Register(Strategy("A", Constant(1.0)));

  std::vector<ImpressionRecord> impressions;
  for (std::uint64_t i = 0; i < 10; ++i) impressions.push_back(Impression(i, 0.5));
  engine.Attach(std::make_shared<VectorImpressionSource>(impressions));

  std::vector<RunResult> results;
  auto summary = engine.Run([&](const RunResult& result) {
    results.push_back(result);
    if (results.size() == 2) engine.Cancel();
  });

  assert(summary.state == RunState::kAborted);
  assert(summary.abort_reason == "cancelled");
  assert(summary.results_emitted == 2);
  assert(results.size() == 2);
}

class FailingSource : public arena::replay::ImpressionSource {
 public:
  std::optional<ImpressionRecord> Next() override {
    if (position_ == 2) throw arena::util::InfrastructureError("impression feed lost");
    return Impression(position_++, 0.5);
  }

  void Rewind() override {
    position_ = 0;
  }

 private:
  std::uint64_t position_ = 0;
};

void TestSourceFailureAbortsAndKeepsPartialResults() {
  auto config = InProcessConfig();
  config.set_compute_market_summary(false);

  ReplayEngine engine("source-failure", config);
  engine.Register(Strategy("A", Constant(1.0)));
  engine.Attach(std::make_shared<FailingSource>());

  std::vector<RunResult> results;
  auto summary = engine.Run([&](const RunResult& result) { results.push_back(result); });
  assert(summary.state == RunState::kAborted);
  assert(summary.abort_reason.find("impression feed lost") != std::string::npos);
  assert(results.size() == 2);
}

void TestRegistrationRules() {
  ReplayEngine engine("registration", InProcessConfig());

  auto rejected = engine.Register(Strategy("evil", "fn bidding_strategy(ctx, state) { return system(\"rm\"); }"));
  assert(!rejected.accepted());
  assert(engine.rejections().size() == 1);
  assert(engine.strategy_names().empty());

  auto fenced = engine.Register(Strategy("fenced", "```\n" + Constant(1.0) + "\n```"));
  assert(fenced.accepted());

  bool duplicate = false;
  try {
    engine.Register(Strategy("fenced", Constant(2.0)));
  } catch (const arena::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  bool bad_budget = false;
  try {
    engine.Register(Strategy("negative", Constant(1.0), -5.0));
  } catch (const arena::util::InvalidArgument&) {
    bad_budget = true;
  }
  assert(bad_budget);

  auto replay = RunToEnd(engine, {Impression(0, 0.5)});
  assert(replay.results[0].bids_size() == 1);
  assert(replay.results[0].bids(0).strategy() == "fenced");

  bool late = false;
  try {
    engine.Register(Strategy("late", Constant(1.0)));
  } catch (const arena::util::InvalidState&) {
    late = true;
  }
  assert(late);
}

void TestRunWithoutSourceIsRejected() {
  ReplayEngine engine("no-source", InProcessConfig());
  bool         threw = false;
  try {
    engine.Run([](const RunResult&) {});
  } catch (const arena::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(engine.state() == RunState::kInitialized);
}

} // namespace

int main() {
  TestSecondPriceScenario();
  TestBelowFloorScenario();
  TestBudgetExhaustionScenario();
  TestOverBudgetBidIsClamped();
  TestRepeatedFaultsDisqualify();
  TestSuccessResetsConsecutiveFaults();
  TestHindsightIsHiddenAndTimeIsExposed();
  TestRunsAreDeterministic();
  TestCancelAbortsBetweenImpressions();
  TestSourceFailureAbortsAndKeepsPartialResults();
  TestRegistrationRules();
  TestRunWithoutSourceIsRejected();

  std::cout << "arena_unit_replay_engine: pass\n";
  return 0;
}
