#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/scoreboard/scoreboard.hpp"

namespace {

using arena::core::v1::BidDisposition;
using arena::core::v1::RunResult;
using arena::scoreboard::Scoreboard;

struct Step {
  double         bid;
  BidDisposition disposition;
  bool           won;
  double         price;
  bool           converted;
};

// One strategy "solo" with a starting budget of 10.
std::vector<RunResult> BuildResults(const std::vector<Step>& steps) {
  std::vector<RunResult> results;
  double                 budget = 10.0;
  std::uint64_t          won = 0, conversions = 0;
  double                 spend = 0.0;

  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& step = steps[i];
    RunResult   result;
    result.set_sequence(i);
    result.set_timestamp(static_cast<std::int64_t>(100 + i));
    result.set_floor_price(0.5);

    auto* bid = result.add_bids();
    bid->set_strategy("solo");
    bid->set_strategy_index(0);
    bid->set_disposition(step.disposition);
    bid->set_amount(step.bid);
    bid->set_won(step.won);

    if (step.won) {
      ++won;
      spend += step.price;
      budget -= step.price;
      if (step.converted) ++conversions;
      result.mutable_outcome()->set_has_winner(true);
      result.mutable_outcome()->set_winner("solo");
      result.mutable_outcome()->set_clearing_price(step.price);
    }

    auto* snapshot = result.add_strategies();
    snapshot->set_name("solo");
    snapshot->set_index(0);
    snapshot->set_status(arena::core::v1::STRATEGY_STATUS_ACTIVE);
    snapshot->set_budget_remaining(budget);
    snapshot->set_impressions_seen(i + 1);
    snapshot->set_impressions_won(won);
    snapshot->set_total_spend(spend);
    snapshot->set_conversions(conversions);
    results.push_back(result);
  }
  return results;
}

const std::vector<Step> kSteps = {
    {2.0, arena::core::v1::BID_DISPOSITION_BID, true, 1.0, true},
    {0.0, arena::core::v1::BID_DISPOSITION_NO_BID, false, 0.0, false},
    {4.0, arena::core::v1::BID_DISPOSITION_BID, true, 3.0, false},
    {50.0, arena::core::v1::BID_DISPOSITION_CLAMPED, false, 0.0, false},
};

void TestDerivedMetrics() {
  Scoreboard board(1);
  for (const auto& result : BuildResults(kSteps)) {
    board.Update(result);
  }

  const auto snapshot = board.Snapshot();
  assert(snapshot.results_applied() == 4);
  assert(snapshot.last_sequence() == 3);
  assert(snapshot.strategies_size() == 1);

  const auto& solo = snapshot.strategies(0);
  assert(solo.name() == "solo");
  assert(solo.impressions_seen() == 4);
  assert(solo.impressions_won() == 2);
  assert(solo.win_rate() == 0.5);
  assert(solo.total_spend() == 4.0);
  assert(solo.spend_per_win() == 2.0);
  assert(solo.cpm() == 2000.0);
  assert(solo.conversions() == 1);
  assert(solo.cpa() == 4.0);
  assert(solo.bids_placed() == 3);
  assert(solo.budget_remaining() == 6.0);
}

void TestHistoryIsDownsampled() {
  Scoreboard board(2);
  for (const auto& result : BuildResults(kSteps)) {
    board.Update(result);
  }

  const auto& solo = board.Snapshot().strategies(0);
  // Sampled at the first result and every second one after.
  assert(solo.history_size() == 2);
  assert(solo.history(0).sequence() == 0);
  assert(solo.history(0).avg_bid_price() == 2.0);
  assert(solo.history(1).sequence() == 2);
  // Bids since the previous sample: the no-bid is skipped.
  assert(solo.history(1).avg_bid_price() == 4.0);
  assert(solo.history(1).total_spend() == 4.0);
}

void TestEmptyBoardHasZeroRatios() {
  Scoreboard board(5);
  auto       results = BuildResults({{0.0, arena::core::v1::BID_DISPOSITION_NO_BID, false, 0.0, false}});
  board.Update(results[0]);

  const auto& solo = board.Snapshot().strategies(0);
  assert(solo.win_rate() == 0.0);
  assert(solo.spend_per_win() == 0.0);
  assert(solo.cpm() == 0.0);
  assert(solo.cpa() == 0.0);
}

void TestRejectedStrategiesAreListed() {
  Scoreboard                        board(1);
  arena::core::v1::ValidationResult validation;
  validation.set_accepted(false);
  validation.set_error_kind(arena::core::v1::VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT);
  validation.set_detail("open");
  validation.set_reason("ForbiddenConstruct: open");
  board.RecordRejection("sneaky", validation);

  for (const auto& result : BuildResults(kSteps)) {
    board.Update(result);
  }

  const auto snapshot = board.Snapshot();
  assert(snapshot.strategies_size() == 2);
  assert(snapshot.strategies(1).name() == "sneaky");
  assert(snapshot.strategies(1).status() == arena::core::v1::STRATEGY_STATUS_REJECTED);
  assert(snapshot.strategies(1).last_error() == "ForbiddenConstruct: open");
}

void TestRebuildMatchesLiveBoard() {
  const auto results = BuildResults(kSteps);

  Scoreboard live(3);
  for (const auto& result : results) {
    live.Update(result);
  }

  const auto rebuilt = Scoreboard::Rebuild(results, 3);
  assert(google::protobuf::util::MessageDifferencer::Equals(live.Snapshot(), rebuilt));
}

void TestSnapshotWhileUpdating() {
  Scoreboard board(1);
  const auto results = BuildResults(kSteps);

  std::thread writer([&] {
    for (int round = 0; round < 200; ++round) {
      for (const auto& result : results) board.Update(result);
    }
  });
  for (int i = 0; i < 200; ++i) {
    const auto snapshot = board.Snapshot();
    assert(snapshot.strategies_size() <= 1);
  }
  writer.join();
  assert(board.Snapshot().results_applied() == 800);
}

} // namespace

int main() {
  TestDerivedMetrics();
  TestHistoryIsDownsampled();
  TestEmptyBoardHasZeroRatios();
  TestRejectedStrategiesAreListed();
  TestRebuildMatchesLiveBoard();
  TestSnapshotWhileUpdating();

  std::cout << "arena_unit_scoreboard: pass\n";
  return 0;
}
