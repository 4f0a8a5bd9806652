#include "internal/scoreboard/scoreboard.hpp"

namespace arena::scoreboard {

namespace {

double Ratio(double numerator, double denominator) {
  return denominator > 0.0 ? numerator / denominator : 0.0;
}

} // namespace

Scoreboard::Scoreboard(std::uint32_t history_interval) : history_interval_(history_interval == 0 ? 1 : history_interval) {
}

void Scoreboard::RecordRejection(const std::string& name, const arena::core::v1::ValidationResult& validation) {
  std::lock_guard lock(mutex_);
  rejected_.push_back(RejectedEntry{name, validation.reason()});
}

void Scoreboard::Update(const arena::core::v1::RunResult& result) {
  std::lock_guard lock(mutex_);

  for (const auto& snapshot : result.strategies()) {
    if (snapshot.index() >= entries_.size()) {
      entries_.resize(snapshot.index() + 1);
    }
    entries_[snapshot.index()].last = snapshot;
  }

  for (const auto& bid : result.bids()) {
    if (bid.strategy_index() >= entries_.size()) continue;
    if (bid.disposition() != arena::core::v1::BID_DISPOSITION_BID &&
        bid.disposition() != arena::core::v1::BID_DISPOSITION_CLAMPED) {
      continue;
    }
    auto& entry = entries_[bid.strategy_index()];
    ++entry.bids_placed;
    entry.interval_bid_sum += bid.amount();
    ++entry.interval_bid_count;
  }

  const bool sample = results_applied_ % history_interval_ == 0;
  ++results_applied_;
  last_sequence_ = result.sequence();
  if (!sample) return;

  for (auto& entry : entries_) {
    arena::core::v1::HistoryPoint point;
    point.set_sequence(result.sequence());
    point.set_timestamp(result.timestamp());
    point.set_budget_remaining(entry.last.budget_remaining());
    point.set_impressions_won(entry.last.impressions_won());
    point.set_conversions(entry.last.conversions());
    point.set_total_spend(entry.last.total_spend());
    point.set_avg_bid_price(Ratio(entry.interval_bid_sum, static_cast<double>(entry.interval_bid_count)));
    entry.history.push_back(std::move(point));

    entry.interval_bid_sum   = 0.0;
    entry.interval_bid_count = 0;
  }
}

arena::core::v1::ScoreboardSnapshot Scoreboard::Snapshot() const {
  std::lock_guard lock(mutex_);

  arena::core::v1::ScoreboardSnapshot out;
  out.set_results_applied(results_applied_);
  out.set_last_sequence(last_sequence_);

  for (const auto& entry : entries_) {
    const auto& last    = entry.last;
    auto*       metrics = out.add_strategies();
    const auto  won     = static_cast<double>(last.impressions_won());

    metrics->set_name(last.name());
    metrics->set_status(last.status());
    metrics->set_impressions_seen(last.impressions_seen());
    metrics->set_impressions_won(last.impressions_won());
    metrics->set_win_rate(Ratio(won, static_cast<double>(last.impressions_seen())));
    metrics->set_total_spend(last.total_spend());
    metrics->set_spend_per_win(Ratio(last.total_spend(), won));
    metrics->set_budget_remaining(last.budget_remaining());
    metrics->set_bids_placed(entry.bids_placed);
    metrics->set_conversions(last.conversions());
    metrics->set_cpa(Ratio(last.total_spend(), static_cast<double>(last.conversions())));
    metrics->set_cpm(Ratio(last.total_spend() * 1000.0, won));
    metrics->set_faults(last.total_faults());
    metrics->set_last_error(last.last_error());
    for (const auto& point : entry.history) {
      *metrics->add_history() = point;
    }
  }

  for (const auto& rejected : rejected_) {
    auto* metrics = out.add_strategies();
    metrics->set_name(rejected.name);
    metrics->set_status(arena::core::v1::STRATEGY_STATUS_REJECTED);
    metrics->set_last_error(rejected.reason);
  }
  return out;
}

arena::core::v1::ScoreboardSnapshot Scoreboard::Rebuild(const std::vector<arena::core::v1::RunResult>& results,
                                                        std::uint32_t                                  history_interval) {
  Scoreboard board(history_interval);
  for (const auto& result : results) {
    board.Update(result);
  }
  return board.Snapshot();
}

} // namespace arena::scoreboard
