#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "arena/core/v1/types.pb.h"

namespace arena::scoreboard {

/*
  Per-strategy metrics accumulated from Run Results.

  Update() is pure accumulation over complete Run Results, so feeding a stored
  result sequence into a fresh Scoreboard reproduces the live one exactly.
  All methods are thread-safe; Snapshot() may be polled while a run applies
  results.

      win_rate       won / seen
      spend_per_win  spend / won
      cpm            spend * 1000 / won
      cpa            spend / conversions

  A history point is taken at the first result and then every
  history_interval results.
*/
class Scoreboard {
 public:
  explicit Scoreboard(std::uint32_t history_interval);

  void RecordRejection(const std::string& name, const arena::core::v1::ValidationResult& validation);

  void Update(const arena::core::v1::RunResult& result);

  arena::core::v1::ScoreboardSnapshot Snapshot() const;

  static arena::core::v1::ScoreboardSnapshot Rebuild(const std::vector<arena::core::v1::RunResult>& results,
                                                     std::uint32_t                                  history_interval);

 private:
  struct Entry {
    arena::core::v1::StrategySnapshot      last;
    std::uint64_t                          bids_placed = 0;
    double                                 interval_bid_sum   = 0.0;
    std::uint64_t                          interval_bid_count = 0;
    std::vector<arena::core::v1::HistoryPoint> history;
  };

  struct RejectedEntry {
    std::string name;
    std::string reason;
  };

  std::uint32_t history_interval_;

  mutable std::mutex         mutex_;
  std::vector<Entry>         entries_;
  std::vector<RejectedEntry> rejected_;
  std::uint64_t              results_applied_ = 0;
  std::uint64_t              last_sequence_   = 0;
};

} // namespace arena::scoreboard
