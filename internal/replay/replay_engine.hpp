#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arena/core/v1/types.pb.h"
#include "config/config.pb.h"
#include "internal/model/state_machine.hpp"
#include "internal/model/strategy.hpp"
#include "internal/replay/impression_source.hpp"
#include "internal/sandbox/executor.hpp"
#include "internal/validation/static_validator.hpp"

namespace arena::auction {
class AuctionModel;
}

namespace arena::replay {

class BidWorkerPool;

struct StrategySubmission {
  std::string           name;
  std::string           source;
  std::optional<double> starting_budget;
};

struct Rejection {
  std::string                       name;
  arena::core::v1::ValidationResult validation;
};

// Receives every Run Result in impression order. Throwing aborts the run.
using ResultSink = std::function<void(const arena::core::v1::RunResult&)>;

struct RunSummary {
  model::RunState state = model::RunState::kInitialized;
  std::string     abort_reason;
  std::uint64_t   results_emitted = 0;
};

/*
  Deterministic replay of registered strategies over an impression source.

      Register() / Attach()      Initialized
      Run()                      Running -> Completed | Aborted

  One coordinating thread (the caller of Run) walks impressions strictly in
  order. Bids for a single impression are collected concurrently on the bid
  worker pool and applied to strategy state in registration order, so the
  Run Result sequence does not depend on thread scheduling.

  Strategy failures are faults and never abort the run. Infrastructure
  failures (impression source, configuration, sink, worker spawn) and
  Cancel() end the run as Aborted; results emitted before that stay valid.
*/
class ReplayEngine {
 public:
  // `executor` overrides the one built from the run configuration.
  ReplayEngine(std::string run_id, arena::runtime::config::RunConfig config,
               std::unique_ptr<sandbox::Executor> executor = nullptr);
  ~ReplayEngine();

  ReplayEngine(const ReplayEngine&)            = delete;
  ReplayEngine& operator=(const ReplayEngine&) = delete;

  // Validates the source. Accepted strategies are registered in call order;
  // rejected ones are only recorded. Throws util::InvalidState once running
  // and util::AlreadyExists for a duplicate name.
  arena::core::v1::ValidationResult Register(const StrategySubmission& submission);

  void Attach(std::shared_ptr<ImpressionSource> source);

  // Blocks until the run completes or aborts. Callable once.
  RunSummary Run(const ResultSink& sink);

  // Thread-safe. Takes effect between impressions.
  void Cancel();

  model::RunState state() const;

  const std::string& run_id() const {
    return run_id_;
  }

  const std::vector<Rejection>& rejections() const {
    return rejections_;
  }

  std::vector<std::string> strategy_names() const;

  // Resolved configuration (defaults applied).
  const arena::runtime::config::RunConfig& config() const {
    return config_;
  }

 private:
  struct Slot {
    model::StrategyState      state;
    sandbox::InvocationOutcome outcome;
    bool                      invoked = false;
  };

  void Prepare();
  void Transition(model::RunState to);

  arena::core::v1::RunResult ProcessImpression(const arena::core::v1::ImpressionRecord& impression);
  void CollectBids(const arena::core::v1::ImpressionRecord& impression);
  void ApplyFault(Slot& slot, arena::core::v1::BidEntry& entry);
  void Disqualify(Slot& slot, const std::string& reason);

  std::string                        run_id_;
  arena::runtime::config::RunConfig  config_;
  std::unique_ptr<sandbox::Executor> executor_;
  validation::StaticValidator        validator_;

  std::shared_ptr<ImpressionSource>      source_;
  std::unique_ptr<auction::AuctionModel> auction_;
  std::unique_ptr<BidWorkerPool>         pool_;
  arena::core::v1::MarketSummary         market_;
  std::int64_t                           total_duration_ = 0;

  std::vector<Slot>      slots_;
  std::vector<Rejection> rejections_;

  mutable std::mutex mutex_;
  model::RunState    state_ = model::RunState::kInitialized;
  std::atomic<bool>  cancelled_{false};
};

} // namespace arena::replay
