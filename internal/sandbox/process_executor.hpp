#pragma once

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/sandbox/executor.hpp"

namespace arena::sandbox {

/*
  One forked worker per strategy, spoken to over a Unix socket pair.

  Workers are spawned lazily on the first invocation. A worker that misses
  its deadline is SIGKILLed and reaped; a worker that dies on its own is
  reaped. Either way the next invocation spawns a fresh one.
*/
class ProcessExecutor : public Executor {
 public:
  explicit ProcessExecutor(arena::sandbox::v1::Limits limits);
  ~ProcessExecutor() override;

  ProcessExecutor(const ProcessExecutor&)            = delete;
  ProcessExecutor& operator=(const ProcessExecutor&) = delete;

  void              Load(StrategyId id, const std::string& source) override;
  InvocationOutcome Invoke(StrategyId id, const arena::sandbox::v1::Invocation& invocation) override;
  void              Unload(StrategyId id) override;

 private:
  struct Worker {
    std::mutex    mutex;
    std::string   source;
    pid_t         pid     = -1;
    int           fd      = -1;
    std::uint64_t next_id = 1;
  };

  std::shared_ptr<Worker> Find(StrategyId id);

  // Returns a fault outcome when the worker could not be brought up for
  // strategy reasons; throws util::InfrastructureError when fork fails.
  std::optional<InvocationOutcome> EnsureRunning(StrategyId id, Worker& worker);

  struct Ending {
    bool        exited_on_its_own = false;
    std::string description;
  };

  // Closes the channel, kills the worker if it is still alive (immediately
  // when kill_first) and reaps it.
  Ending Stop(Worker& worker, bool kill_first);

  arena::sandbox::v1::Limits limits_;

  std::mutex                                              mutex_;
  std::unordered_map<StrategyId, std::shared_ptr<Worker>> workers_;
};

} // namespace arena::sandbox
