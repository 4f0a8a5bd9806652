#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "arena/services/v1/arena_service.pb.h"
#include "internal/db/model/run_record.hpp"
#include "service_context.hpp"

namespace arena::replay {
class ReplayEngine;
}

namespace arena::scoreboard {
class Scoreboard;
}

namespace arena::service {

/*
  Run management behind arena.services.v1.ArenaService.

  Each started run replays on its own background thread. Every Run Result is
  committed to the repository before it is applied to the run's scoreboard
  and made visible to streaming readers.

  Errors are util exceptions (NotFound, AlreadyExists, InvalidState,
  InvalidArgument, ConfigError); the transport maps them to status codes.
*/
class ArenaService {
 public:
  explicit ArenaService(ServiceContext ctx);
  ~ArenaService();

  ArenaService(const ArenaService&)            = delete;
  ArenaService& operator=(const ArenaService&) = delete;

  arena::services::v1::ValidateStrategyResponse ValidateStrategy(const arena::services::v1::ValidateStrategyRequest& req);

  arena::services::v1::CreateRunResponse CreateRun(const arena::services::v1::CreateRunRequest& req);

  void StartRun(const arena::services::v1::StartRunRequest& req);

  void CancelRun(const arena::services::v1::CancelRunRequest& req);

  arena::services::v1::RunInfo GetRun(const arena::services::v1::GetRunRequest& req);

  arena::services::v1::ListRunResultsResponse ListRunResults(const arena::services::v1::ListRunResultsRequest& req);

  // Hands results to `write` from start_offset on, following a live run
  // until it finishes. Returns early when `write` returns false or
  // `cancelled` returns true.
  void StreamRunResults(const arena::services::v1::StreamRunResultsRequest&               req,
                        const std::function<bool(const arena::core::v1::RunResult&)>& write,
                        const std::function<bool()>&                                  cancelled);

  arena::core::v1::ScoreboardSnapshot GetScoreboard(const arena::services::v1::GetScoreboardRequest& req);

  // Blocks until the run is Completed or Aborted.
  arena::services::v1::RunInfo WaitForRun(const std::string& run_id);

  // Runs still held in memory. Finished runs are released on the next call
  // into the service.
  std::size_t LiveRunCount();

  static constexpr std::uint32_t kDefaultPageSize = 100;
  static constexpr std::uint32_t kMaxPageSize     = 1000;

 private:
  struct LiveRun {
    std::unique_ptr<arena::replay::ReplayEngine> engine;
    std::shared_ptr<arena::scoreboard::Scoreboard> scoreboard;
    std::thread                                  thread;

    std::mutex              mutex;
    std::condition_variable changed;
    bool                    started  = false;
    bool                    finished = false;
    std::uint64_t           results  = 0;
  };

  std::shared_ptr<LiveRun>      FindLive(const std::string& run_id);
  void                          ReapFinished();
  arena::db::model::RunRecord   LoadRecord(const std::string& run_id, const std::string& op);
  arena::services::v1::RunInfo  Describe(const std::string& run_id, const std::string& op);
  void                     Execute(const std::string& run_id, LiveRun& live);
  void                     AbortStaleRuns();

  ServiceContext ctx_;

  // Serializes repository transactions.
  std::mutex repo_mutex_;

  std::mutex                                                runs_mutex_;
  std::unordered_map<std::string, std::shared_ptr<LiveRun>> runs_;
};

} // namespace arena::service
