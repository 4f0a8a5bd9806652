#include "arena_service.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <type_traits>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/replay/impression_source.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/scoreboard/scoreboard.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/validation/static_validator.hpp"

namespace arena::service {

using namespace arena::services::v1;
using arena::core::v1::RunResult;
using observability::StringField;

namespace {

constexpr auto kStreamPollInterval = std::chrono::milliseconds(200);

void ThrowIfError(const arena::db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::InfrastructureError(prefix + ": " + arena::db::ToString(result.code) + " " + result.message);
  }
}

std::uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& run_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!run_id.empty()) {
    span.SetAttribute("run.id", run_id);
  }

  const auto started_at = util::SteadyClock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observability::Metrics::Instance().RecordRequest(route, true);
      observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::ElapsedMs(started_at));
      return;
    } else {
      auto result = fn();
      observability::Metrics::Instance().RecordRequest(route, true);
      observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::ElapsedMs(started_at));
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ARENA_LOG_WARN("RPC failed", {StringField("route", route), StringField("run_id", run_id), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::ElapsedMs(started_at));
    throw;
  }
}

// Resolves `path` inside `dir`, following symlinks, and refuses anything that
// lands outside it.
std::string ConfineToDirectory(const std::string& dir, const std::string& path) {
  namespace fs = std::filesystem;
  if (dir.empty()) return path;

  std::error_code ec;
  const fs::path  root = fs::weakly_canonical(fs::path(dir), ec);
  if (ec) {
    throw util::InfrastructureError("impressions directory " + dir + " is not usable: " + ec.message());
  }

  fs::path candidate(path);
  if (candidate.is_relative()) candidate = root / candidate;
  const fs::path resolved = fs::weakly_canonical(candidate, ec);
  if (ec) {
    throw util::InvalidArgument("create run: cannot resolve impressions_csv_path " + path + ": " + ec.message());
  }

  const fs::path inside = resolved.lexically_relative(root);
  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    throw util::InvalidArgument("create run: impressions_csv_path " + path + " is outside " + root.string());
  }
  return resolved.string();
}

std::shared_ptr<replay::ImpressionSource> BuildSource(const CreateRunRequest& req, const std::string& impressions_dir) {
  switch (req.impressions_case()) {
    case CreateRunRequest::kImpressionsCsvPath: {
      const std::string path = ConfineToDirectory(impressions_dir, req.impressions_csv_path());
      try {
        return std::make_shared<replay::CsvImpressionSource>(path);
      } catch (const util::InfrastructureError& e) {
        throw util::InvalidArgument(std::string("create run: ") + e.what());
      }
    }
    case CreateRunRequest::kInlineImpressions: {
      std::vector<arena::core::v1::ImpressionRecord> records(req.inline_impressions().records().begin(),
                                                             req.inline_impressions().records().end());
      return std::make_shared<replay::VectorImpressionSource>(std::move(records));
    }
    default:
      throw util::InvalidArgument("create run: set impressions_csv_path or inline_impressions");
  }
}

RunInfo ToRunInfo(const arena::db::model::RunRecord& record, std::uint64_t results_count) {
  RunInfo info;
  info.set_run_id(record.id);
  info.set_state(record.state);
  info.set_abort_reason(record.abort_reason);
  info.set_results_count(results_count);
  *info.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  if (record.finished_at_ms > 0) {
    *info.mutable_finished_at() = util::ToProto(util::FromUnixMillis(record.finished_at_ms));
  }
  for (const auto& name : record.roster.registered()) {
    info.add_strategies(name);
  }
  for (const auto& rejected : record.roster.rejected()) {
    *info.add_rejected() = rejected;
  }
  return info;
}

} // namespace

ArenaService::ArenaService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository) {
    throw util::InvalidArgument("arena service requires a repository");
  }
  AbortStaleRuns();
}

ArenaService::~ArenaService() {
  std::unordered_map<std::string, std::shared_ptr<LiveRun>> runs;
  {
    std::lock_guard lock(runs_mutex_);
    runs.swap(runs_);
  }
  for (auto& [_, live] : runs) {
    live->engine->Cancel();
  }
  for (auto& [_, live] : runs) {
    if (live->thread.joinable()) live->thread.join();
  }
}

// Runs left Initialized or Running by a previous process can never finish.
void ArenaService::AbortStaleRuns() {
  std::lock_guard lock(repo_mutex_);
  auto            tx = ctx_.repository->Begin();
  for (auto record : ctx_.repository->ListRuns(*tx)) {
    if (model::IsTerminal(model::FromProto(record.state))) continue;
    record.state          = arena::core::v1::RUN_STATE_ABORTED;
    record.abort_reason   = "server restarted";
    record.finished_at_ms = NowMs();
    ThrowIfError(ctx_.repository->UpdateRun(*tx, record), "abort stale run");
    ARENA_LOG_WARN("aborted stale run", {StringField("run_id", record.id)});
  }
  tx->Commit();
}

arena::db::model::RunRecord ArenaService::LoadRecord(const std::string& run_id, const std::string& op) {
  std::lock_guard lock(repo_mutex_);
  auto            tx     = ctx_.repository->Begin();
  auto            record = ctx_.repository->GetRun(*tx, run_id);
  if (!record) {
    throw util::NotFound(op + ": run " + run_id + " not found");
  }
  return *record;
}

// Finished runs leave the live table; the repository serves them from then on.
void ArenaService::ReapFinished() {
  std::vector<std::shared_ptr<LiveRun>> done;
  {
    std::lock_guard lock(runs_mutex_);
    for (auto it = runs_.begin(); it != runs_.end();) {
      bool finished = false;
      {
        std::lock_guard live_lock(it->second->mutex);
        finished = it->second->finished;
      }
      if (!finished) {
        ++it;
        continue;
      }
      done.push_back(std::move(it->second));
      it = runs_.erase(it);
    }
  }
  for (auto& live : done) {
    if (live->thread.joinable()) live->thread.join();
  }
}

std::size_t ArenaService::LiveRunCount() {
  ReapFinished();
  std::lock_guard lock(runs_mutex_);
  return runs_.size();
}

std::shared_ptr<ArenaService::LiveRun> ArenaService::FindLive(const std::string& run_id) {
  ReapFinished();
  std::lock_guard lock(runs_mutex_);
  auto            it = runs_.find(run_id);
  return it == runs_.end() ? nullptr : it->second;
}

ValidateStrategyResponse ArenaService::ValidateStrategy(const ValidateStrategyRequest& req) {
  return ObserveRpc("ArenaService.ValidateStrategy", "", [&] {
    validation::StaticValidator validator;
    ValidateStrategyResponse    resp;
    *resp.mutable_result() = validator.Validate(validation::StripCodeFences(req.source()));
    return resp;
  });
}

CreateRunResponse ArenaService::CreateRun(const CreateRunRequest& req) {
  return ObserveRpc("ArenaService.CreateRun", "", [&] {
    if (req.strategies().empty()) {
      throw util::InvalidArgument("create run: at least one strategy is required");
    }

    auto run_config = config::ConfigLoader::WithDefaults(config::ConfigLoader::Merge(ctx_.run_defaults, req.run_config()));
    config::ConfigLoader::ValidateRunConfig(run_config);

    ReapFinished();

    const std::string run_id = util::NewRunId();
    auto              live   = std::make_shared<LiveRun>();
    live->engine             = std::make_unique<replay::ReplayEngine>(run_id, run_config);
    live->engine->Attach(BuildSource(req, ctx_.impressions_dir));
    live->scoreboard = std::make_shared<scoreboard::Scoreboard>(run_config.history_interval());

    CreateRunResponse resp;
    resp.set_run_id(run_id);

    arena::db::model::RunRecord record;
    record.id            = run_id;
    record.state         = arena::core::v1::RUN_STATE_INITIALIZED;
    record.config        = live->engine->config();
    record.created_at_ms = NowMs();

    for (const auto& submission : req.strategies()) {
      replay::StrategySubmission strategy;
      strategy.name   = submission.name();
      strategy.source = submission.source();
      if (submission.has_starting_budget()) strategy.starting_budget = submission.starting_budget();

      auto  validation   = live->engine->Register(strategy);
      auto* registration = resp.add_registrations();
      registration->set_name(submission.name());
      *registration->mutable_validation() = validation;

      if (validation.accepted()) {
        record.roster.add_registered(submission.name());
      } else {
        auto* rejected = record.roster.add_rejected();
        rejected->set_name(submission.name());
        *rejected->mutable_validation() = validation;
        live->scoreboard->RecordRejection(submission.name(), validation);
      }
    }

    {
      std::lock_guard lock(repo_mutex_);
      auto            tx = ctx_.repository->Begin();
      ThrowIfError(ctx_.repository->InsertRun(*tx, record), "create run");
      tx->Commit();
    }
    {
      std::lock_guard lock(runs_mutex_);
      runs_[run_id] = live;
    }

    ARENA_LOG_INFO("run created", {StringField("run_id", run_id),
                                   observability::IntField("strategies", record.roster.registered_size()),
                                   observability::IntField("rejected", record.roster.rejected_size())});
    return resp;
  });
}

void ArenaService::StartRun(const StartRunRequest& req) {
  ObserveRpc("ArenaService.StartRun", req.run_id(), [&] {
    auto live = FindLive(req.run_id());
    if (!live) {
      LoadRecord(req.run_id(), "start run");
      throw util::InvalidState("start run: run " + req.run_id() + " has already finished");
    }
    {
      std::lock_guard lock(live->mutex);
      if (live->started) {
        throw util::InvalidState("start run: run " + req.run_id() + " was already started");
      }
      live->started = true;
    }

    {
      std::lock_guard lock(repo_mutex_);
      auto            tx     = ctx_.repository->Begin();
      auto            record = ctx_.repository->GetRun(*tx, req.run_id());
      if (!record) throw util::NotFound("start run: run " + req.run_id() + " not found");
      record->state = arena::core::v1::RUN_STATE_RUNNING;
      ThrowIfError(ctx_.repository->UpdateRun(*tx, *record), "start run");
      tx->Commit();
    }

    // A run must not read as finished before its thread is stored.
    std::lock_guard lock(live->mutex);
    live->thread = std::thread([this, run_id = req.run_id(), live] { Execute(run_id, *live); });
  });
}

void ArenaService::Execute(const std::string& run_id, LiveRun& live) {
  std::uint64_t offset = 0;

  auto sink = [&](const RunResult& result) {
    {
      std::lock_guard lock(repo_mutex_);
      auto            tx = ctx_.repository->Begin();
      ThrowIfError(ctx_.repository->AppendRunResult(*tx, run_id, offset, result), "append run result");
      tx->Commit();
    }
    ++offset;
    live.scoreboard->Update(result);

    std::lock_guard lock(live.mutex);
    live.results = offset;
    live.changed.notify_all();
  };

  replay::RunSummary summary;
  try {
    summary = live.engine->Run(sink);
  } catch (const std::exception& e) {
    summary.state        = model::RunState::kAborted;
    summary.abort_reason = e.what();
    ARENA_LOG_ERROR("run failed to start", {StringField("run_id", run_id), StringField("error", e.what())});
  }

  try {
    std::lock_guard lock(repo_mutex_);
    auto            tx     = ctx_.repository->Begin();
    auto            record = ctx_.repository->GetRun(*tx, run_id);
    if (!record) throw util::NotFound("run " + run_id);
    record->state          = model::ToProto(summary.state);
    record->abort_reason   = summary.abort_reason;
    record->finished_at_ms = NowMs();
    ThrowIfError(ctx_.repository->UpdateRun(*tx, *record), "finish run");
    tx->Commit();
  } catch (const std::exception& e) {
    ARENA_LOG_ERROR("failed to persist run outcome", {StringField("run_id", run_id), StringField("error", e.what())});
  }

  std::lock_guard lock(live.mutex);
  live.finished = true;
  live.changed.notify_all();
}

void ArenaService::CancelRun(const CancelRunRequest& req) {
  ObserveRpc("ArenaService.CancelRun", req.run_id(), [&] {
    auto live = FindLive(req.run_id());
    if (!live) {
      LoadRecord(req.run_id(), "cancel run");
      throw util::InvalidState("cancel run: run " + req.run_id() + " has already finished");
    }

    std::unique_lock live_lock(live->mutex);
    if (live->finished) {
      throw util::InvalidState("cancel run: run " + req.run_id() + " has already finished");
    }
    if (live->started) {
      live->engine->Cancel();
      ARENA_LOG_INFO("run cancellation requested", {StringField("run_id", req.run_id())});
      return;
    }

    // Never started: nothing to unwind, the run ends here. StartRun is
    // refused from this point on.
    live->started = true;
    live_lock.unlock();

    auto mark_finished = [&] {
      std::lock_guard lock(live->mutex);
      live->finished = true;
      live->changed.notify_all();
    };

    try {
      std::lock_guard lock(repo_mutex_);
      auto            tx     = ctx_.repository->Begin();
      auto            record = ctx_.repository->GetRun(*tx, req.run_id());
      if (!record) throw util::NotFound("cancel run: run " + req.run_id() + " not found");
      record->state          = arena::core::v1::RUN_STATE_ABORTED;
      record->abort_reason   = "cancelled";
      record->finished_at_ms = NowMs();
      ThrowIfError(ctx_.repository->UpdateRun(*tx, *record), "cancel run");
      tx->Commit();
    } catch (...) {
      mark_finished();
      throw;
    }

    mark_finished();
    ARENA_LOG_INFO("run cancelled before start", {StringField("run_id", req.run_id())});
  });
}

RunInfo ArenaService::GetRun(const GetRunRequest& req) {
  return ObserveRpc("ArenaService.GetRun", req.run_id(), [&] {
    return Describe(req.run_id(), "get run");
  });
}

ListRunResultsResponse ArenaService::ListRunResults(const ListRunResultsRequest& req) {
  return ObserveRpc("ArenaService.ListRunResults", req.run_id(), [&] {
    std::uint32_t page = req.max_results() == 0 ? kDefaultPageSize : std::min(req.max_results(), kMaxPageSize);

    std::lock_guard lock(repo_mutex_);
    auto            tx = ctx_.repository->Begin();
    if (!ctx_.repository->GetRun(*tx, req.run_id())) {
      throw util::NotFound("list run results: run " + req.run_id() + " not found");
    }

    ListRunResultsResponse resp;
    auto results = ctx_.repository->ReadRunResults(*tx, req.run_id(), req.start_offset(), page);
    resp.set_next_offset(req.start_offset() + results.size());
    for (auto& result : results) {
      *resp.add_results() = std::move(result);
    }
    return resp;
  });
}

void ArenaService::StreamRunResults(const StreamRunResultsRequest&                  req,
                                    const std::function<bool(const RunResult&)>& write,
                                    const std::function<bool()>&                 cancelled) {
  ObserveRpc("ArenaService.StreamRunResults", req.run_id(), [&] {
    auto          live   = FindLive(req.run_id());
    std::uint64_t offset = req.start_offset();

    if (!live) {
      LoadRecord(req.run_id(), "stream run results");
    }

    while (!cancelled()) {
      bool          finished  = true;
      std::uint64_t available = UINT64_MAX;
      if (live) {
        std::unique_lock lock(live->mutex);
        live->changed.wait_for(lock, kStreamPollInterval, [&] { return live->finished || live->results > offset; });
        finished  = live->finished;
        available = live->results;
      }

      std::vector<RunResult> batch;
      if (offset < available) {
        std::lock_guard lock(repo_mutex_);
        auto            tx    = ctx_.repository->Begin();
        const auto      limit = std::min<std::uint64_t>(kMaxPageSize, available - offset);
        batch                 = ctx_.repository->ReadRunResults(*tx, req.run_id(), offset, limit);
      }

      for (const auto& result : batch) {
        if (!write(result)) return;
        ++offset;
      }
      if (batch.empty() && finished) return;
    }
  });
}

arena::core::v1::ScoreboardSnapshot ArenaService::GetScoreboard(const GetScoreboardRequest& req) {
  return ObserveRpc("ArenaService.GetScoreboard", req.run_id(), [&] {
    if (auto live = FindLive(req.run_id())) {
      return live->scoreboard->Snapshot();
    }

    std::lock_guard lock(repo_mutex_);
    auto            tx     = ctx_.repository->Begin();
    auto            record = ctx_.repository->GetRun(*tx, req.run_id());
    if (!record) {
      throw util::NotFound("get scoreboard: run " + req.run_id() + " not found");
    }

    scoreboard::Scoreboard board(record->config.history_interval());
    for (const auto& result : ctx_.repository->ReadRunResults(*tx, req.run_id(), 0, std::nullopt)) {
      board.Update(result);
    }
    for (const auto& rejected : record->roster.rejected()) {
      board.RecordRejection(rejected.name(), rejected.validation());
    }
    return board.Snapshot();
  });
}

RunInfo ArenaService::WaitForRun(const std::string& run_id) {
  if (auto live = FindLive(run_id)) {
    std::unique_lock lock(live->mutex);
    live->changed.wait(lock, [&] { return live->finished; });
  }
  return Describe(run_id, "wait for run");
}

RunInfo ArenaService::Describe(const std::string& run_id, const std::string& op) {
  std::lock_guard lock(repo_mutex_);
  auto            tx     = ctx_.repository->Begin();
  auto            record = ctx_.repository->GetRun(*tx, run_id);
  if (!record) {
    throw util::NotFound(op + ": run " + run_id + " not found");
  }
  return ToRunInfo(*record, ctx_.repository->CountRunResults(*tx, run_id));
}

} // namespace arena::service
