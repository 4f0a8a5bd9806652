#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/arena_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using arena::core::v1::RunResult;
using arena::service::ArenaService;
using namespace arena::services::v1;

arena::service::ServiceContext BuildServiceContext(std::shared_ptr<arena::db::Repository> repository = nullptr) {
  arena::service::ServiceContext ctx;
  ctx.repository = repository ? repository : std::make_shared<arena::db::memory::MemoryRepository>();

  arena::runtime::config::RunConfig run;
  run.set_isolation(arena::runtime::config::ISOLATION_MODE_IN_PROCESS);
  run.set_history_interval(1);
  ctx.run_defaults = arena::config::ConfigLoader::WithDefaults(run);
  return ctx;
}

std::string Constant(double amount) {
  return "fn bidding_strategy(ctx, state) { return " + std::to_string(amount) + "; }";
}

CreateRunRequest BuildRequest(std::size_t impressions) {
  CreateRunRequest req;
  auto*            a = req.add_strategies();
  a->set_name("A");
  a->set_source(Constant(2.0));
  auto* b = req.add_strategies();
  b->set_name("B");
  b->set_source(Constant(1.5));
  b->set_starting_budget(50.0);
  auto* bad = req.add_strategies();
  bad->set_name("bad");
  bad->set_source("fn bidding_strategy(ctx, state) { let f = open(\"x\"); return 1; }");

  for (std::size_t i = 0; i < impressions; ++i) {
    auto* record = req.mutable_inline_impressions()->add_records();
    record->set_sequence(i);
    record->set_timestamp(static_cast<std::int64_t>(1000 + i));
    record->set_floor_price(1.0);
    record->set_is_conversion(i % 2 == 0);
  }
  return req;
}

template <typename E, typename Fn>
bool ThrowsAs(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

std::string CreateAndRun(ArenaService& service, std::size_t impressions) {
  const auto created = service.CreateRun(BuildRequest(impressions));
  StartRunRequest start;
  start.set_run_id(created.run_id());
  service.StartRun(start);
  const auto info = service.WaitForRun(created.run_id());
  assert(info.state() == arena::core::v1::RUN_STATE_COMPLETED);
  return created.run_id();
}

void TestValidateStrategy() {
  ArenaService service(BuildServiceContext());

  ValidateStrategyRequest req;
  req.set_source("```\n" + Constant(1.0) + "\n```");
  assert(service.ValidateStrategy(req).result().accepted());

  req.set_source("fn helper(x) { return x; }");
  const auto resp = service.ValidateStrategy(req);
  assert(!resp.result().accepted());
  assert(resp.result().error_kind() == arena::core::v1::VALIDATION_ERROR_KIND_MISSING_ENTRY_POINT);
}

void TestCreateRunReportsRegistrations() {
  ArenaService service(BuildServiceContext());
  const auto   created = service.CreateRun(BuildRequest(3));
  assert(!created.run_id().empty());
  assert(created.registrations_size() == 3);
  assert(created.registrations(0).name() == "A");
  assert(created.registrations(0).validation().accepted());
  assert(created.registrations(1).validation().accepted());
  assert(!created.registrations(2).validation().accepted());
  assert(created.registrations(2).validation().error_kind() == arena::core::v1::VALIDATION_ERROR_KIND_FORBIDDEN_CONSTRUCT);

  GetRunRequest get;
  get.set_run_id(created.run_id());
  const auto info = service.GetRun(get);
  assert(info.state() == arena::core::v1::RUN_STATE_INITIALIZED);
  assert(info.strategies_size() == 2);
  assert(info.rejected_size() == 1);
  assert(info.rejected(0).name() == "bad");
  assert(info.results_count() == 0);
  assert(!info.has_finished_at());
}

void TestCreateRunRejectsBadRequests() {
  ArenaService service(BuildServiceContext());

  CreateRunRequest empty = BuildRequest(1);
  empty.clear_strategies();
  assert(ThrowsAs<arena::util::InvalidArgument>([&] { service.CreateRun(empty); }));

  CreateRunRequest no_source = BuildRequest(1);
  no_source.clear_impressions();
  assert(ThrowsAs<arena::util::InvalidArgument>([&] { service.CreateRun(no_source); }));

  CreateRunRequest missing_csv = BuildRequest(1);
  missing_csv.set_impressions_csv_path("/nonexistent/impressions.csv");
  assert(ThrowsAs<arena::util::InvalidArgument>([&] { service.CreateRun(missing_csv); }));

  CreateRunRequest bad_rule = BuildRequest(1);
  bad_rule.mutable_run_config()->set_clearing_rule(static_cast<arena::core::v1::ClearingRule>(7));
  assert(ThrowsAs<arena::util::ConfigError>([&] { service.CreateRun(bad_rule); }));
}

void TestRunCompletesAndPersistsResults() {
  ArenaService service(BuildServiceContext());
  const auto   run_id = CreateAndRun(service, 5);

  GetRunRequest get;
  get.set_run_id(run_id);
  const auto info = service.GetRun(get);
  assert(info.results_count() == 5);
  assert(info.has_finished_at());

  ListRunResultsRequest list;
  list.set_run_id(run_id);
  list.set_max_results(2);
  auto page = service.ListRunResults(list);
  assert(page.results_size() == 2);
  assert(page.next_offset() == 2);
  assert(page.results(0).sequence() == 0);
  assert(page.results(1).sequence() == 1);
  assert(page.results(0).outcome().winner() == "A");
  assert(page.results(0).outcome().clearing_price() == 1.5);

  list.set_start_offset(page.next_offset());
  list.set_max_results(0);
  page = service.ListRunResults(list);
  assert(page.results_size() == 3);
  assert(page.next_offset() == 5);
  assert(page.results(2).sequence() == 4);

  list.set_start_offset(10);
  page = service.ListRunResults(list);
  assert(page.results_size() == 0);
  assert(page.next_offset() == 10);
}

void TestStreamRunResults() {
  ArenaService service(BuildServiceContext());
  const auto   run_id = CreateAndRun(service, 4);

  StreamRunResultsRequest req;
  req.set_run_id(run_id);
  req.set_start_offset(1);
  std::vector<RunResult> streamed;
  service.StreamRunResults(
      req, [&](const RunResult& result) {
        streamed.push_back(result);
        return true;
      },
      [] { return false; });
  assert(streamed.size() == 3);
  assert(streamed.front().sequence() == 1);
  assert(streamed.back().sequence() == 3);

  // A writer that hangs up ends the stream.
  streamed.clear();
  req.set_start_offset(0);
  service.StreamRunResults(
      req, [&](const RunResult& result) {
        streamed.push_back(result);
        return false;
      },
      [] { return false; });
  assert(streamed.size() == 1);
}

void TestStreamFollowsLiveRun() {
  ArenaService service(BuildServiceContext());
  const auto   created = service.CreateRun(BuildRequest(20));

  StartRunRequest start;
  start.set_run_id(created.run_id());
  service.StartRun(start);

  StreamRunResultsRequest req;
  req.set_run_id(created.run_id());
  std::uint64_t expected = 0;
  service.StreamRunResults(
      req, [&](const RunResult& result) {
        assert(result.sequence() == expected);
        ++expected;
        return true;
      },
      [] { return false; });
  assert(expected == 20);
}

void TestScoreboardLiveAndRebuilt() {
  auto repository = std::make_shared<arena::db::memory::MemoryRepository>();

  std::string                         run_id;
  arena::core::v1::ScoreboardSnapshot live;
  {
    ArenaService service(BuildServiceContext(repository));
    run_id = CreateAndRun(service, 6);

    GetScoreboardRequest req;
    req.set_run_id(run_id);
    live = service.GetScoreboard(req);
  }
  assert(live.results_applied() == 6);
  assert(live.last_sequence() == 5);
  assert(live.strategies_size() == 3);

  ArenaService         restarted(BuildServiceContext(repository));
  GetScoreboardRequest req;
  req.set_run_id(run_id);
  const auto rebuilt = restarted.GetScoreboard(req);
  assert(rebuilt.results_applied() == live.results_applied());
  assert(rebuilt.strategies_size() == live.strategies_size());

  for (const auto& metrics : rebuilt.strategies()) {
    if (metrics.name() == "A") {
      assert(metrics.impressions_won() == 6);
      assert(metrics.win_rate() == 1.0);
      assert(metrics.total_spend() == 9.0);
      assert(metrics.conversions() == 3);
    } else if (metrics.name() == "B") {
      assert(metrics.impressions_won() == 0);
      assert(metrics.budget_remaining() == 50.0);
    } else {
      assert(metrics.name() == "bad");
      assert(metrics.status() == arena::core::v1::STRATEGY_STATUS_REJECTED);
    }
  }

  GetRunRequest get;
  get.set_run_id(run_id);
  assert(restarted.GetRun(get).state() == arena::core::v1::RUN_STATE_COMPLETED);
}

void TestCancelBeforeStart() {
  ArenaService service(BuildServiceContext());
  const auto   created = service.CreateRun(BuildRequest(3));

  CancelRunRequest cancel;
  cancel.set_run_id(created.run_id());
  service.CancelRun(cancel);

  const auto info = service.WaitForRun(created.run_id());
  assert(info.state() == arena::core::v1::RUN_STATE_ABORTED);
  assert(info.abort_reason() == "cancelled");
  assert(info.results_count() == 0);

  StartRunRequest start;
  start.set_run_id(created.run_id());
  assert(ThrowsAs<arena::util::InvalidState>([&] { service.StartRun(start); }));
  assert(ThrowsAs<arena::util::InvalidState>([&] { service.CancelRun(cancel); }));
}

void TestLifecycleErrors() {
  ArenaService service(BuildServiceContext());
  const auto   run_id = CreateAndRun(service, 2);

  StartRunRequest start;
  start.set_run_id(run_id);
  assert(ThrowsAs<arena::util::InvalidState>([&] { service.StartRun(start); }));

  CancelRunRequest cancel;
  cancel.set_run_id(run_id);
  assert(ThrowsAs<arena::util::InvalidState>([&] { service.CancelRun(cancel); }));

  GetRunRequest get;
  get.set_run_id("missing");
  assert(ThrowsAs<arena::util::NotFound>([&] { service.GetRun(get); }));

  start.set_run_id("missing");
  assert(ThrowsAs<arena::util::NotFound>([&] { service.StartRun(start); }));

  ListRunResultsRequest list;
  list.set_run_id("missing");
  assert(ThrowsAs<arena::util::NotFound>([&] { service.ListRunResults(list); }));

  GetScoreboardRequest board;
  board.set_run_id("missing");
  assert(ThrowsAs<arena::util::NotFound>([&] { service.GetScoreboard(board); }));

  StreamRunResultsRequest stream;
  stream.set_run_id("missing");
  assert(ThrowsAs<arena::util::NotFound>([&] {
    service.StreamRunResults(stream, [](const RunResult&) { return true; }, [] { return false; });
  }));
}

void TestFinishedRunsLeaveMemory() {
  ArenaService             service(BuildServiceContext());
  std::vector<std::string> finished;
  for (int i = 0; i < 3; ++i) {
    finished.push_back(CreateAndRun(service, 2));
  }
  assert(service.LiveRunCount() == 0);

  const auto pending = service.CreateRun(BuildRequest(2)).run_id();
  assert(service.LiveRunCount() == 1);
  CancelRunRequest cancel;
  cancel.set_run_id(pending);
  service.CancelRun(cancel);
  assert(service.LiveRunCount() == 0);

  // Released runs are still served from the repository.
  for (const auto& run_id : finished) {
    GetScoreboardRequest board;
    board.set_run_id(run_id);
    const auto snapshot = service.GetScoreboard(board);
    assert(snapshot.results_applied() == 2);
    assert(snapshot.strategies_size() == 3);

    StreamRunResultsRequest stream;
    stream.set_run_id(run_id);
    std::size_t streamed = 0;
    service.StreamRunResults(
        stream, [&](const RunResult&) {
          ++streamed;
          return true;
        },
        [] { return false; });
    assert(streamed == 2);

    assert(service.WaitForRun(run_id).state() == arena::core::v1::RUN_STATE_COMPLETED);

    StartRunRequest start;
    start.set_run_id(run_id);
    assert(ThrowsAs<arena::util::InvalidState>([&] { service.StartRun(start); }));
    cancel.set_run_id(run_id);
    assert(ThrowsAs<arena::util::InvalidState>([&] { service.CancelRun(cancel); }));
  }
}

void TestCsvPathsStayInsideImpressionsDir() {
  const auto root = std::filesystem::temp_directory_path() / "arena_service_impressions";
  const auto dir  = root / "data";
  std::filesystem::create_directories(dir);
  const std::string csv = "timestamp,floor_price,market_price,is_conversion,segment\n"
                          "1700000000,0.50,0.92,0,sports\n"
                          "1700000004,0.40,0.55,1,news\n";
  std::ofstream(dir / "day1.csv") << csv;
  std::ofstream(root / "outside.csv") << csv;

  auto ctx            = BuildServiceContext();
  ctx.impressions_dir = dir.string();
  ArenaService service(std::move(ctx));

  auto req = BuildRequest(0);
  req.set_impressions_csv_path("day1.csv");
  const auto run_id = service.CreateRun(req).run_id();
  StartRunRequest start;
  start.set_run_id(run_id);
  service.StartRun(start);
  assert(service.WaitForRun(run_id).results_count() == 2);

  req.set_impressions_csv_path((dir / "day1.csv").string());
  (void)service.CreateRun(req);

  const std::vector<std::string> escapes = {"../outside.csv", (root / "outside.csv").string(), "/etc/passwd",
                                            "data/../../outside.csv"};
  for (const auto& escape : escapes) {
    req.set_impressions_csv_path(escape);
    assert(ThrowsAs<arena::util::InvalidArgument>([&] { service.CreateRun(req); }));
  }

  std::filesystem::remove_all(root);
}

void TestRestartAbortsUnfinishedRuns() {
  auto        repository = std::make_shared<arena::db::memory::MemoryRepository>();
  std::string pending;
  std::string finished;
  {
    ArenaService service(BuildServiceContext(repository));
    finished = CreateAndRun(service, 2);
    pending  = service.CreateRun(BuildRequest(2)).run_id();
  }

  ArenaService  restarted(BuildServiceContext(repository));
  GetRunRequest get;
  get.set_run_id(pending);
  const auto info = restarted.GetRun(get);
  assert(info.state() == arena::core::v1::RUN_STATE_ABORTED);
  assert(info.abort_reason() == "server restarted");

  get.set_run_id(finished);
  assert(restarted.GetRun(get).state() == arena::core::v1::RUN_STATE_COMPLETED);
}

void TestRequiresRepository() {
  arena::service::ServiceContext ctx;
  assert(ThrowsAs<arena::util::InvalidArgument>([&] { ArenaService service(ctx); }));
}

} // namespace

int main() {
  TestValidateStrategy();
  TestCreateRunReportsRegistrations();
  TestCreateRunRejectsBadRequests();
  TestRunCompletesAndPersistsResults();
  TestStreamRunResults();
  TestStreamFollowsLiveRun();
  TestScoreboardLiveAndRebuilt();
  TestCancelBeforeStart();
  TestLifecycleErrors();
  TestFinishedRunsLeaveMemory();
  TestCsvPathsStayInsideImpressionsDir();
  TestRestartAbortsUnfinishedRuns();
  TestRequiresRepository();
  std::cout << "arena_unit_arena_service: pass\n";
  return 0;
}
