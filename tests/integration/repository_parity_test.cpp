#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using arena::db::ErrorCode;
using arena::db::Repository;
using arena::db::memory::MemoryRepository;
using arena::db::model::RunRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RunRecord MakeRun(const std::string& id) {
  RunRecord run;
  run.id            = id;
  run.state         = arena::core::v1::RUN_STATE_INITIALIZED;
  run.created_at_ms = NowMs();
  run.config.set_clearing_rule(arena::core::v1::CLEARING_RULE_FIRST_PRICE);
  run.config.set_per_invocation_timeout_ms(75);
  run.config.set_starting_budget_per_strategy(12.5);
  run.roster.add_registered("alpha");
  run.roster.add_registered("beta");
  auto* rejected = run.roster.add_rejected();
  rejected->set_name("gamma");
  rejected->mutable_validation()->set_reason("ForbiddenConstruct: open");
  return run;
}

arena::core::v1::RunResult MakeResult(std::uint64_t sequence) {
  arena::core::v1::RunResult result;
  result.set_sequence(sequence);
  result.set_timestamp(static_cast<std::int64_t>(1000 + sequence));
  result.set_floor_price(0.5);
  auto* bid = result.add_bids();
  bid->set_strategy("alpha");
  bid->set_disposition(arena::core::v1::BID_DISPOSITION_BID);
  bid->set_amount(1.25);
  result.mutable_outcome()->set_has_winner(true);
  result.mutable_outcome()->set_winner("alpha");
  result.mutable_outcome()->set_clearing_price(0.75);
  return result;
}

void VerifyRunRoundTrip(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto run = repo.GetRun(*tx, id);
  assert(run.has_value());
  assert(run->state == arena::core::v1::RUN_STATE_INITIALIZED);
  assert(run->config.clearing_rule() == arena::core::v1::CLEARING_RULE_FIRST_PRICE);
  assert(run->config.per_invocation_timeout_ms() == 75);
  assert(run->config.starting_budget_per_strategy() == 12.5);
  assert(run->roster.registered_size() == 2);
  assert(run->roster.rejected(0).name() == "gamma");
  assert(run->roster.rejected(0).validation().reason() == "ForbiddenConstruct: open");

  const auto duplicate = repo.InsertRun(*tx, MakeRun(id));
  assert(duplicate.code == ErrorCode::AlreadyExists);

  assert(!repo.GetRun(*tx, id + "-missing").has_value());
  tx->Commit();
}

void VerifyUpdateRun(Repository& repo, const std::string& id) {
  auto run = MakeRun(id);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, run));
    tx->Commit();
  }

  run.state          = arena::core::v1::RUN_STATE_ABORTED;
  run.abort_reason   = "impression feed lost";
  run.finished_at_ms = run.created_at_ms + 10;
  {
    auto tx = repo.Begin();
    assert(repo.UpdateRun(*tx, run));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetRun(*tx, id);
  assert(stored->state == arena::core::v1::RUN_STATE_ABORTED);
  assert(stored->abort_reason == "impression feed lost");
  assert(stored->finished_at_ms == run.finished_at_ms);

  auto missing = MakeRun(id + "-missing");
  assert(repo.UpdateRun(*tx, missing).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRunResultsAreAppendOnly(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    tx->Commit();
  }

  for (std::uint64_t offset = 0; offset < 5; ++offset) {
    auto tx = repo.Begin();
    // Sequences need not be contiguous; offsets are.
    assert(repo.AppendRunResult(*tx, id, offset, MakeResult(offset * 10)));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.CountRunResults(*tx, id) == 5);

  assert(repo.AppendRunResult(*tx, id, 3, MakeResult(99)).code == ErrorCode::Conflict);
  assert(repo.AppendRunResult(*tx, id, 7, MakeResult(99)).code == ErrorCode::Conflict);
  assert(repo.AppendRunResult(*tx, id + "-missing", 0, MakeResult(0)).code == ErrorCode::NotFound);

  const auto all = repo.ReadRunResults(*tx, id, 0, std::nullopt);
  assert(all.size() == 5);
  for (std::size_t i = 0; i < all.size(); ++i) {
    assert(all[i].sequence() == i * 10);
  }
  assert(arena::db::SerializeRunResult(all[2]) == arena::db::SerializeRunResult(MakeResult(20)));

  const auto window = repo.ReadRunResults(*tx, id, 1, 2);
  assert(window.size() == 2);
  assert(window[0].sequence() == 10);
  assert(window[1].sequence() == 20);

  assert(repo.ReadRunResults(*tx, id, 5, 10).empty());
  assert(repo.ReadRunResults(*tx, id + "-missing", 0, std::nullopt).empty());
  tx->Commit();
}

void VerifyRollback(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    assert(repo.AppendRunResult(*tx, id, 0, MakeResult(0)));
    // Own writes are visible before commit.
    assert(repo.GetRun(*tx, id).has_value());
    assert(repo.CountRunResults(*tx, id) == 1);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetRun(*tx, id).has_value());
    tx->Commit();
  }
  {
    // Destroyed without Commit: rolled back.
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
  }
  auto tx = repo.Begin();
  assert(!repo.GetRun(*tx, id).has_value());
  assert(repo.CountRunResults(*tx, id) == 0);
  tx->Commit();
}

void VerifyListOrder(Repository& repo, const std::string& prefix) {
  for (int i = 0; i < 3; ++i) {
    auto tx  = repo.Begin();
    auto run = MakeRun(prefix + std::to_string(i));
    run.created_at_ms += static_cast<std::uint64_t>(i);
    assert(repo.InsertRun(*tx, run));
    tx->Commit();
  }

  auto                     tx = repo.Begin();
  std::vector<std::string> ours;
  for (const auto& run : repo.ListRuns(*tx)) {
    if (run.id.rfind(prefix, 0) == 0) ours.push_back(run.id);
  }
  tx->Commit();
  assert((ours == std::vector<std::string>{prefix + "0", prefix + "1", prefix + "2"}));
}

void VerifyPersistenceAcrossRestart(const BackendFactory& backend, std::shared_ptr<Repository>& repo) {
  if (!backend.supports_restart()) {
    return;
  }

  const std::string id = "restart-run";
  {
    auto tx = repo->Begin();
    assert(repo->InsertRun(*tx, MakeRun(id)));
    assert(repo->AppendRunResult(*tx, id, 0, MakeResult(0)));
    assert(repo->AppendRunResult(*tx, id, 1, MakeResult(1)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetRun(*tx, id).has_value());
  assert(repo->CountRunResults(*tx, id) == 2);
  assert(repo->ReadRunResults(*tx, id, 1, std::nullopt)[0].sequence() == 1);
  tx->Commit();
}

void RunBackend(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  VerifyRunRoundTrip(*repo, backend.name + "-roundtrip");
  VerifyUpdateRun(*repo, backend.name + "-update");
  VerifyRunResultsAreAppendOnly(*repo, backend.name + "-results");
  VerifyRollback(*repo, backend.name + "-rollback");
  VerifyListOrder(*repo, backend.name + "-list-");
  VerifyPersistenceAcrossRestart(backend, repo);

  repo.reset();
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("arena_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<arena::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<arena::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (const auto& backend : backends) {
    RunBackend(backend);
    std::cout << "backend " << backend.name << ": ok\n";
  }

  std::cout << "arena_integration_repository_parity: pass\n";
  return 0;
}
