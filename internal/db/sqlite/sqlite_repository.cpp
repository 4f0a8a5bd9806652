#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace arena::db::sqlite {

using arena::db::ErrorCode;
using arena::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::InfrastructureError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kSelectRun =
    "SELECT id,state,abort_reason,config,roster,created_at_ms,finished_at_ms FROM runs";

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.id           = ColText(st, 0);
  r.state        = static_cast<arena::core::v1::RunState>(ColI32(st, 1));
  r.abort_reason = ColText(st, 2);
  if (!r.config.ParseFromString(ColBlob(st, 3))) {
    throw util::InfrastructureError("corrupt config blob for run " + r.id);
  }
  if (!r.roster.ParseFromString(ColBlob(st, 4))) {
    throw util::InfrastructureError("corrupt roster blob for run " + r.id);
  }
  r.created_at_ms  = ColU64(st, 5);
  r.finished_at_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO runs(id,state,abort_reason,config,roster,created_at_ms,finished_at_ms)"
                      " VALUES(?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindI32(st.get(), 2, static_cast<int>(r.state));
  BindText(st.get(), 3, r.abort_reason);
  BindBlob(st.get(), 4, r.config.SerializeAsString());
  BindBlob(st.get(), 5, r.roster.SerializeAsString());
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.finished_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, (std::string(kSelectRun) + " WHERE id=?;").c_str());
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw util::InfrastructureError("sqlite read run: " + Translate(db, rc).message);
  }
  return ReadRun(st.get());
}

std::vector<model::RunRecord> SqliteRepository::ListRuns(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, (std::string(kSelectRun) + " ORDER BY created_at_ms, rowid;").c_str());

  std::vector<model::RunRecord> out;
  int                           rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRun(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw util::InfrastructureError("sqlite list runs: " + Translate(db, rc).message);
  }
  return out;
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE runs SET state=?,abort_reason=?,config=?,roster=?,finished_at_ms=? WHERE id=?;");

  BindI32(st.get(), 1, static_cast<int>(r.state));
  BindText(st.get(), 2, r.abort_reason);
  BindBlob(st.get(), 3, r.config.SerializeAsString());
  BindBlob(st.get(), 4, r.roster.SerializeAsString());
  BindU64(st.get(), 5, r.finished_at_ms);
  BindText(st.get(), 6, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "run " + r.id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Run Results
// ------------------------------------------------------------------

Result SqliteRepository::AppendRunResult(Transaction& t, const std::string& run_id, std::uint64_t offset,
                                         const arena::core::v1::RunResult& result) {
  if (offset != CountRunResults(t, run_id)) {
    return Result::Err(ErrorCode::Conflict, "run " + run_id + " offset " + std::to_string(offset) + " is not next");
  }

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO run_results(run_id,offset,sequence,result) VALUES(?,?,?,?);");

  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, offset);
  BindU64(st.get(), 3, result.sequence());
  BindBlob(st.get(), 4, SerializeRunResult(result));

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) {
    return Result::Err(ErrorCode::NotFound, "run " + run_id);
  }
  return Translate(db, rc);
}

std::vector<arena::core::v1::RunResult> SqliteRepository::ReadRunResults(Transaction& t, const std::string& run_id,
                                                                          std::uint64_t                start_offset,
                                                                          std::optional<std::uint64_t> max_results) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT result FROM run_results WHERE run_id=? AND offset>=? ORDER BY offset LIMIT ?;");

  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, start_offset);
  // LIMIT -1 means no limit
  sqlite3_bind_int64(st.get(), 3, max_results ? static_cast<sqlite3_int64>(*max_results) : -1);

  std::vector<arena::core::v1::RunResult> out;
  int                                     rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    arena::core::v1::RunResult result;
    if (!result.ParseFromString(ColBlob(st.get(), 0))) {
      throw util::InfrastructureError("corrupt run result in run " + run_id);
    }
    out.push_back(std::move(result));
  }
  if (rc != SQLITE_DONE) {
    throw util::InfrastructureError("sqlite read run results: " + Translate(db, rc).message);
  }
  return out;
}

std::uint64_t SqliteRepository::CountRunResults(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM run_results WHERE run_id=?;");
  BindText(st.get(), 1, run_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    throw util::InfrastructureError("sqlite count run results: " + Translate(db, rc).message);
  }
  return ColU64(st.get(), 0);
}

} // namespace arena::db::sqlite
