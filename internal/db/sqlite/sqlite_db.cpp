#include "sqlite_db.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace arena::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::InfrastructureError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::InfrastructureError("cannot open " + path_ + ": " + msg);
  }

  sqlite3_extended_result_codes(db_, 1);
  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::InfrastructureError(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL enables concurrent readers while writer holds lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Bootstrap() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS runs (id TEXT PRIMARY KEY, state INTEGER NOT NULL, abort_reason TEXT NOT NULL DEFAULT '', config BLOB NOT NULL, roster BLOB NOT NULL, created_at_ms INTEGER NOT NULL, finished_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS run_results (run_id TEXT NOT NULL REFERENCES runs(id) ON DELETE CASCADE, offset INTEGER NOT NULL, sequence INTEGER NOT NULL, result BLOB NOT NULL, PRIMARY KEY (run_id, offset));",
      "CREATE TABLE IF NOT EXISTS arena_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO arena_schema_migrations(version, applied_at_ms) VALUES (1, unixepoch() * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }

  Exec("SELECT id,state,abort_reason,config,roster,created_at_ms,finished_at_ms FROM runs LIMIT 1;");
  Exec("SELECT run_id,offset,sequence,result FROM run_results LIMIT 1;");
}

} // namespace arena::db::sqlite
