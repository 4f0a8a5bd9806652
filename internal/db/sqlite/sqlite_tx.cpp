#include "sqlite_tx.hpp"

namespace arena::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace arena::db::sqlite
