#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace arena::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  The write lock is taken up front so an append racing a run-state update
  waits on the busy timeout instead of failing at COMMIT.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace arena::db::sqlite
