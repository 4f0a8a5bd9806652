#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace arena::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  // Creates the arena tables when missing.
  void Bootstrap();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace arena::db::sqlite
