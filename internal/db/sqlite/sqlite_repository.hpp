#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace arena::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord>   ListRuns(Transaction&) override;
  Result                          UpdateRun(Transaction&, const model::RunRecord&) override;

  Result AppendRunResult(Transaction&, const std::string& run_id, std::uint64_t offset,
                         const arena::core::v1::RunResult& result) override;
  std::vector<arena::core::v1::RunResult> ReadRunResults(Transaction&, const std::string& run_id,
                                                          std::uint64_t                start_offset,
                                                          std::optional<std::uint64_t> max_results) override;
  std::uint64_t CountRunResults(Transaction&, const std::string& run_id) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace arena::db::sqlite
