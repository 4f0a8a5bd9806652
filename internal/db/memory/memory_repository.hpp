#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace arena::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord>  GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord>    ListRuns(Transaction&) override;
  Result                           UpdateRun(Transaction&, const model::RunRecord&) override;

  Result AppendRunResult(Transaction&, const std::string& run_id, std::uint64_t offset,
                         const arena::core::v1::RunResult& result) override;
  std::vector<arena::core::v1::RunResult> ReadRunResults(Transaction&, const std::string& run_id,
                                                          std::uint64_t                start_offset,
                                                          std::optional<std::uint64_t> max_results) override;
  std::uint64_t CountRunResults(Transaction&, const std::string& run_id) override;

 private:
  friend class MemoryTransaction;

  // Small and copied into every transaction.
  struct State {
    std::unordered_map<std::string, model::RunRecord> runs;
    std::vector<std::string>                          run_order;
  };

  using ResultLog = std::unordered_map<std::string, std::vector<arena::core::v1::RunResult>>;

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
  // Append-only; never copied into transactions.
  ResultLog results_;
};

} // namespace arena::db::memory
