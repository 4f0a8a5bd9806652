#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arena/core/v1/types.pb.h"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/run_record.hpp"

namespace arena::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Run Results are append-only; offsets are contiguous from 0 per run

  The DB is the source of truth for finished runs: their Run Result sequence
  is enough to rebuild the scoreboard.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result InsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& id) = 0;

  // Ordered by creation time.
  virtual std::vector<model::RunRecord> ListRuns(Transaction&) = 0;

  virtual Result UpdateRun(Transaction&, const model::RunRecord&) = 0;

  // ---------------------------------------------------------------------
  // Run Results
  // ---------------------------------------------------------------------

  // `offset` must equal the number of results already stored for the run.
  virtual Result AppendRunResult(Transaction&, const std::string& run_id, std::uint64_t offset,
                                 const arena::core::v1::RunResult& result) = 0;

  virtual std::vector<arena::core::v1::RunResult> ReadRunResults(Transaction&, const std::string& run_id,
                                                                  std::uint64_t                start_offset,
                                                                  std::optional<std::uint64_t> max_results) = 0;

  virtual std::uint64_t CountRunResults(Transaction&, const std::string& run_id) = 0;
};

// Deterministic wire encoding used for stored Run Results.
std::string SerializeRunResult(const arena::core::v1::RunResult& result);

} // namespace arena::db
