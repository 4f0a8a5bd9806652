#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace arena::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  if (TX(t).View().runs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "run " + r.id);
  auto& s = TX(t).Mutable();
  s.runs[r.id] = r;
  s.run_order.push_back(r.id);
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RunRecord> MemoryRepository::ListRuns(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::RunRecord> records;
  records.reserve(s.run_order.size());
  for (const auto& id : s.run_order) {
    records.push_back(s.runs.at(id));
  }
  return records;
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  if (!TX(t).View().runs.contains(r.id)) return Result::Err(ErrorCode::NotFound, "run " + r.id);
  TX(t).Mutable().runs[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::AppendRunResult(Transaction& t, const std::string& run_id, std::uint64_t offset,
                                         const arena::core::v1::RunResult& result) {
  auto& tx = TX(t);
  if (!tx.View().runs.contains(run_id)) return Result::Err(ErrorCode::NotFound, "run " + run_id);

  auto& pending = tx.PendingResults()[run_id];
  if (offset != CountRunResults(t, run_id)) {
    return Result::Err(ErrorCode::Conflict, "run " + run_id + " offset " + std::to_string(offset) + " is not next");
  }
  pending.push_back(result);
  return Result::Ok();
}

std::vector<arena::core::v1::RunResult> MemoryRepository::ReadRunResults(Transaction& t, const std::string& run_id,
                                                                          std::uint64_t                start_offset,
                                                                          std::optional<std::uint64_t> max_results) {
  std::vector<arena::core::v1::RunResult> out;
  const std::uint64_t limit = max_results.value_or(UINT64_MAX);

  std::uint64_t committed_count = 0;
  {
    std::scoped_lock lock(mutex_);
    auto             it = results_.find(run_id);
    if (it != results_.end()) {
      const auto& log = it->second;
      committed_count = log.size();
      for (std::uint64_t i = start_offset; i < log.size() && out.size() < limit; ++i) {
        out.push_back(log[i]);
      }
    }
  }

  auto& pending = TX(t).PendingResults();
  auto  it      = pending.find(run_id);
  if (it == pending.end()) return out;
  for (std::uint64_t i = 0; i < it->second.size() && out.size() < limit; ++i) {
    if (committed_count + i >= start_offset) out.push_back(it->second[i]);
  }
  return out;
}

std::uint64_t MemoryRepository::CountRunResults(Transaction& t, const std::string& run_id) {
  std::uint64_t count = 0;
  {
    std::scoped_lock lock(mutex_);
    auto             it = results_.find(run_id);
    if (it != results_.end()) count = it->second.size();
  }
  auto& pending = TX(t).PendingResults();
  auto  it      = pending.find(run_id);
  if (it != pending.end()) count += it->second.size();
  return count;
}

} // namespace arena::db::memory
