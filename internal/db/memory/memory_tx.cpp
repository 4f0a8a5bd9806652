#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace arena::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  if (runs_dirty_) {
    if (repo_.committed_version_ != snapshot_version_) {
      throw util::InvalidState("transaction conflict: runs were modified by a concurrent transaction");
    }
    repo_.committed_ = std::move(working_);
    repo_.committed_version_++;
  }
  for (auto& [run_id, results] : pending_results_) {
    auto& log = repo_.results_[run_id];
    for (auto& result : results) {
      log.push_back(std::move(result));
    }
  }
  pending_results_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  pending_results_.clear();
  rolled_back_ = true;
}

} // namespace arena::db::memory
