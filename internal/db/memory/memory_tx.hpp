#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace arena::db::memory {

/*
  Transaction = snapshot of the run table + write set.

  Appended Run Results are buffered and published on Commit(). A commit
  that changed runs fails when another transaction changed them first.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    runs_dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  MemoryRepository::ResultLog& PendingResults() {
    return pending_results_;
  }

  MemoryRepository& Repo() {
    return repo_;
  }

 private:
  MemoryRepository&           repo_;
  MemoryRepository::State     working_;
  MemoryRepository::ResultLog pending_results_;
  std::uint64_t               snapshot_version_ = 0;
  bool                        runs_dirty_       = false;
  bool                        committed_        = false;
  bool                        rolled_back_      = false;
};

} // namespace arena::db::memory
