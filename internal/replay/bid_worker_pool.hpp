#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "internal/replay/bid_scheduler.hpp"

namespace arena::replay {

/*
  Fixed set of threads that collect bids for one impression at a time.

  RunBatch hands every task to the workers and blocks until all of them have
  returned. The first exception thrown by a task is rethrown on the calling
  thread after the whole batch has finished.
*/
class BidWorkerPool {
 public:
  // 0 picks std::thread::hardware_concurrency().
  explicit BidWorkerPool(std::size_t workers);
  ~BidWorkerPool();

  BidWorkerPool(const BidWorkerPool&)            = delete;
  BidWorkerPool& operator=(const BidWorkerPool&) = delete;

  void RunBatch(std::vector<BidTask> tasks);

  std::size_t size() const {
    return threads_.size();
  }

 private:
  void Run();
  void Stop();

  std::shared_ptr<BidScheduler> scheduler_;
  std::vector<std::thread>      threads_;
};

} // namespace arena::replay
