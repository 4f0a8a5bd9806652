#include "internal/replay/bid_worker_pool.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>

namespace arena::replay {

namespace {

struct Batch {
  std::mutex              mutex;
  std::condition_variable done;
  std::size_t             remaining = 0;
  std::exception_ptr      error;
};

} // namespace

BidWorkerPool::BidWorkerPool(std::size_t workers) : scheduler_(std::make_shared<BidScheduler>()) {
  if (workers == 0) {
    workers = std::max(1u, std::thread::hardware_concurrency());
  }
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&BidWorkerPool::Run, this);
  }
}

BidWorkerPool::~BidWorkerPool() {
  Stop();
}

void BidWorkerPool::Stop() {
  scheduler_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void BidWorkerPool::Run() {
  while (auto task = scheduler_->Dequeue()) {
    (*task)();
  }
}

void BidWorkerPool::RunBatch(std::vector<BidTask> tasks) {
  if (tasks.empty()) return;

  auto batch       = std::make_shared<Batch>();
  batch->remaining = tasks.size();

  for (auto& task : tasks) {
    scheduler_->Enqueue([batch, task = std::move(task)] {
      std::exception_ptr error;
      try {
        task();
      } catch (...) {
        error = std::current_exception();
      }

      std::lock_guard lock(batch->mutex);
      if (error && !batch->error) batch->error = error;
      if (--batch->remaining == 0) batch->done.notify_all();
    });
  }

  std::unique_lock lock(batch->mutex);
  batch->done.wait(lock, [&] { return batch->remaining == 0; });
  if (batch->error) {
    std::rethrow_exception(batch->error);
  }
}

} // namespace arena::replay
