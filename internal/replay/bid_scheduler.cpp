#include "internal/replay/bid_scheduler.hpp"

namespace arena::replay {

void BidScheduler::Enqueue(BidTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<BidTask> BidScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  BidTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void BidScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace arena::replay
