#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace arena::replay {

using BidTask = std::function<void()>;

/*
  Thread-safe blocking queue for bid workers.
*/
class BidScheduler {
 public:
  void Enqueue(BidTask task);

  // blocking wait; std::nullopt after Shutdown once drained
  std::optional<BidTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<BidTask>     queue_;
  bool                    shutdown_ = false;
};

} // namespace arena::replay
