#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace fraudit::work {

/*
  Thread-safe blocking queue shared by pool workers.
*/
template <typename T>
class WorkQueue {
 public:
  void Enqueue(T item) {
    {
      std::lock_guard lock(mutex_);
      queue_.push(std::move(item));
    }
    cv_.notify_one();
  }

  // blocking wait; nullopt once shut down and drained
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  // Stops accepting waits; queued items are still handed out.
  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace fraudit::work
