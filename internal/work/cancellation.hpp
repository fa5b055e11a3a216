#pragma once

#include <atomic>

namespace fraudit::work {

/*
  Cooperative cancellation. Checked between units of work only; a unit that
  has started always runs to completion.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace fraudit::work
