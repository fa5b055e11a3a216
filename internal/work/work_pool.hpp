#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/work/cancellation.hpp"
#include "internal/work/work_queue.hpp"

namespace fraudit::work {

// Splits items into consecutive batches of at most batch_size elements.
template <typename T>
std::vector<std::span<const T>> Partition(const std::vector<T>& items, std::size_t batch_size) {
  std::vector<std::span<const T>> batches;
  if (batch_size == 0) {
    batch_size = 1;
  }
  for (std::size_t begin = 0; begin < items.size(); begin += batch_size) {
    const auto count = std::min(batch_size, items.size() - begin);
    batches.emplace_back(items.data() + begin, count);
  }
  return batches;
}

template <typename R>
struct UnitResult {
  bool             started = false;
  std::optional<R> value;
  std::string      error;

  bool Succeeded() const {
    return started && value.has_value();
  }
};

/*
  Runs fn over every unit on at most max_workers threads and returns one
  result per unit, in unit order.

  Each worker writes only the result slot of the unit it dequeued; the
  caller merges after the barrier join. Exceptions thrown by fn are caught
  at the unit boundary and recorded as that unit's error. When cancel is
  set, units not yet dequeued are left unstarted.
*/
template <typename Unit, typename Fn>
auto RunPool(const std::vector<Unit>& units, Fn&& fn, std::size_t max_workers, const CancellationToken* cancel = nullptr)
    -> std::vector<UnitResult<std::invoke_result_t<Fn&, const Unit&>>> {
  using R = std::invoke_result_t<Fn&, const Unit&>;

  std::vector<UnitResult<R>> results(units.size());
  if (units.empty()) {
    return results;
  }

  WorkQueue<std::size_t> queue;
  for (std::size_t i = 0; i < units.size(); ++i) {
    queue.Enqueue(i);
  }
  queue.Shutdown();

  auto worker = [&] {
    while (true) {
      if (cancel && cancel->IsCancelled()) {
        return;
      }
      auto index = queue.Dequeue();
      if (!index) {
        return;
      }

      auto& slot   = results[*index];
      slot.started = true;
      try {
        slot.value.emplace(fn(units[*index]));
      } catch (const std::exception& e) {
        slot.error = e.what();
      } catch (...) {
        slot.error = "unknown exception";
      }
    }
  };

  const auto thread_count = std::clamp<std::size_t>(max_workers, 1, units.size());
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  return results;
}

} // namespace fraudit::work
