#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> - unbounded MPMC FIFO
// -----------------------------------------------------------------------------
//
// @brief  Hands telemetry events from strategy threads (producers, via
//         EventBus callbacks) to the IpcServer worker thread (consumer).
//
// @details
// Consumers choose how to wait:
//   pop()       blocks until an item arrives
//   pop_for(d)  blocks at most d
//   try_pop()   never blocks
//   drain()     takes everything queued in one lock acquisition
// The IpcServer calls drain() between command polls.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

  void push(T value) {
    std::unique_lock lock(mutex_);
    items_.push_back(std::move(value));
    lock.unlock();
    ready_.notify_one();
  }

  T pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return !items_.empty(); });
    return takeFrontLocked();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!ready_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
      return std::nullopt;
    }
    return takeFrontLocked();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    return takeFrontLocked();
  }

  // Everything queued so far, oldest first. Empty if nothing was queued.
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(items_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  // Caller holds mutex_ and has checked items_ is non-empty.
  T takeFrontLocked() {
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
};

}  // namespace pmm
