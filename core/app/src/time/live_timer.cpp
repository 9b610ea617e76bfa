#include "pmm/time/live_timer.hpp"

#include <chrono>

namespace pmm {

// -----------------------------------------------------------------------------
// sleepFor(): wait until the deadline or until cancel() notifies
// -----------------------------------------------------------------------------
bool LiveTimer::sleepFor(std::int64_t duration_ms) {
  std::unique_lock lock(mutex_);
  if (cancelled_) {
    return false;
  }
  if (duration_ms <= 0) {
    return true;
  }

  // wait_for with a predicate absorbs spurious wakeups. It returns the
  // predicate's value: true only if we were cancelled.
  bool woken = cv_.wait_for(lock, std::chrono::milliseconds(duration_ms),
                            [this] { return cancelled_; });
  return !woken;
}

// -----------------------------------------------------------------------------
// cancel(): latch the flag and wake the sleeper
// -----------------------------------------------------------------------------
void LiveTimer::cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool LiveTimer::cancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

}  // namespace pmm
