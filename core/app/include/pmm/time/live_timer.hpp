#pragma once

#include "pmm/time/i_timer.hpp"

#include <condition_variable>
#include <mutex>

namespace pmm {

// -----------------------------------------------------------------------------
// LiveTimer - wall-clock ITimer backed by a condition variable
// -----------------------------------------------------------------------------
// sleepFor() waits on a std::condition_variable with a steady_clock
// deadline; cancel() sets the flag under the mutex and notifies, so a
// sleeping strategy thread wakes within scheduler latency rather than at
// the end of its refresh interval.
// -----------------------------------------------------------------------------
class LiveTimer final : public ITimer {
 public:
  LiveTimer() = default;

  LiveTimer(const LiveTimer&) = delete;
  LiveTimer& operator=(const LiveTimer&) = delete;

  bool sleepFor(std::int64_t duration_ms) override;
  void cancel() override;
  bool cancelled() const override;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_{false};
};

}  // namespace pmm
