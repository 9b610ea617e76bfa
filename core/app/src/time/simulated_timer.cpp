#include "pmm/time/simulated_timer.hpp"

#include <utility>

namespace pmm {

SimulatedTimer::SimulatedTimer(SimulationTimeProvider& clock,
                               SleepHook on_sleep)
    : clock_(clock), on_sleep_(std::move(on_sleep)) {}

// -----------------------------------------------------------------------------
// sleepFor(): advance the simulated clock instead of blocking
// -----------------------------------------------------------------------------
bool SimulatedTimer::sleepFor(std::int64_t duration_ms) {
  if (cancelled_.load()) {
    return false;
  }
  if (duration_ms <= 0) {
    return true;
  }

  clock_.advance_by(duration_ms);
  sleep_count_.fetch_add(1);
  total_slept_ms_.fetch_add(duration_ms);

  if (on_sleep_) {
    on_sleep_(duration_ms);
  }

  // The hook may have cancelled us; report it the same way LiveTimer would
  // report a cancel that arrived mid-sleep.
  return !cancelled_.load();
}

void SimulatedTimer::cancel() { cancelled_.store(true); }

bool SimulatedTimer::cancelled() const { return cancelled_.load(); }

}  // namespace pmm
