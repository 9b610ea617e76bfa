#pragma once

#include <cstdint>

namespace pmm {

// -----------------------------------------------------------------------------
// ITimer - cancellable sleep used by the Strategy Loop
// -----------------------------------------------------------------------------
//
// @brief  Blocks the calling strategy thread for a bounded interval, and can
//         be woken early from any other thread.
//
// @details
// The Strategy Loop sleeps between refresh cycles and after a failed cycle.
// Routing those sleeps through ITimer gives two things a bare
// std::this_thread::sleep_for cannot:
//   1. cancel() from another thread (engine STOP command, SIGINT) wakes the
//      loop immediately and it proceeds to wind down.
//   2. Tests inject a SimulatedTimer that advances a SimulationTimeProvider
//      instead of blocking.
//
// Once cancelled a timer stays cancelled: every subsequent sleepFor()
// returns false immediately. One timer per strategy run.
//
// Thread model:
//   sleepFor() is called only by the owning strategy thread. cancel() and
//   cancelled() may be called from any thread.
// -----------------------------------------------------------------------------
class ITimer {
 public:
  virtual ~ITimer() = default;

  // Sleeps for duration_ms (non-positive durations return at once).
  // Returns true if the full interval elapsed, false if cancelled.
  virtual bool sleepFor(std::int64_t duration_ms) = 0;

  virtual void cancel() = 0;

  virtual bool cancelled() const = 0;
};

}  // namespace pmm
