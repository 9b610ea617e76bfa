#pragma once

#include "pmm/time/i_timer.hpp"
#include "pmm/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>

namespace pmm {

// -----------------------------------------------------------------------------
// SimulatedTimer - non-blocking ITimer over a SimulationTimeProvider
// -----------------------------------------------------------------------------
//
// @brief  "Sleeps" by advancing the simulated clock by the requested
//         duration and returning immediately.
//
// @details
// Lets a Strategy Loop run of any configured duration complete instantly
// and deterministically. Tests can observe or interfere with each sleep via
// the optional hook, which runs after the clock has been advanced (e.g. to
// fill a resting quote between cycles, or to cancel the timer mid-run).
//
// Thread model:
//   The hook runs on the sleeping strategy thread. cancel() is atomic and
//   safe from any thread.
// -----------------------------------------------------------------------------
class SimulatedTimer final : public ITimer {
 public:
  using SleepHook = std::function<void(std::int64_t /*duration_ms*/)>;

  explicit SimulatedTimer(SimulationTimeProvider& clock,
                          SleepHook on_sleep = nullptr);

  bool sleepFor(std::int64_t duration_ms) override;
  void cancel() override;
  bool cancelled() const override;

  // Number of sleepFor() calls that advanced the clock.
  std::int64_t sleepCount() const { return sleep_count_.load(); }

  // Sum of all durations slept.
  std::int64_t totalSleptMs() const { return total_slept_ms_.load(); }

 private:
  SimulationTimeProvider& clock_;
  SleepHook on_sleep_;
  std::atomic<bool> cancelled_{false};
  std::atomic<std::int64_t> sleep_count_{0};
  std::atomic<std::int64_t> total_slept_ms_{0};
};

}  // namespace pmm
