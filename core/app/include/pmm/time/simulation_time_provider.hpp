#pragma once

#include "pmm/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace pmm {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly rather than read from
//         the system clock.
//
// @details
// Used by tests and by the paper-trading mode of pmm_engine. A
// SimulatedTimer advances this clock by the requested sleep duration
// instead of blocking, so the Strategy Loop's deadline arithmetic behaves
// exactly as it would live, only without waiting.
//
// Storage is a std::atomic<int64_t>: several strategy threads may read the
// clock while one of them (through its SimulatedTimer) advances it.
// advance_by() is a fetch_add, so concurrent advances from different
// threads accumulate rather than overwrite each other.
//
// Ownership:
//   Owned by the test fixture or main(); borrowed by everything else.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms (negative deltas are ignored).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace pmm
