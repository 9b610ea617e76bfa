#pragma once

#include <cstdint>

namespace pmm {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// Everything in the core that needs a timestamp (order placed_at, PnL
// snapshot timestamps, the Strategy Loop's run deadline) reads it through
// this interface:
//   - LiveTimeProvider       → wall clock, used by the pmm_engine binary.
//   - SimulationTimeProvider → explicitly advanced; paired with
//                              SimulatedTimer so a 60 minute run completes
//                              in microseconds under test.
//
// Time is int64 milliseconds since the Unix epoch. Refresh and backoff
// intervals are configured in the same unit.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Several strategy
//   threads read the same provider.
//
// Ownership:
//   Components hold a const reference and never own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time, epoch milliseconds. Pure read.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace pmm
