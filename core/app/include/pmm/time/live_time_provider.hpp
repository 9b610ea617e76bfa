#pragma once

#include "pmm/time/i_time_provider.hpp"

#include <chrono>

namespace pmm {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall clock, epoch milliseconds
// -----------------------------------------------------------------------------
// Used by pmm_engine for every timestamp (orders, PnL history, state
// events). Deadlines are also measured on this clock, so a wall-clock jump
// shortens or lengthens a run accordingly.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace pmm
