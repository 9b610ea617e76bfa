#pragma once

#include "pmm/domain/instrument.hpp"
#include "pmm/domain/strategy_state.hpp"

#include <cstdint>

namespace pmm {

// -----------------------------------------------------------------------------
// StrategyStateEvent
// -----------------------------------------------------------------------------
// Published by a StrategyLoop on every run-state transition.
// -----------------------------------------------------------------------------
struct StrategyStateEvent {
  domain::Instrument instrument;
  domain::StrategyState state{domain::StrategyState::Idle};
  domain::StrategyState previous_state{domain::StrategyState::Idle};
  std::int64_t timestamp_ms{0};
};

}  // namespace pmm
