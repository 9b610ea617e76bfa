#pragma once

#include "pmm/events/order_update_event.hpp"
#include "pmm/events/pnl_snapshot_event.hpp"
#include "pmm/events/strategy_state_event.hpp"

#include <variant>

namespace pmm {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope for everything published on the engine's EventBus.
// The bus carries observations only (telemetry, logging, tests); no
// component takes a trading decision from an event.
//
// std::variant keeps events as plain values, so a subscriber can copy one
// into a ThreadSafeQueue and hand it to another thread (the IpcServer does
// exactly that).
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderUpdateEvent,
    PnlSnapshotEvent,
    StrategyStateEvent>;

}  // namespace pmm
