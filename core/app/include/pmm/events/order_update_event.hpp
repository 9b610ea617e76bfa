#pragma once

#include "pmm/domain/order.hpp"
#include "pmm/domain/order_status.hpp"

#include <cstdint>

namespace pmm {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the OrderManager whenever one of our orders enters
//         the registry or changes status.
//
// @details
// order is a snapshot taken after the transition. previous_status is the
// state before it; for a freshly placed order it equals Pending.
//
// Published on the thread that performed the transition (a strategy
// thread), after the registry slice lock has been released.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  std::int64_t timestamp_ms{0};
};

}  // namespace pmm
