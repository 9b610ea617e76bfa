#pragma once

#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Exchange-assigned identifier, returned on order acceptance (e.g. a 0x-hex
// hash). Kept as a string because the exchange owns its format.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: One of our own resting quotes: the submitted intent
// (instrument, side, size, price) plus its local lifecycle status.
//
// @details
// The authoritative copy lives in the OrderManager registry and is mutated
// only there, under the owning instrument slice's mutex. Everything handed
// out (query results, OrderUpdateEvent) is a snapshot copy; recipients must
// not expect it to track later transitions.
//
// size and price are the values actually submitted, i.e. after the
// OrderManager clamped them into exchange bounds.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;
  Instrument instrument;
  Side side{Side::Buy};
  double size{0.0};
  double price{0.0};
  std::int64_t placed_at_ms{0};  // Epoch ms from the injected ITimeProvider
  OrderStatus status{OrderStatus::Pending};
};

}  // namespace domain
}  // namespace pmm
