#pragma once

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus - local lifecycle state of one of our resting quotes
// -----------------------------------------------------------------------------
//
// @brief  Enumerates the states an order can occupy inside the OrderManager
//         registry.
//
// @details
// The lifecycle is a small state machine. The OrderManager validates every
// transition against this graph before applying it:
//
//   Pending ───> Live ───> Canceled
//      │          │  ▲        ▲
//      │          ▼  │        │
//      │        Unknown ──────┘
//      │          │
//      ▼          ▼
//    Failed <─────┘   (Live → Failed is also legal)
//
// Unknown means a cancel was issued but the exchange did not confirm it (or
// the cancel call itself failed). The order may or may not still be resting.
// It counts as resting for the one-quote-per-side invariant until a later
// cancel confirms it or reconciliation against the open-order list resolves
// it to Live or Canceled.
//
// Terminal states: Canceled, Failed.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,   // Built locally, submission in flight
  Live,      // Acknowledged by the exchange, resting on the book
  Canceled,  // Cancel confirmed by the exchange - terminal
  Failed,    // Submission or lifecycle error - terminal
  Unknown,   // Cancel issued but unconfirmed; awaiting reconciliation
};

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:  return "Pending";
    case OrderStatus::Live:     return "Live";
    case OrderStatus::Canceled: return "Canceled";
    case OrderStatus::Failed:   return "Failed";
    case OrderStatus::Unknown:  return "Unknown";
  }
  return "Invalid";
}

}  // namespace domain
}  // namespace pmm
