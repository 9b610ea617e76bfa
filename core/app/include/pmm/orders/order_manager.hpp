#pragma once

#include "pmm/common/result.hpp"
#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order.hpp"
#include "pmm/domain/order_status.hpp"
#include "pmm/eventbus/event_bus.hpp"
#include "pmm/events/order_update_event.hpp"
#include "pmm/exchange/i_exchange_client.hpp"
#include "pmm/time/i_time_provider.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// CancelOutcome
// -----------------------------------------------------------------------------
//   Confirmed   - the exchange listed the id in its canceled set; the
//                 registry entry is now Canceled.
//   Unconfirmed - the exchange answered but did not list the id; the
//                 registry entry is now Unknown until reconciled.
// -----------------------------------------------------------------------------
enum class CancelOutcome {
  Confirmed,
  Unconfirmed,
};

// -----------------------------------------------------------------------------
// OrderManager - order lifecycle state machine and registry of our quotes
// -----------------------------------------------------------------------------
//
// @brief  Places and cancels our orders through the exchange client and is
//         the authoritative local record of each order's status.
//
// @details
// Registry layout:
//   One slice per Instrument, each with its own mutex, its orders keyed by
//   id and their placement sequence. An id → instrument index routes
//   cancel() to the right slice. slices_mutex_ guards only the slice map
//   and the index; it may be taken while a slice mutex is held, never the
//   other way round. No lock is held across an exchange call.
//
// Retention:
//   Terminal orders (Canceled, Failed) stay queryable until a slice holds
//   more than retained_terminal of them; the oldest are then forgotten.
//   Live and Unknown orders are never dropped. A forgotten id behaves like
//   one that was never placed.
//
// State transitions:
//   Every change passes through isLegalTransition(). An illegal transition
//   is logged and skipped; the order keeps its current state. Each applied
//   transition publishes an OrderUpdateEvent (when a bus is attached).
//
// Failure policy:
//   No operation lets an exception from the client escape. Failures come
//   back as Error results; the caller decides what to do with them.
//
// Validation clamps (not errors):
//   price → [0.01, 0.99]; NaN → 0.01.
//   size  → at least the market's minimum order size; non-finite or
//           non-positive sizes become the minimum.
//
// Thread model:
//   Safe for concurrent use by several StrategyLoops, one per instrument.
//   Calls for the same instrument from two threads are also safe but are
//   not ordered with respect to each other.
//
// Ownership:
//   Owned by MarketMakingEngine (or a test). Holds references to the
//   client, the time provider and optionally the EventBus; owns none of
//   them.
// -----------------------------------------------------------------------------
class OrderManager {
 public:
  static constexpr double kMinPrice = 0.01;
  static constexpr double kMaxPrice = 0.99;
  static constexpr std::size_t kDefaultRetainedTerminal = 1000;

  OrderManager(IExchangeClient& client, const ITimeProvider& time_provider,
               EventBus* bus = nullptr,
               std::size_t retained_terminal = kDefaultRetainedTerminal);

  OrderManager(const OrderManager&) = delete;
  OrderManager& operator=(const OrderManager&) = delete;
  OrderManager(OrderManager&&) = delete;
  OrderManager& operator=(OrderManager&&) = delete;

  // -------------------------------------------------------------------------
  // place(instrument, side, size, price, fee_rate_bps)
  // -------------------------------------------------------------------------
  // @brief  Clamps, submits, and on acceptance records a Live order.
  //
  // @return The exchange-assigned order id, or an Error (ErrorKind::External)
  //         if the minimum-size lookup or the submission failed. On failure
  //         nothing is added to the registry.
  // -------------------------------------------------------------------------
  Result<domain::OrderId> place(const domain::Instrument& instrument,
                                domain::Side side, double size, double price,
                                int fee_rate_bps = 0);

  // -------------------------------------------------------------------------
  // cancel(order_id)
  // -------------------------------------------------------------------------
  // @brief  Requests cancellation and applies the exchange's answer.
  //
  // @return Confirmed or Unconfirmed (see CancelOutcome), or an Error:
  //         NotFound if the id was never placed through this manager,
  //         InvalidArgument if the order is already terminal,
  //         External if the cancel call failed (entry moves to Unknown).
  // -------------------------------------------------------------------------
  Result<CancelOutcome> cancel(const domain::OrderId& order_id);

  // -------------------------------------------------------------------------
  // reconcile(instrument)
  // -------------------------------------------------------------------------
  // @brief  Resolves every Unknown order of the instrument against the
  //         exchange's open-order list.
  //
  // @return Number of orders resolved, or an Error if the open-order poll
  //         failed (entries stay Unknown). Does not call the exchange when
  //         there is nothing Unknown.
  //
  // @details
  // Still listed → Live (the cancel did not take effect).
  // Not listed   → Canceled.
  // -------------------------------------------------------------------------
  Result<std::size_t> reconcile(const domain::Instrument& instrument);

  // Snapshot of one order, if it is still recorded.
  std::optional<domain::Order> order(const domain::OrderId& order_id) const;

  // Snapshot of every recorded order of the instrument, in placement order.
  std::vector<domain::Order> orders(const domain::Instrument& instrument) const;

  // Orders that may still be resting: Live or Unknown.
  std::size_t liveCount(const domain::Instrument& instrument) const;
  std::size_t liveCount(const domain::Instrument& instrument,
                        domain::Side side) const;

  static bool isLegalTransition(domain::OrderStatus current,
                                domain::OrderStatus next);

  static bool isTerminal(domain::OrderStatus status);

  static double clampPrice(double price);

 private:
  struct Slice {
    mutable std::mutex mutex;
    std::unordered_map<domain::OrderId, domain::Order> orders;
    std::deque<domain::OrderId> sequence;  // placement order
    std::deque<domain::OrderId> retired;   // terminal, oldest first
  };

  // Returns the slice for the instrument, creating it on first use.
  Slice& sliceFor(const domain::Instrument& instrument);

  // Returns nullptr if the instrument has no slice yet.
  const Slice* findSlice(const domain::Instrument& instrument) const;

  std::optional<domain::Instrument> instrumentOf(
      const domain::OrderId& order_id) const;

  // Applies a validated transition under the slice lock. Returns the event
  // to publish once the lock is released, or nullopt if nothing changed.
  std::optional<OrderUpdateEvent> transition(Slice& slice,
                                             const domain::OrderId& order_id,
                                             domain::OrderStatus next);

  // Drops the oldest terminal orders beyond the retention limit. Caller
  // holds slice.mutex.
  void pruneRetired(Slice& slice);

  void publish(const OrderUpdateEvent& event);

  IExchangeClient& client_;
  const ITimeProvider& time_provider_;
  EventBus* bus_;
  const std::size_t retained_terminal_;

  mutable std::mutex slices_mutex_;
  std::unordered_map<domain::Instrument, std::unique_ptr<Slice>> slices_;
  std::unordered_map<domain::OrderId, domain::Instrument> index_;
};

}  // namespace pmm
