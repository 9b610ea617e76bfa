#pragma once

#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order.hpp"
#include "pmm/domain/strategy_params.hpp"
#include "pmm/domain/strategy_state.hpp"
#include "pmm/eventbus/event_bus.hpp"
#include "pmm/orders/order_manager.hpp"
#include "pmm/pricing/quote_pricer.hpp"
#include "pmm/time/i_time_provider.hpp"
#include "pmm/time/i_timer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace pmm {

// -----------------------------------------------------------------------------
// RunSummary - counters returned by StrategyLoop::run()
// -----------------------------------------------------------------------------
struct RunSummary {
  bool started{false};                 // false if run() was refused
  std::uint64_t cycles{0};             // cycles that reached the quoting step
  std::uint64_t failed_cycles{0};      // pricing errors + unexpected exceptions
  std::uint64_t placed{0};             // successful placements
  std::uint64_t placement_failures{0};
  std::uint64_t cancel_confirmed{0};
  std::uint64_t cancel_unconfirmed{0};  // Unconfirmed outcomes + cancel errors
  std::uint64_t reconciled{0};          // Unknown orders resolved by polling
  std::uint64_t held_sides{0};          // side-cycles skipped: old quote unresolved
  std::uint64_t left_resting{0};        // quotes still resting after wind-down
  bool stopped_early{false};            // stop() ended the run before deadline
  domain::StrategyState final_state{domain::StrategyState::Idle};
};

// -----------------------------------------------------------------------------
// StrategyLoop - periodic two-sided quote refresh for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Runs the quoting control loop for a single instrument for a
//         bounded duration, then cancels whatever it still has resting.
//
// @details
// State machine: Idle → Running → WindingDown → Done (see StrategyState).
//
// One cycle, while Running and now < start + duration:
//   1. Price the book (QuotePricer::quote). On error: failed cycle, back
//      off for error_backoff_ms, retry.
//   2. Cancel the active buy quote, then the active sell quote. A side's
//      reference is dropped only when the cancel is Confirmed.
//   3. buy  = max(0.01, round2(mid - max_spread))
//      sell = min(0.99, round2(mid + max_spread))
//   4. A side still holding an unconfirmed quote is reconciled against the
//      open-order list. If the old quote is gone it is replaced; if it is
//      still resting (or the poll failed) the side is held for this cycle.
//      Otherwise place the new quote. A failed placement leaves the side
//      empty until the next cycle.
//   5. Sleep refresh_interval_ms.
// Any std::exception escaping a cycle is logged, counted as a failed cycle,
// and followed by the error backoff. The loop never terminates early on
// errors; only the deadline or stop() ends it.
//
// Invariant: at most one Live/Unknown order per side is attributable to
// this loop between cycles. Cancel happens before replace, and a replace
// never happens while the previous quote may still be resting.
//
// Scheduling:
//   Every sleep goes through the injected ITimer and is capped at the time
//   left before the deadline, so expiry is seen without waiting out a full
//   refresh interval. stop() cancels the timer; the loop then winds down
//   immediately (an exchange call already in flight still completes).
//
// Per-run state (size, active quote ids, deadline, counters) lives in a
// RunState local to run(); the loop shares nothing mutable with other
// loops except through the OrderManager.
//
// Thread model:
//   run() executes on the calling thread and blocks until Done. stop() and
//   state() may be called from any thread.
// -----------------------------------------------------------------------------
class StrategyLoop {
 public:
  using CycleObserver =
      std::function<void(const domain::Instrument&, std::uint64_t /*cycle*/)>;

  StrategyLoop(OrderManager& orders, const QuotePricer& pricer,
               const ITimeProvider& time_provider, ITimer& timer,
               domain::StrategyParams params = {}, EventBus* bus = nullptr);

  StrategyLoop(const StrategyLoop&) = delete;
  StrategyLoop& operator=(const StrategyLoop&) = delete;

  // -------------------------------------------------------------------------
  // run(instrument, risk_amount, max_spread, duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Idle → Running → WindingDown → Done. Blocks for the duration.
  //
  // @param  risk_amount  Notional per cycle; each side quotes risk_amount/2.
  // @param  max_spread   Offset from mid on each side, in price units.
  // @param  duration_ms  Hard bound on the Running phase. A deadline past
  //                      the end of the clock saturates: the loop then runs
  //                      until stop().
  //
  // @return Counters for the run. If the loop is not Idle the run is
  //         refused and the summary has started == false.
  // -------------------------------------------------------------------------
  RunSummary run(const domain::Instrument& instrument, double risk_amount,
                 double max_spread, std::int64_t duration_ms);

  void stop();

  domain::StrategyState state() const { return state_.load(); }

  // Called on the strategy thread after each completed quoting cycle.
  void setCycleObserver(CycleObserver observer);

  static double roundToCents(double price);
  static double buyPrice(double mid, double max_spread);
  static double sellPrice(double mid, double max_spread);

  // now + duration, saturating at INT64_MAX. Non-positive durations give now.
  static std::int64_t deadlineFrom(std::int64_t now_ms, std::int64_t duration_ms);

 private:
  struct RunState {
    domain::Instrument instrument;
    double size{0.0};
    double max_spread{0.0};
    std::int64_t deadline_ms{0};
    std::optional<domain::OrderId> active_buy;
    std::optional<domain::OrderId> active_sell;
    RunSummary summary;
  };

  // One quoting cycle. Returns false if the book could not be priced.
  bool runCycle(RunState& rs);

  // Cancels the quote in slot; clears slot only on a confirmed cancel.
  void retireQuote(RunState& rs, std::optional<domain::OrderId>& slot);

  // Resolves a quote whose cancel was not confirmed. Returns true if the
  // side is now clear for a replacement.
  bool resolveUnconfirmed(RunState& rs, std::optional<domain::OrderId>& slot);

  enum class SideOutcome { Placed, Held, Failed };

  // Clears the side if its old quote is gone, then places the new one.
  SideOutcome requote(RunState& rs, domain::Side side, double price,
                      std::optional<domain::OrderId>& slot);

  // Returns false if the exchange rejected the quote.
  bool placeQuote(RunState& rs, domain::Side side, double price,
                  std::optional<domain::OrderId>& slot);

  static const char* toString(SideOutcome outcome);

  void windDown(RunState& rs);

  // Sleeps min(interval_ms, time left). Returns false if cancelled.
  bool sleepWithinDeadline(const RunState& rs, std::int64_t interval_ms);

  void setState(const domain::Instrument& instrument,
                domain::StrategyState next);

  OrderManager& orders_;
  const QuotePricer& pricer_;
  const ITimeProvider& time_provider_;
  ITimer& timer_;
  const domain::StrategyParams params_;
  EventBus* bus_;
  CycleObserver cycle_observer_;

  std::atomic<domain::StrategyState> state_{domain::StrategyState::Idle};
};

}  // namespace pmm
