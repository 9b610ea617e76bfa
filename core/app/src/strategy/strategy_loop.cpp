#include "pmm/strategy/strategy_loop.hpp"
#include "pmm/events/strategy_state_event.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <utility>

namespace pmm {

StrategyLoop::StrategyLoop(OrderManager& orders, const QuotePricer& pricer,
                           const ITimeProvider& time_provider, ITimer& timer,
                           domain::StrategyParams params, EventBus* bus)
    : orders_(orders),
      pricer_(pricer),
      time_provider_(time_provider),
      timer_(timer),
      params_(params),
      bus_(bus) {}

void StrategyLoop::setCycleObserver(CycleObserver observer) {
  cycle_observer_ = std::move(observer);
}

// -----------------------------------------------------------------------------
// Deadline and quote arithmetic
// -----------------------------------------------------------------------------
std::int64_t StrategyLoop::deadlineFrom(std::int64_t now_ms,
                                        std::int64_t duration_ms) {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  if (duration_ms <= 0) {
    return now_ms;
  }
  if (now_ms > 0 && duration_ms >= kMax - now_ms) {
    return kMax;
  }
  return now_ms + duration_ms;
}

double StrategyLoop::roundToCents(double price) {
  return std::round(price * 100.0) / 100.0;
}

double StrategyLoop::buyPrice(double mid, double max_spread) {
  return std::max(OrderManager::kMinPrice, roundToCents(mid - max_spread));
}

double StrategyLoop::sellPrice(double mid, double max_spread) {
  return std::min(OrderManager::kMaxPrice, roundToCents(mid + max_spread));
}

// -----------------------------------------------------------------------------
// run: Idle → Running → WindingDown → Done
// -----------------------------------------------------------------------------
RunSummary StrategyLoop::run(const domain::Instrument& instrument,
                             double risk_amount, double max_spread,
                             std::int64_t duration_ms) {
  if (state_.load() != domain::StrategyState::Idle) {
    std::cerr << "[StrategyLoop] run() refused for " << instrument
              << ": loop is " << domain::toString(state_.load()) << "\n";
    RunSummary refused;
    refused.final_state = state_.load();
    return refused;
  }

  RunState rs;
  rs.instrument = instrument;
  rs.size = risk_amount / 2.0;
  rs.max_spread = max_spread;
  rs.deadline_ms = deadlineFrom(time_provider_.now_ms(), duration_ms);
  rs.summary.started = true;

  setState(instrument, domain::StrategyState::Running);
  std::cout << "[StrategyLoop] Starting market making on " << instrument
            << " for " << duration_ms << " ms (risk " << risk_amount
            << ", spread " << max_spread << ")\n";

  while (!timer_.cancelled() && time_provider_.now_ms() < rs.deadline_ms) {
    bool ok = false;
    try {
      ok = runCycle(rs);
    } catch (const std::exception& e) {
      std::cerr << "[StrategyLoop] Error in market making loop: " << e.what()
                << "\n";
      ok = false;
    }

    if (!ok) {
      ++rs.summary.failed_cycles;
      if (!sleepWithinDeadline(rs, params_.error_backoff_ms)) {
        break;
      }
      continue;
    }

    ++rs.summary.cycles;
    if (cycle_observer_) {
      cycle_observer_(instrument, rs.summary.cycles);
    }
    if (!sleepWithinDeadline(rs, params_.refresh_interval_ms)) {
      break;
    }
  }

  rs.summary.stopped_early =
      timer_.cancelled() && time_provider_.now_ms() < rs.deadline_ms;

  setState(instrument, domain::StrategyState::WindingDown);
  windDown(rs);
  setState(instrument, domain::StrategyState::Done);

  std::cout << "[StrategyLoop] Market making completed on " << instrument
            << ": " << rs.summary.cycles << " cycles, "
            << rs.summary.failed_cycles << " failed, " << rs.summary.placed
            << " orders placed\n";

  rs.summary.final_state = domain::StrategyState::Done;
  return rs.summary;
}

void StrategyLoop::stop() {
  timer_.cancel();
}

// -----------------------------------------------------------------------------
// runCycle: price, retire, requote
// -----------------------------------------------------------------------------
bool StrategyLoop::runCycle(RunState& rs) {
  auto quote = pricer_.quote(rs.instrument);
  if (!quote) {
    std::cerr << "[StrategyLoop] Cannot price " << rs.instrument << ": "
              << quote.error().message << ". Backing off.\n";
    return false;
  }
  const double mid = quote.value().mid;

  retireQuote(rs, rs.active_buy);
  retireQuote(rs, rs.active_sell);

  const double buy = buyPrice(mid, rs.max_spread);
  const double sell = sellPrice(mid, rs.max_spread);

  const SideOutcome buy_outcome =
      requote(rs, domain::Side::Buy, buy, rs.active_buy);
  const SideOutcome sell_outcome =
      requote(rs, domain::Side::Sell, sell, rs.active_sell);

  std::cout << "[StrategyLoop] Quotes for " << rs.instrument << " at mid "
            << mid << ": BUY @ " << buy << " " << toString(buy_outcome)
            << ", SELL @ " << sell << " " << toString(sell_outcome) << "\n";
  return true;
}

StrategyLoop::SideOutcome StrategyLoop::requote(
    RunState& rs, domain::Side side, double price,
    std::optional<domain::OrderId>& slot) {
  if (slot && !resolveUnconfirmed(rs, slot)) {
    ++rs.summary.held_sides;
    return SideOutcome::Held;
  }
  return placeQuote(rs, side, price, slot) ? SideOutcome::Placed
                                           : SideOutcome::Failed;
}

const char* StrategyLoop::toString(SideOutcome outcome) {
  switch (outcome) {
    case SideOutcome::Placed:
      return "placed";
    case SideOutcome::Held:
      return "held";
    case SideOutcome::Failed:
      return "failed";
  }
  return "?";
}

void StrategyLoop::retireQuote(RunState& rs,
                               std::optional<domain::OrderId>& slot) {
  if (!slot) {
    return;
  }
  auto outcome = orders_.cancel(*slot);
  if (outcome && outcome.value() == CancelOutcome::Confirmed) {
    ++rs.summary.cancel_confirmed;
    slot.reset();
    return;
  }
  if (!outcome && outcome.error().kind != ErrorKind::External) {
    // NotFound / InvalidArgument: the registry no longer considers it resting.
    slot.reset();
    return;
  }
  ++rs.summary.cancel_unconfirmed;
}

bool StrategyLoop::resolveUnconfirmed(RunState& rs,
                                      std::optional<domain::OrderId>& slot) {
  auto resolved = orders_.reconcile(rs.instrument);
  if (!resolved) {
    std::cerr << "[StrategyLoop] Holding quote " << *slot << " on "
              << rs.instrument << ": " << resolved.error().message << "\n";
    return false;
  }
  rs.summary.reconciled += resolved.value();

  auto current = orders_.order(*slot);
  if (!current || OrderManager::isTerminal(current->status)) {
    slot.reset();
    return true;
  }

  std::cerr << "[StrategyLoop] Quote " << *slot << " still "
            << domain::toString(current->status) << " on " << rs.instrument
            << "; not replacing this cycle\n";
  return false;
}

bool StrategyLoop::placeQuote(RunState& rs, domain::Side side, double price,
                              std::optional<domain::OrderId>& slot) {
  auto id = orders_.place(rs.instrument, side, rs.size, price,
                          params_.fee_rate_bps);
  if (!id) {
    ++rs.summary.placement_failures;
    return false;
  }
  ++rs.summary.placed;
  slot = id.value();
  return true;
}

// -----------------------------------------------------------------------------
// windDown: cancel, reconcile, retry once
// -----------------------------------------------------------------------------
void StrategyLoop::windDown(RunState& rs) {
  for (auto* slot : {&rs.active_buy, &rs.active_sell}) {
    retireQuote(rs, *slot);
  }

  if (!rs.active_buy && !rs.active_sell) {
    return;
  }

  for (auto* slot : {&rs.active_buy, &rs.active_sell}) {
    if (!*slot) {
      continue;
    }
    if (resolveUnconfirmed(rs, *slot)) {
      continue;
    }
    auto current = orders_.order(**slot);
    if (current && current->status == domain::OrderStatus::Live) {
      retireQuote(rs, *slot);
    }
  }

  for (const auto* slot : {&rs.active_buy, &rs.active_sell}) {
    if (*slot) {
      ++rs.summary.left_resting;
      std::cerr << "[StrategyLoop] ERROR: order " << **slot
                << " may still be resting on " << rs.instrument
                << " after wind-down\n";
    }
  }
}

// -----------------------------------------------------------------------------
// Scheduling and state
// -----------------------------------------------------------------------------
bool StrategyLoop::sleepWithinDeadline(const RunState& rs,
                                       std::int64_t interval_ms) {
  std::int64_t remaining = rs.deadline_ms - time_provider_.now_ms();
  if (remaining <= 0) {
    return !timer_.cancelled();
  }
  return timer_.sleepFor(std::min(interval_ms, remaining));
}

void StrategyLoop::setState(const domain::Instrument& instrument,
                            domain::StrategyState next) {
  domain::StrategyState previous = state_.exchange(next);
  if (bus_ == nullptr) {
    return;
  }
  StrategyStateEvent event;
  event.instrument = instrument;
  event.state = next;
  event.previous_state = previous;
  event.timestamp_ms = time_provider_.now_ms();
  bus_->publish(event);
}

}  // namespace pmm
