#include "pmm/pnl/pnl_tracker.hpp"
#include "pmm/events/pnl_snapshot_event.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

namespace pmm {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PnlTracker::PnlTracker(IExchangeClient& client, IRewardsSource& rewards,
                       const ITimeProvider& time_provider, EventBus* bus)
    : client_(client),
      rewards_(rewards),
      time_provider_(time_provider),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// computeRealized: confirmed-trade reduction
// -----------------------------------------------------------------------------
domain::PnlSnapshot PnlTracker::computeRealized(
    const std::vector<domain::Trade>& trades) {
  double cost = 0.0;
  double revenue = 0.0;

  domain::PnlSnapshot snap;
  for (const auto& trade : trades) {
    if (trade.status != domain::TradeStatus::Confirmed) {
      continue;
    }
    if (trade.side == domain::Side::Buy) {
      cost += trade.size * trade.price;
      snap.buy_volume += trade.size;
    } else {
      revenue += trade.size * (1.0 - trade.price);
      snap.sell_volume += trade.size;
    }
    ++snap.confirmed_trades;
  }

  snap.realized_pnl = revenue - cost;
  snap.total_pnl = snap.realized_pnl;
  return snap;
}

// -----------------------------------------------------------------------------
// snapshot: retrieve, reduce, append, publish
// -----------------------------------------------------------------------------
std::optional<domain::PnlSnapshot> PnlTracker::snapshot() {
  std::vector<domain::Trade> trades;
  double rewards = 0.0;
  try {
    TradeFilter filter;
    filter.maker_address = client_.accountAddress();
    trades = client_.listTrades(filter);
    rewards = rewards_.rewardsTotal();
  } catch (const std::exception& e) {
    std::cerr << "[PnlTracker] Error calculating P&L: " << e.what() << "\n";
    return std::nullopt;
  }

  domain::PnlSnapshot snap = computeRealized(trades);
  snap.rewards = rewards;
  snap.total_pnl = snap.realized_pnl + rewards;

  std::size_t size = 0;
  {
    std::unique_lock lock(history_mutex_);
    std::int64_t now = time_provider_.now_ms();
    snap.timestamp_ms = history_.empty()
                            ? now
                            : std::max(now, history_.back().timestamp_ms + 1);
    history_.push_back(snap);
    size = history_.size();
  }

  if (bus_ != nullptr) {
    PnlSnapshotEvent event;
    event.snapshot = snap;
    event.history_size = size;
    bus_->publish(event);
  }
  return snap;
}

// -----------------------------------------------------------------------------
// Read accessors (shared lock)
// -----------------------------------------------------------------------------
std::vector<domain::PnlSnapshot> PnlTracker::history() const {
  std::shared_lock lock(history_mutex_);
  return history_;
}

std::optional<domain::PnlSnapshot> PnlTracker::latest() const {
  std::shared_lock lock(history_mutex_);
  if (history_.empty()) {
    return std::nullopt;
  }
  return history_.back();
}

std::size_t PnlTracker::historySize() const {
  std::shared_lock lock(history_mutex_);
  return history_.size();
}

}  // namespace pmm
