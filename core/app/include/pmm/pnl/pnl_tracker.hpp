#pragma once

#include "pmm/domain/pnl_snapshot.hpp"
#include "pmm/domain/trade.hpp"
#include "pmm/eventbus/event_bus.hpp"
#include "pmm/exchange/i_exchange_client.hpp"
#include "pmm/exchange/i_rewards_source.hpp"
#include "pmm/time/i_time_provider.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// PnlTracker - realized PnL from confirmed fills, plus reward earnings
// -----------------------------------------------------------------------------
//
// @brief  Pulls the account's trade history on demand, reduces it to a
//         PnlSnapshot and appends the snapshot to an append-only history.
//
// @details
// PnL math (binary-outcome settlement, a winning token resolves to 1):
//
//   For each trade with status Confirmed:
//     Buy  → cost    += size * price,        buy_volume  += size
//     Sell → revenue += size * (1 - price),  sell_volume += size
//   Any other status is ignored.
//
//   realized_pnl = revenue - cost
//   total_pnl    = realized_pnl + rewards
//
// Example: buy 10 @ 0.40 and sell 10 @ 0.70, both Confirmed:
//   realized_pnl = 10 * 0.30 - 10 * 0.40 = -1.0
//
// The trade list is re-read in full on every snapshot; nothing is
// accumulated between calls, so a snapshot with no new trades repeats the
// previous realized_pnl exactly.
//
// History invariants:
//   - Append-only. Entries are never edited or removed.
//   - Timestamps strictly increase. If the clock has not moved since the
//     last snapshot, the new one is stamped last + 1 ms.
//
// Failure policy:
//   If the account address, the trade list or the rewards total cannot be
//   retrieved, snapshot() logs and returns nullopt; history is unchanged.
//
// Thread model:
//   snapshot() may be called from any thread (strategy threads after a
//   cycle, the IPC thread on a PNL command). Appends take a unique_lock on
//   history_mutex_; history() and latest() take a shared_lock. Exchange
//   calls are made without holding the lock.
// -----------------------------------------------------------------------------
class PnlTracker {
 public:
  PnlTracker(IExchangeClient& client, IRewardsSource& rewards,
             const ITimeProvider& time_provider, EventBus* bus = nullptr);

  PnlTracker(const PnlTracker&) = delete;
  PnlTracker& operator=(const PnlTracker&) = delete;
  PnlTracker(PnlTracker&&) = delete;
  PnlTracker& operator=(PnlTracker&&) = delete;

  // Computes and appends a snapshot. nullopt on retrieval failure.
  std::optional<domain::PnlSnapshot> snapshot();

  // Copy of the full history, oldest first.
  std::vector<domain::PnlSnapshot> history() const;

  std::optional<domain::PnlSnapshot> latest() const;

  std::size_t historySize() const;

  // Pure reduction of a trade list (timestamp and rewards left at 0).
  static domain::PnlSnapshot computeRealized(
      const std::vector<domain::Trade>& trades);

 private:
  IExchangeClient& client_;
  IRewardsSource& rewards_;
  const ITimeProvider& time_provider_;
  EventBus* bus_;

  mutable std::shared_mutex history_mutex_;
  std::vector<domain::PnlSnapshot> history_;
};

}  // namespace pmm
