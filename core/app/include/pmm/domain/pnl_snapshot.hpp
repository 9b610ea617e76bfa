#pragma once

#include <cstddef>
#include <cstdint>

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// PnlSnapshot - one point of the PnL history
// -----------------------------------------------------------------------------
//
// @brief  Realized PnL, reward earnings and their total at a point in time,
//         plus the fill volumes they were computed from.
//
// @details
// realized_pnl is computed only from Confirmed fills, against a binary
// settlement convention (a winning outcome resolves to 1):
//
//   cost    = Σ size * price          over confirmed buys
//   revenue = Σ size * (1 - price)    over confirmed sells
//   realized_pnl = revenue - cost
//   total_pnl    = realized_pnl + rewards
//
// Snapshots are value types. The PnlTracker appends them to its history and
// never rewrites an appended entry.
// -----------------------------------------------------------------------------
struct PnlSnapshot {
  std::int64_t timestamp_ms{0};
  double realized_pnl{0.0};
  double rewards{0.0};
  double total_pnl{0.0};
  double buy_volume{0.0};
  double sell_volume{0.0};
  std::size_t confirmed_trades{0};
};

}  // namespace domain
}  // namespace pmm
