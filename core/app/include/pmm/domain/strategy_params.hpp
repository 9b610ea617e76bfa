#pragma once

#include <cstdint>

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyParams - scheduling and order parameters shared by every run
// -----------------------------------------------------------------------------
//
// @brief  Fixed for the lifetime of a StrategyLoop. Per-run values
//         (instrument, risk amount, spread, duration) are arguments of
//         StrategyLoop::run() instead.
//
// @details
// Loaded from the "strategy" object of the engine's JSON configuration;
// the defaults below apply to any field the file omits.
//
//   refresh_interval_ms        Sleep between successful cycles.
//   error_backoff_ms           Sleep after a failed cycle (pricing error or
//                              unexpected exception) before retrying.
//   fee_rate_bps               Passed through on every placement.
//   pnl_snapshot_every_cycles  Engine takes a PnL snapshot after every Nth
//                              completed cycle of each run; 0 disables.
// -----------------------------------------------------------------------------
struct StrategyParams {
  std::int64_t refresh_interval_ms{30000};
  std::int64_t error_backoff_ms{5000};
  int fee_rate_bps{0};
  std::uint64_t pnl_snapshot_every_cycles{1};
};

}  // namespace domain
}  // namespace pmm
