#pragma once

#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order.hpp"
#include "pmm/domain/strategy_params.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// ConfigError - invalid or unreadable engine configuration
// -----------------------------------------------------------------------------
// what() names the offending field, e.g. "runs[0].risk_amount: must be > 0".
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error(message) {}
};

struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  // Both endpoints empty → no IPC server.
  bool enabled() const {
    return !command_endpoint.empty() && !telemetry_endpoint.empty();
  }
};

// One market-making run: an instrument and the run() arguments.
struct RunConfig {
  domain::Instrument instrument;
  double risk_amount{0.0};
  double max_spread{0.03};
  double duration_minutes{60.0};

  // One year. Longer runs are better expressed as a STOP command.
  static constexpr double kMaxDurationMinutes = 60.0 * 24.0 * 365.0;
};

// Third-party liquidity placed in the paper book at startup.
struct SeedOrderConfig {
  domain::Instrument instrument;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double size{0.0};
};

struct PaperConfig {
  std::string account_address{"0xpaper"};
  double min_order_size{5.0};
  double rewards_total{0.0};
  std::vector<SeedOrderConfig> book;
  std::vector<domain::MarketDescriptor> markets;
};

// -----------------------------------------------------------------------------
// EngineConfig - everything pmm_engine reads at startup
// -----------------------------------------------------------------------------
//
// @details
// File layout (JSON). Every top-level object is optional except "runs".
//
//   {
//     "ipc":      {"command_endpoint": "...", "telemetry_endpoint": "..."},
//     "strategy": {"refresh_interval_ms": 30000, "error_backoff_ms": 5000,
//                  "fee_rate_bps": 0, "pnl_snapshot_every_cycles": 1},
//     "runs":     [{"market_id": "...", "token_id": "...",
//                   "risk_amount": 100, "max_spread": 0.03,
//                   "duration_minutes": 60}],
//     "paper":    {"account_address": "0xpaper", "min_order_size": 5,
//                  "rewards_total": 0,
//                  "book": [{"market_id": "...", "token_id": "...",
//                            "side": "buy", "price": 0.45, "size": 100}],
//                  "markets": [{"condition_id": "...",
//                               "tokens": [{"token_id": "...",
//                                           "outcome": "Yes"}],
//                               "rewards": {"min_size": 5,
//                                           "max_spread": 3.5},
//                               "active": true, "closed": false}]}
//   }
//
// Validation (ConfigError on failure):
//   runs                     non-empty array
//   market_id, token_id      non-empty strings
//   risk_amount              > 0
//   max_spread               >= 0 and < 1
//   duration_minutes         > 0 and <= RunConfig::kMaxDurationMinutes
//   refresh_interval_ms,
//   error_backoff_ms         > 0
//   fee_rate_bps             >= 0
//   book[].side              "buy" or "sell" (case-insensitive)
//   book[].price             in [0.01, 0.99]; book[].size > 0
//   min_order_size           > 0
// A JSON value of the wrong type is reported the same way.
// -----------------------------------------------------------------------------
struct EngineConfig {
  IpcConfig ipc;
  domain::StrategyParams strategy;
  std::vector<RunConfig> runs;
  PaperConfig paper;
};

// Parses and validates an already-decoded JSON document.
EngineConfig parseEngineConfig(const nlohmann::json& document);

// Reads the file at path, decodes it and calls parseEngineConfig().
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace pmm
