#include "pmm/config/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <string>
#include <utility>

namespace pmm {

namespace {

using nlohmann::json;

[[noreturn]] void fail(const std::string& where, const std::string& what) {
  throw ConfigError(where + ": " + what);
}

const json* member(const json& object, const char* key) {
  auto it = object.find(key);
  return it != object.end() ? &*it : nullptr;
}

const json& requireObject(const json& value, const std::string& where) {
  if (!value.is_object()) {
    fail(where, "expected an object");
  }
  return value;
}

std::string requireString(const json& object, const char* key,
                          const std::string& where) {
  const json* value = member(object, key);
  if (value == nullptr) {
    fail(where + "." + key, "missing");
  }
  if (!value->is_string() || value->get<std::string>().empty()) {
    fail(where + "." + key, "expected a non-empty string");
  }
  return value->get<std::string>();
}

std::string optionalString(const json& object, const char* key,
                           const std::string& where, std::string fallback) {
  const json* value = member(object, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_string()) {
    fail(where + "." + key, "expected a string");
  }
  return value->get<std::string>();
}

double number(const json& object, const char* key, const std::string& where,
              double fallback, bool required = false) {
  const json* value = member(object, key);
  if (value == nullptr) {
    if (required) {
      fail(where + "." + key, "missing");
    }
    return fallback;
  }
  if (!value->is_number()) {
    fail(where + "." + key, "expected a number");
  }
  double result = value->get<double>();
  if (!std::isfinite(result)) {
    fail(where + "." + key, "expected a finite number");
  }
  return result;
}

std::int64_t integer(const json& object, const char* key,
                     const std::string& where, std::int64_t fallback) {
  const json* value = member(object, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_number_integer()) {
    fail(where + "." + key, "expected an integer");
  }
  return value->get<std::int64_t>();
}

bool boolean(const json& object, const char* key, const std::string& where,
             bool fallback) {
  const json* value = member(object, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_boolean()) {
    fail(where + "." + key, "expected true or false");
  }
  return value->get<bool>();
}

domain::Side parseSide(const json& object, const std::string& where) {
  std::string side = requireString(object, "side", where);
  std::transform(side.begin(), side.end(), side.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (side == "buy") {
    return domain::Side::Buy;
  }
  if (side == "sell") {
    return domain::Side::Sell;
  }
  fail(where + ".side", "expected \"buy\" or \"sell\"");
}

domain::Instrument parseInstrument(const json& object,
                                   const std::string& where) {
  domain::Instrument instrument;
  instrument.market_id = requireString(object, "market_id", where);
  instrument.token_id = requireString(object, "token_id", where);
  return instrument;
}

// -----------------------------------------------------------------------------
// Sections
// -----------------------------------------------------------------------------
IpcConfig parseIpc(const json& object) {
  requireObject(object, "ipc");
  IpcConfig ipc;
  ipc.command_endpoint = optionalString(object, "command_endpoint", "ipc",
                                        ipc.command_endpoint);
  ipc.telemetry_endpoint = optionalString(object, "telemetry_endpoint", "ipc",
                                          ipc.telemetry_endpoint);
  return ipc;
}

domain::StrategyParams parseStrategy(const json& object) {
  requireObject(object, "strategy");
  domain::StrategyParams params;

  params.refresh_interval_ms = integer(object, "refresh_interval_ms",
                                       "strategy", params.refresh_interval_ms);
  if (params.refresh_interval_ms <= 0) {
    fail("strategy.refresh_interval_ms", "must be > 0");
  }

  params.error_backoff_ms =
      integer(object, "error_backoff_ms", "strategy", params.error_backoff_ms);
  if (params.error_backoff_ms <= 0) {
    fail("strategy.error_backoff_ms", "must be > 0");
  }

  std::int64_t fee =
      integer(object, "fee_rate_bps", "strategy", params.fee_rate_bps);
  if (fee < 0 || fee > 10000) {
    fail("strategy.fee_rate_bps", "must be within [0, 10000]");
  }
  params.fee_rate_bps = static_cast<int>(fee);

  std::int64_t every = integer(object, "pnl_snapshot_every_cycles", "strategy",
                               static_cast<std::int64_t>(
                                   params.pnl_snapshot_every_cycles));
  if (every < 0) {
    fail("strategy.pnl_snapshot_every_cycles", "must be >= 0");
  }
  params.pnl_snapshot_every_cycles = static_cast<std::uint64_t>(every);
  return params;
}

RunConfig parseRun(const json& object, const std::string& where) {
  requireObject(object, where);
  RunConfig run;
  run.instrument = parseInstrument(object, where);

  run.risk_amount = number(object, "risk_amount", where, 0.0, true);
  if (run.risk_amount <= 0.0) {
    fail(where + ".risk_amount", "must be > 0");
  }

  run.max_spread = number(object, "max_spread", where, run.max_spread);
  if (run.max_spread < 0.0 || run.max_spread >= 1.0) {
    fail(where + ".max_spread", "must be within [0, 1)");
  }

  run.duration_minutes =
      number(object, "duration_minutes", where, run.duration_minutes);
  if (run.duration_minutes <= 0.0) {
    fail(where + ".duration_minutes", "must be > 0");
  }
  if (run.duration_minutes > RunConfig::kMaxDurationMinutes) {
    const auto limit = static_cast<long long>(RunConfig::kMaxDurationMinutes);
    fail(where + ".duration_minutes", "must be <= " + std::to_string(limit));
  }
  return run;
}

domain::MarketDescriptor parseMarket(const json& object,
                                     const std::string& where) {
  requireObject(object, where);
  domain::MarketDescriptor market;
  market.condition_id = requireString(object, "condition_id", where);
  market.active = boolean(object, "active", where, market.active);
  market.closed = boolean(object, "closed", where, market.closed);

  if (const json* tokens = member(object, "tokens")) {
    if (!tokens->is_array()) {
      fail(where + ".tokens", "expected an array");
    }
    for (std::size_t i = 0; i < tokens->size(); ++i) {
      const std::string token_where =
          where + ".tokens[" + std::to_string(i) + "]";
      const json& token = requireObject((*tokens)[i], token_where);
      domain::OutcomeToken outcome;
      outcome.token_id = requireString(token, "token_id", token_where);
      outcome.outcome = optionalString(token, "outcome", token_where, "");
      market.tokens.push_back(std::move(outcome));
    }
  }

  if (const json* rewards = member(object, "rewards")) {
    const std::string rewards_where = where + ".rewards";
    requireObject(*rewards, rewards_where);
    market.rewards.min_size = number(*rewards, "min_size", rewards_where, 0.0);
    market.rewards.max_spread =
        number(*rewards, "max_spread", rewards_where, 0.0);
  }
  return market;
}

PaperConfig parsePaper(const json& object) {
  requireObject(object, "paper");
  PaperConfig paper;
  paper.account_address = optionalString(object, "account_address", "paper",
                                         paper.account_address);
  paper.min_order_size =
      number(object, "min_order_size", "paper", paper.min_order_size);
  if (paper.min_order_size <= 0.0) {
    fail("paper.min_order_size", "must be > 0");
  }
  paper.rewards_total =
      number(object, "rewards_total", "paper", paper.rewards_total);

  if (const json* book = member(object, "book")) {
    if (!book->is_array()) {
      fail("paper.book", "expected an array");
    }
    for (std::size_t i = 0; i < book->size(); ++i) {
      const std::string where = "paper.book[" + std::to_string(i) + "]";
      const json& entry = requireObject((*book)[i], where);
      SeedOrderConfig seed;
      seed.instrument = parseInstrument(entry, where);
      seed.side = parseSide(entry, where);
      seed.price = number(entry, "price", where, 0.0, true);
      if (seed.price < 0.01 || seed.price > 0.99) {
        fail(where + ".price", "must be within [0.01, 0.99]");
      }
      seed.size = number(entry, "size", where, 0.0, true);
      if (seed.size <= 0.0) {
        fail(where + ".size", "must be > 0");
      }
      paper.book.push_back(std::move(seed));
    }
  }

  if (const json* markets = member(object, "markets")) {
    if (!markets->is_array()) {
      fail("paper.markets", "expected an array");
    }
    for (std::size_t i = 0; i < markets->size(); ++i) {
      paper.markets.push_back(parseMarket(
          (*markets)[i], "paper.markets[" + std::to_string(i) + "]"));
    }
  }
  return paper;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document) {
  requireObject(document, "config");
  EngineConfig config;

  if (const json* ipc = member(document, "ipc")) {
    config.ipc = parseIpc(*ipc);
  }
  if (const json* strategy = member(document, "strategy")) {
    config.strategy = parseStrategy(*strategy);
  }
  if (const json* paper = member(document, "paper")) {
    config.paper = parsePaper(*paper);
  }

  const json* runs = member(document, "runs");
  if (runs == nullptr) {
    fail("runs", "missing");
  }
  if (!runs->is_array() || runs->empty()) {
    fail("runs", "expected a non-empty array");
  }
  for (std::size_t i = 0; i < runs->size(); ++i) {
    config.runs.push_back(
        parseRun((*runs)[i], "runs[" + std::to_string(i) + "]"));
  }
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  json document;
  try {
    in >> document;
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return parseEngineConfig(document);
}

}  // namespace pmm
