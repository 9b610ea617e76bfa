#pragma once

#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order.hpp"
#include "pmm/domain/trade.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// ExchangeError
// -----------------------------------------------------------------------------
// Thrown by IExchangeClient implementations for transport, authentication
// or exchange-side logic failures. The core catches it (and any other
// std::exception) at the call site and converts it into pmm::Error.
// -----------------------------------------------------------------------------
class ExchangeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// Wire-independent request / response shapes
// -----------------------------------------------------------------------------

// Limit order submission. Time in force is always good-till-cancel.
struct OrderSpec {
  domain::Instrument instrument;
  domain::Side side{domain::Side::Buy};
  double size{0.0};
  double price{0.0};
  int fee_rate_bps{0};
};

// A resting order from any market participant, as listed by the exchange.
struct OpenOrder {
  domain::OrderId id;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double size{0.0};
};

// canceled: ids the exchange confirms as canceled.
// not_canceled: id → reason for every id the exchange refused to cancel.
struct CancelResponse {
  std::vector<domain::OrderId> canceled;
  std::map<domain::OrderId, std::string> not_canceled;
};

// Trades where maker_address was the maker. Empty address means "all of
// the authenticated account's trades".
struct TradeFilter {
  std::string maker_address;
};

// -----------------------------------------------------------------------------
// IExchangeClient - narrow contract onto the exchange API client
// -----------------------------------------------------------------------------
//
// @brief  Everything the quoting core needs from the exchange. Signing, HTTP
//         transport and authentication live behind this interface.
//
// @details
// Failure reporting: every method may throw (ExchangeError or any
// std::exception). Callers in the core must treat each throw as a
// recoverable, reportable failure.
//
// Thread model:
//   Implementations MUST be safe for concurrent use. The engine runs one
//   StrategyLoop per instrument, each on its own thread, and all of them
//   share one client instance.
//
// Ownership:
//   Components hold a reference; the process (main() or a test fixture)
//   owns the client and keeps it alive for longer than the engine.
// -----------------------------------------------------------------------------
class IExchangeClient {
 public:
  virtual ~IExchangeClient() = default;

  // Places a GTC limit order. Returns the exchange-assigned order id.
  virtual domain::OrderId submitOrder(const OrderSpec& spec) = 0;

  virtual CancelResponse cancelOrder(const domain::OrderId& id) = 0;

  // All open orders (every participant) for one outcome token.
  virtual std::vector<OpenOrder> listOpenOrders(const std::string& market_id,
                                                const std::string& asset_id) = 0;

  virtual std::vector<domain::Trade> listTrades(const TradeFilter& filter) = 0;

  virtual std::string accountAddress() = 0;

  // Minimum order size the exchange accepts for the given market.
  virtual double minOrderSize(const std::string& market_id) = 0;
};

}  // namespace pmm
