#pragma once

#include "pmm/concurrent/order_id_generator.hpp"
#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order.hpp"
#include "pmm/domain/trade.hpp"
#include "pmm/exchange/i_exchange_client.hpp"
#include "pmm/exchange/i_market_catalog.hpp"
#include "pmm/time/i_time_provider.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// PaperExchange - deterministic in-process exchange for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  Implements IExchangeClient and IMarketCatalog against an in-memory
//         limit order book, so the quoting core can run end to end without a
//         network client.
//
// @details
// Book model:
//   - Third-party liquidity is seeded with seedOrder().
//   - Our orders (submitOrder) rest on the same book. A submission that
//     crosses seeded liquidity fills immediately at the resting price, up to
//     the available size; any remainder rests. Each such fill is recorded
//     as a Confirmed trade of ours.
//   - fillOrder() simulates a taker lifting one of our resting orders.
//
// Exchange rules enforced on submission (ExchangeError otherwise):
//   price within [0.01, 0.99], size >= the market's minimum order size.
//
// Failure injection:
//   failNext(op, n) makes the next n calls of that operation throw
//   ExchangeError. refuseNextCancels(n) makes the next n cancels leave the
//   order resting and report it under not_canceled, which is how tests
//   produce an unconfirmed cancel.
//
// Thread model:
//   Every public method takes the single internal mutex. Safe for the
//   concurrent strategy threads the engine runs.
//
// Ownership:
//   Holds a const reference to the ITimeProvider used for trade and order
//   timestamps. Owned by main() or the test fixture.
// -----------------------------------------------------------------------------
class PaperExchange final : public IExchangeClient, public IMarketCatalog {
 public:
  enum class Operation {
    SubmitOrder,
    CancelOrder,
    ListOpenOrders,
    ListTrades,
    AccountAddress,
    MinOrderSize,
    ActiveMarkets,
  };

  explicit PaperExchange(const ITimeProvider& time_provider,
                         std::string account_address = "0xpaper",
                         double default_min_order_size = 5.0);

  PaperExchange(const PaperExchange&) = delete;
  PaperExchange& operator=(const PaperExchange&) = delete;

  // --- IExchangeClient ------------------------------------------------------
  domain::OrderId submitOrder(const OrderSpec& spec) override;
  CancelResponse cancelOrder(const domain::OrderId& id) override;
  std::vector<OpenOrder> listOpenOrders(const std::string& market_id,
                                        const std::string& asset_id) override;
  std::vector<domain::Trade> listTrades(const TradeFilter& filter) override;
  std::string accountAddress() override;
  double minOrderSize(const std::string& market_id) override;

  // --- IMarketCatalog -------------------------------------------------------
  std::vector<domain::MarketDescriptor> activeMarkets() override;

  // --- Simulation hooks -----------------------------------------------------

  // Adds third-party resting liquidity. Returns its id.
  domain::OrderId seedOrder(const domain::Instrument& instrument,
                            domain::Side side, double price, double size);

  void addMarket(domain::MarketDescriptor market);

  void setMinOrderSize(const std::string& market_id, double size);

  // A taker trades against one of OUR resting orders. Reduces (or removes)
  // the resting order and records a trade with the given status. Returns
  // false if the id is not one of our resting orders.
  bool fillOrder(const domain::OrderId& id, double size,
                 domain::TradeStatus status = domain::TradeStatus::Confirmed);

  // Appends an arbitrary trade to our trade history.
  void recordTrade(domain::Trade trade);

  void failNext(Operation op, int count = 1,
                std::string message = "injected exchange failure");

  void refuseNextCancels(int count,
                         std::string reason = "cancel not acknowledged");

  // --- Inspection -----------------------------------------------------------
  bool isResting(const domain::OrderId& id) const;

  // Number of our own orders resting for the instrument.
  std::size_t ownRestingCount(const domain::Instrument& instrument) const;

  // Every spec passed to submitOrder(), accepted or not, in call order.
  std::vector<OrderSpec> submissions() const;

  std::size_t cancelRequests() const;

 private:
  struct RestingOrder {
    domain::OrderId id;
    domain::Instrument instrument;
    domain::Side side{domain::Side::Buy};
    double price{0.0};
    double size{0.0};
    bool own{false};
    std::int64_t placed_at_ms{0};
  };

  struct InjectedFailure {
    int remaining{0};
    std::string message;
  };

  // Throws ExchangeError if a failure is armed for op. Caller holds mutex_.
  void throwIfInjected(Operation op);

  double minOrderSizeLocked(const std::string& market_id) const;

  // Matches an incoming order of ours against seeded liquidity on the
  // opposite side. Returns the unfilled remainder. Caller holds mutex_.
  double matchAgainstBook(const OrderSpec& spec);

  void appendTradeLocked(const domain::Instrument& instrument,
                         domain::Side side, double size, double price,
                         domain::TradeStatus status);

  const ITimeProvider& time_provider_;
  const std::string account_address_;
  const double default_min_order_size_;

  mutable std::mutex mutex_;
  OrderIdGenerator order_ids_;
  OrderIdGenerator trade_ids_{0x7472000000000000ULL};
  std::vector<RestingOrder> book_;
  std::vector<domain::Trade> trades_;
  std::vector<OrderSpec> submissions_;
  std::vector<domain::MarketDescriptor> markets_;
  std::unordered_map<std::string, double> min_order_sizes_;
  std::map<Operation, InjectedFailure> failures_;
  InjectedFailure refused_cancels_;
  std::size_t cancel_requests_{0};
};

}  // namespace pmm
