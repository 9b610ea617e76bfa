#include "pmm/exchange/paper_exchange.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pmm {

namespace {

constexpr double kMinPrice = 0.01;
constexpr double kMaxPrice = 0.99;

// Tolerance for comparing sizes that went through arithmetic.
constexpr double kSizeEpsilon = 1e-9;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PaperExchange::PaperExchange(const ITimeProvider& time_provider,
                             std::string account_address,
                             double default_min_order_size)
    : time_provider_(time_provider),
      account_address_(std::move(account_address)),
      default_min_order_size_(default_min_order_size) {}

// -----------------------------------------------------------------------------
// submitOrder: validate, match against seeded liquidity, rest the remainder
// -----------------------------------------------------------------------------
domain::OrderId PaperExchange::submitOrder(const OrderSpec& spec) {
  std::lock_guard lock(mutex_);
  submissions_.push_back(spec);
  throwIfInjected(Operation::SubmitOrder);

  if (!(spec.price >= kMinPrice && spec.price <= kMaxPrice)) {
    throw ExchangeError("invalid price " + std::to_string(spec.price) +
                        ": must be within [0.01, 0.99]");
  }
  double min_size = minOrderSizeLocked(spec.instrument.market_id);
  if (!(spec.size + kSizeEpsilon >= min_size)) {
    throw ExchangeError("invalid size " + std::to_string(spec.size) +
                        ": below market minimum " + std::to_string(min_size));
  }

  domain::OrderId id = order_ids_.next_id();
  double remaining = matchAgainstBook(spec);

  if (remaining > kSizeEpsilon) {
    RestingOrder order;
    order.id = id;
    order.instrument = spec.instrument;
    order.side = spec.side;
    order.price = spec.price;
    order.size = remaining;
    order.own = true;
    order.placed_at_ms = time_provider_.now_ms();
    book_.push_back(std::move(order));
  }

  return id;
}

// -----------------------------------------------------------------------------
// cancelOrder: remove our resting order and confirm it
// -----------------------------------------------------------------------------
CancelResponse PaperExchange::cancelOrder(const domain::OrderId& id) {
  std::lock_guard lock(mutex_);
  ++cancel_requests_;
  throwIfInjected(Operation::CancelOrder);

  CancelResponse response;

  auto it = std::find_if(book_.begin(), book_.end(), [&id](const auto& o) {
    return o.own && o.id == id;
  });
  if (it == book_.end()) {
    response.not_canceled[id] = "order not found";
    return response;
  }

  if (refused_cancels_.remaining > 0) {
    --refused_cancels_.remaining;
    response.not_canceled[id] = refused_cancels_.message;
    return response;
  }

  book_.erase(it);
  response.canceled.push_back(id);
  return response;
}

// -----------------------------------------------------------------------------
// listOpenOrders: every resting order (ours and seeded) for the token
// -----------------------------------------------------------------------------
std::vector<OpenOrder> PaperExchange::listOpenOrders(
    const std::string& market_id, const std::string& asset_id) {
  std::lock_guard lock(mutex_);
  throwIfInjected(Operation::ListOpenOrders);

  std::vector<OpenOrder> out;
  for (const auto& o : book_) {
    if (o.instrument.market_id == market_id &&
        o.instrument.token_id == asset_id) {
      out.push_back(OpenOrder{o.id, o.side, o.price, o.size});
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// listTrades: all paper trades are ours; filter by maker address
// -----------------------------------------------------------------------------
std::vector<domain::Trade> PaperExchange::listTrades(const TradeFilter& filter) {
  std::lock_guard lock(mutex_);
  throwIfInjected(Operation::ListTrades);

  if (!filter.maker_address.empty() &&
      filter.maker_address != account_address_) {
    return {};
  }
  return trades_;
}

std::string PaperExchange::accountAddress() {
  std::lock_guard lock(mutex_);
  throwIfInjected(Operation::AccountAddress);
  return account_address_;
}

double PaperExchange::minOrderSize(const std::string& market_id) {
  std::lock_guard lock(mutex_);
  throwIfInjected(Operation::MinOrderSize);
  return minOrderSizeLocked(market_id);
}

// -----------------------------------------------------------------------------
// activeMarkets: catalog entries that are active and not closed
// -----------------------------------------------------------------------------
std::vector<domain::MarketDescriptor> PaperExchange::activeMarkets() {
  std::lock_guard lock(mutex_);
  throwIfInjected(Operation::ActiveMarkets);

  std::vector<domain::MarketDescriptor> out;
  for (const auto& m : markets_) {
    if (m.active && !m.closed) {
      out.push_back(m);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// Simulation hooks
// -----------------------------------------------------------------------------
domain::OrderId PaperExchange::seedOrder(const domain::Instrument& instrument,
                                         domain::Side side, double price,
                                         double size) {
  std::lock_guard lock(mutex_);
  RestingOrder order;
  order.id = order_ids_.next_id();
  order.instrument = instrument;
  order.side = side;
  order.price = price;
  order.size = size;
  order.own = false;
  order.placed_at_ms = time_provider_.now_ms();
  book_.push_back(order);
  return order.id;
}

void PaperExchange::addMarket(domain::MarketDescriptor market) {
  std::lock_guard lock(mutex_);
  if (market.rewards.min_size > 0.0) {
    min_order_sizes_[market.condition_id] = market.rewards.min_size;
  }
  markets_.push_back(std::move(market));
}

void PaperExchange::setMinOrderSize(const std::string& market_id,
                                    double size) {
  std::lock_guard lock(mutex_);
  min_order_sizes_[market_id] = size;
}

bool PaperExchange::fillOrder(const domain::OrderId& id, double size,
                              domain::TradeStatus status) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(book_.begin(), book_.end(), [&id](const auto& o) {
    return o.own && o.id == id;
  });
  if (it == book_.end() || size <= 0.0) {
    return false;
  }

  double filled = std::min(size, it->size);
  appendTradeLocked(it->instrument, it->side, filled, it->price, status);

  it->size -= filled;
  if (it->size <= kSizeEpsilon) {
    book_.erase(it);
  }
  return true;
}

void PaperExchange::recordTrade(domain::Trade trade) {
  std::lock_guard lock(mutex_);
  if (trade.id.empty()) {
    trade.id = trade_ids_.next_id();
  }
  trades_.push_back(std::move(trade));
}

void PaperExchange::failNext(Operation op, int count, std::string message) {
  std::lock_guard lock(mutex_);
  failures_[op] = InjectedFailure{count, std::move(message)};
}

void PaperExchange::refuseNextCancels(int count, std::string reason) {
  std::lock_guard lock(mutex_);
  refused_cancels_ = InjectedFailure{count, std::move(reason)};
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
bool PaperExchange::isResting(const domain::OrderId& id) const {
  std::lock_guard lock(mutex_);
  return std::any_of(book_.begin(), book_.end(),
                     [&id](const RestingOrder& o) { return o.id == id; });
}

std::size_t PaperExchange::ownRestingCount(
    const domain::Instrument& instrument) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(book_.begin(), book_.end(),
                    [&instrument](const RestingOrder& o) {
                      return o.own && o.instrument == instrument;
                    }));
}

std::vector<OrderSpec> PaperExchange::submissions() const {
  std::lock_guard lock(mutex_);
  return submissions_;
}

std::size_t PaperExchange::cancelRequests() const {
  std::lock_guard lock(mutex_);
  return cancel_requests_;
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
void PaperExchange::throwIfInjected(Operation op) {
  auto it = failures_.find(op);
  if (it == failures_.end() || it->second.remaining <= 0) {
    return;
  }
  --it->second.remaining;
  throw ExchangeError(it->second.message);
}

double PaperExchange::minOrderSizeLocked(const std::string& market_id) const {
  auto it = min_order_sizes_.find(market_id);
  return it != min_order_sizes_.end() ? it->second : default_min_order_size_;
}

double PaperExchange::matchAgainstBook(const OrderSpec& spec) {
  double remaining = spec.size;
  const bool buying = spec.side == domain::Side::Buy;

  while (remaining > kSizeEpsilon) {
    // Best crossing third-party order: lowest ask for a buy, highest bid for
    // a sell.
    auto best = book_.end();
    for (auto it = book_.begin(); it != book_.end(); ++it) {
      if (it->own || it->instrument != spec.instrument ||
          it->side == spec.side) {
        continue;
      }
      bool crosses = buying ? it->price <= spec.price : it->price >= spec.price;
      if (!crosses) {
        continue;
      }
      if (best == book_.end() ||
          (buying ? it->price < best->price : it->price > best->price)) {
        best = it;
      }
    }
    if (best == book_.end()) {
      break;
    }

    double traded = std::min(remaining, best->size);
    appendTradeLocked(spec.instrument, spec.side, traded, best->price,
                      domain::TradeStatus::Confirmed);
    std::cout << "[PaperExchange] " << domain::toString(spec.side) << " "
              << traded << " @ " << best->price << " crossed on "
              << spec.instrument << "\n";

    remaining -= traded;
    best->size -= traded;
    if (best->size <= kSizeEpsilon) {
      book_.erase(best);
    }
  }
  return remaining;
}

void PaperExchange::appendTradeLocked(const domain::Instrument& instrument,
                                      domain::Side side, double size,
                                      double price,
                                      domain::TradeStatus status) {
  domain::Trade trade;
  trade.id = trade_ids_.next_id();
  trade.instrument = instrument;
  trade.side = side;
  trade.size = size;
  trade.price = price;
  trade.status = status;
  trades_.push_back(std::move(trade));
}

}  // namespace pmm
