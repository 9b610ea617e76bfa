#include "pmm/orders/order_manager.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <unordered_set>
#include <utility>

namespace pmm {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderManager::OrderManager(IExchangeClient& client,
                           const ITimeProvider& time_provider, EventBus* bus,
                           std::size_t retained_terminal)
    : client_(client),
      time_provider_(time_provider),
      bus_(bus),
      retained_terminal_(retained_terminal) {}

// -----------------------------------------------------------------------------
// isLegalTransition: order lifecycle graph
// -----------------------------------------------------------------------------
bool OrderManager::isLegalTransition(domain::OrderStatus current,
                                     domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Live ||
             next == S::Failed;

    case S::Live:
      return next == S::Canceled ||
             next == S::Unknown ||
             next == S::Failed;

    case S::Unknown:
      return next == S::Canceled ||
             next == S::Live ||
             next == S::Failed;

    case S::Canceled:
    case S::Failed:
      return false;
  }

  return false;
}

bool OrderManager::isTerminal(domain::OrderStatus status) {
  return status == domain::OrderStatus::Canceled ||
         status == domain::OrderStatus::Failed;
}

// -----------------------------------------------------------------------------
// clampPrice: exchange tick bounds; NaN maps to the lower bound
// -----------------------------------------------------------------------------
double OrderManager::clampPrice(double price) {
  if (std::isnan(price)) {
    return kMinPrice;
  }
  return std::max(kMinPrice, std::min(kMaxPrice, price));
}

// -----------------------------------------------------------------------------
// place: clamp, submit, record
// -----------------------------------------------------------------------------
Result<domain::OrderId> OrderManager::place(
    const domain::Instrument& instrument, domain::Side side, double size,
    double price, int fee_rate_bps) {
  double min_size = 0.0;
  try {
    min_size = client_.minOrderSize(instrument.market_id);
  } catch (const std::exception& e) {
    std::cerr << "[OrderManager] Error placing order: min order size for "
              << instrument.market_id << " unavailable: " << e.what() << "\n";
    return Result<domain::OrderId>::failure(
        ErrorKind::External,
        std::string("min order size lookup failed: ") + e.what());
  }

  OrderSpec spec;
  spec.instrument = instrument;
  spec.side = side;
  spec.price = clampPrice(price);
  spec.size = (std::isfinite(size) && size > 0.0) ? std::max(min_size, size)
                                                  : min_size;
  spec.fee_rate_bps = fee_rate_bps;

  domain::Order order;
  order.instrument = instrument;
  order.side = side;
  order.size = spec.size;
  order.price = spec.price;
  order.status = domain::OrderStatus::Pending;

  std::string failure;
  try {
    order.id = client_.submitOrder(spec);
    if (order.id.empty()) {
      failure = "exchange accepted the order without an order id";
    }
  } catch (const std::exception& e) {
    failure = e.what();
  }

  OrderUpdateEvent update;
  update.previous_status = domain::OrderStatus::Pending;
  update.timestamp_ms = time_provider_.now_ms();

  if (!failure.empty()) {
    std::cerr << "[OrderManager] Failed to place " << domain::toString(side)
              << " order on " << instrument << " at price " << spec.price
              << ": " << failure << "\n";
    order.status = domain::OrderStatus::Failed;
    update.order = order;
    publish(update);
    return Result<domain::OrderId>::failure(ErrorKind::External, failure);
  }

  order.status = domain::OrderStatus::Live;
  order.placed_at_ms = update.timestamp_ms;

  Slice& slice = sliceFor(instrument);
  {
    std::lock_guard lock(slice.mutex);
    slice.orders[order.id] = order;
    slice.sequence.push_back(order.id);
  }
  {
    std::lock_guard lock(slices_mutex_);
    index_[order.id] = instrument;
  }

  std::cout << "[OrderManager] Placed " << domain::toString(side) << " order "
            << order.id << " at price " << spec.price << " size " << spec.size
            << "\n";

  update.order = order;
  publish(update);
  return order.id;
}

// -----------------------------------------------------------------------------
// cancel: request, then apply the exchange's answer to the registry
// -----------------------------------------------------------------------------
Result<CancelOutcome> OrderManager::cancel(const domain::OrderId& order_id) {
  auto instrument = instrumentOf(order_id);
  if (!instrument) {
    return Result<CancelOutcome>::failure(
        ErrorKind::NotFound, "unknown order_id=" + order_id);
  }

  Slice& slice = sliceFor(*instrument);
  {
    std::lock_guard lock(slice.mutex);
    auto it = slice.orders.find(order_id);
    if (it != slice.orders.end() && isTerminal(it->second.status)) {
      return Result<CancelOutcome>::failure(
          ErrorKind::InvalidArgument,
          "order_id=" + order_id + " is already " +
              domain::toString(it->second.status));
    }
  }

  CancelResponse response;
  try {
    response = client_.cancelOrder(order_id);
  } catch (const std::exception& e) {
    std::cerr << "[OrderManager] Error canceling order " << order_id << ": "
              << e.what() << ". Marking Unknown.\n";
    std::optional<OrderUpdateEvent> update;
    {
      std::lock_guard lock(slice.mutex);
      update = transition(slice, order_id, domain::OrderStatus::Unknown);
    }
    if (update) {
      publish(*update);
    }
    return Result<CancelOutcome>::failure(ErrorKind::External, e.what());
  }

  bool confirmed = std::find(response.canceled.begin(), response.canceled.end(),
                             order_id) != response.canceled.end();

  std::optional<OrderUpdateEvent> update;
  {
    std::lock_guard lock(slice.mutex);
    update = transition(slice, order_id,
                        confirmed ? domain::OrderStatus::Canceled
                                  : domain::OrderStatus::Unknown);
    pruneRetired(slice);
  }
  if (update) {
    publish(*update);
  }

  if (confirmed) {
    return CancelOutcome::Confirmed;
  }

  auto reason = response.not_canceled.find(order_id);
  std::cerr << "[OrderManager] WARNING: cancel for order_id=" << order_id
            << " not confirmed ("
            << (reason != response.not_canceled.end() ? reason->second
                                                      : "no reason given")
            << "). Marking Unknown.\n";
  return CancelOutcome::Unconfirmed;
}

// -----------------------------------------------------------------------------
// reconcile: resolve Unknown orders against the open-order list
// -----------------------------------------------------------------------------
Result<std::size_t> OrderManager::reconcile(
    const domain::Instrument& instrument) {
  Slice& slice = sliceFor(instrument);

  std::vector<domain::OrderId> unknown;
  {
    std::lock_guard lock(slice.mutex);
    for (const auto& id : slice.sequence) {
      if (slice.orders.at(id).status == domain::OrderStatus::Unknown) {
        unknown.push_back(id);
      }
    }
  }
  if (unknown.empty()) {
    return std::size_t{0};
  }

  std::vector<OpenOrder> open;
  try {
    open = client_.listOpenOrders(instrument.market_id, instrument.token_id);
  } catch (const std::exception& e) {
    std::cerr << "[OrderManager] Reconciliation poll failed for " << instrument
              << ": " << e.what() << "\n";
    return Result<std::size_t>::failure(ErrorKind::External, e.what());
  }

  std::unordered_set<domain::OrderId> resting;
  for (const auto& o : open) {
    resting.insert(o.id);
  }

  std::vector<OrderUpdateEvent> updates;
  {
    std::lock_guard lock(slice.mutex);
    for (const auto& id : unknown) {
      auto next = resting.count(id) > 0 ? domain::OrderStatus::Live
                                        : domain::OrderStatus::Canceled;
      if (auto update = transition(slice, id, next)) {
        updates.push_back(std::move(*update));
      }
    }
    pruneRetired(slice);
  }

  for (const auto& update : updates) {
    std::cout << "[OrderManager] Reconciled order " << update.order.id
              << " -> " << domain::toString(update.order.status) << "\n";
    publish(update);
  }
  return updates.size();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderManager::order(
    const domain::OrderId& order_id) const {
  auto instrument = instrumentOf(order_id);
  if (!instrument) {
    return std::nullopt;
  }
  const Slice* slice = findSlice(*instrument);
  if (slice == nullptr) {
    return std::nullopt;
  }

  std::lock_guard lock(slice->mutex);
  auto it = slice->orders.find(order_id);
  if (it == slice->orders.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Order> OrderManager::orders(
    const domain::Instrument& instrument) const {
  const Slice* slice = findSlice(instrument);
  if (slice == nullptr) {
    return {};
  }
  std::lock_guard lock(slice->mutex);
  std::vector<domain::Order> snapshot;
  snapshot.reserve(slice->sequence.size());
  for (const auto& id : slice->sequence) {
    snapshot.push_back(slice->orders.at(id));
  }
  return snapshot;
}

std::size_t OrderManager::liveCount(const domain::Instrument& instrument) const {
  const Slice* slice = findSlice(instrument);
  if (slice == nullptr) {
    return 0;
  }
  std::lock_guard lock(slice->mutex);
  return static_cast<std::size_t>(std::count_if(
      slice->orders.begin(), slice->orders.end(), [](const auto& entry) {
        return !isTerminal(entry.second.status);
      }));
}

std::size_t OrderManager::liveCount(const domain::Instrument& instrument,
                                    domain::Side side) const {
  const Slice* slice = findSlice(instrument);
  if (slice == nullptr) {
    return 0;
  }
  std::lock_guard lock(slice->mutex);
  return static_cast<std::size_t>(std::count_if(
      slice->orders.begin(), slice->orders.end(), [side](const auto& entry) {
        return entry.second.side == side && !isTerminal(entry.second.status);
      }));
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
OrderManager::Slice& OrderManager::sliceFor(
    const domain::Instrument& instrument) {
  std::lock_guard lock(slices_mutex_);
  auto& slot = slices_[instrument];
  if (!slot) {
    slot = std::make_unique<Slice>();
  }
  return *slot;
}

const OrderManager::Slice* OrderManager::findSlice(
    const domain::Instrument& instrument) const {
  std::lock_guard lock(slices_mutex_);
  auto it = slices_.find(instrument);
  return it != slices_.end() ? it->second.get() : nullptr;
}

std::optional<domain::Instrument> OrderManager::instrumentOf(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(slices_mutex_);
  auto it = index_.find(order_id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<OrderUpdateEvent> OrderManager::transition(
    Slice& slice, const domain::OrderId& order_id, domain::OrderStatus next) {
  auto found = slice.orders.find(order_id);
  if (found == slice.orders.end()) {
    std::cerr << "[OrderManager] WARNING: transition for unknown order_id="
              << order_id << ". Skipping.\n";
    return std::nullopt;
  }

  domain::Order& order = found->second;
  domain::OrderStatus previous = order.status;
  if (previous == next) {
    return std::nullopt;
  }
  if (!isLegalTransition(previous, next)) {
    std::cerr << "[OrderManager] WARNING: illegal transition for order_id="
              << order_id << " from " << domain::toString(previous) << " to "
              << domain::toString(next) << ". Skipping.\n";
    return std::nullopt;
  }

  order.status = next;
  if (isTerminal(next)) {
    slice.retired.push_back(order_id);
  }

  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = previous;
  update.timestamp_ms = time_provider_.now_ms();
  return update;
}

void OrderManager::pruneRetired(Slice& slice) {
  if (slice.retired.size() <= retained_terminal_) {
    return;
  }
  std::unordered_set<domain::OrderId> dropped;
  while (slice.retired.size() > retained_terminal_) {
    dropped.insert(slice.retired.front());
    slice.orders.erase(slice.retired.front());
    slice.retired.pop_front();
  }
  slice.sequence.erase(
      std::remove_if(slice.sequence.begin(), slice.sequence.end(),
                     [&dropped](const domain::OrderId& id) {
                       return dropped.count(id) > 0;
                     }),
      slice.sequence.end());

  std::lock_guard lock(slices_mutex_);
  for (const auto& id : dropped) {
    index_.erase(id);
  }
}

void OrderManager::publish(const OrderUpdateEvent& event) {
  if (bus_ != nullptr) {
    bus_->publish(event);
  }
}

}  // namespace pmm
