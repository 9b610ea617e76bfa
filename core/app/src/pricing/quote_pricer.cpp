#include "pmm/pricing/quote_pricer.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

namespace pmm {

const char* toString(BookQuote::Source source) {
  switch (source) {
    case BookQuote::Source::TwoSided:  return "TwoSided";
    case BookQuote::Source::BidsOnly:  return "BidsOnly";
    case BookQuote::Source::AsksOnly:  return "AsksOnly";
    case BookQuote::Source::EmptyBook: return "EmptyBook";
  }
  return "Unknown";
}

QuotePricer::QuotePricer(IExchangeClient& client) : client_(client) {}

// -----------------------------------------------------------------------------
// quote(): fetch open orders, then apply the pricing rules
// -----------------------------------------------------------------------------
Result<BookQuote> QuotePricer::quote(
    const domain::Instrument& instrument) const {
  std::vector<OpenOrder> orders;
  try {
    orders = client_.listOpenOrders(instrument.market_id, instrument.token_id);
  } catch (const std::exception& e) {
    return Result<BookQuote>::failure(
        ErrorKind::External,
        "open orders for " + domain::toString(instrument) + ": " + e.what());
  }
  return fromOrders(orders);
}

// -----------------------------------------------------------------------------
// midPrice(): plain contract, failures collapse to the neutral prior
// -----------------------------------------------------------------------------
double QuotePricer::midPrice(const domain::Instrument& instrument) const {
  auto result = quote(instrument);
  if (!result.ok()) {
    std::cerr << "[QuotePricer] Error getting mid price: "
              << result.error().message << ". Using " << kNeutralMid << "\n";
    return kNeutralMid;
  }
  return result.value().mid;
}

// -----------------------------------------------------------------------------
// fromOrders(): partition into bids/asks and take the best of each
// -----------------------------------------------------------------------------
BookQuote QuotePricer::fromOrders(const std::vector<OpenOrder>& orders) {
  BookQuote q;
  double best_bid = 0.0;
  double best_ask = 1.0;

  for (const auto& o : orders) {
    if (o.side == domain::Side::Buy) {
      best_bid = q.bid_count == 0 ? o.price : std::max(best_bid, o.price);
      ++q.bid_count;
    } else {
      best_ask = q.ask_count == 0 ? o.price : std::min(best_ask, o.price);
      ++q.ask_count;
    }
  }

  if (q.bid_count == 0 && q.ask_count == 0) {
    q.source = BookQuote::Source::EmptyBook;
    q.best_bid = 0.0;
    q.best_ask = 1.0;
    q.mid = kNeutralMid;
    return q;
  }

  if (q.bid_count > 0 && q.ask_count > 0) {
    q.source = BookQuote::Source::TwoSided;
  } else if (q.bid_count > 0) {
    q.source = BookQuote::Source::BidsOnly;
  } else {
    q.source = BookQuote::Source::AsksOnly;
  }

  q.best_bid = best_bid;
  q.best_ask = best_ask;
  q.mid = (best_bid + best_ask) / 2.0;
  return q;
}

}  // namespace pmm
