#pragma once

#include "pmm/common/result.hpp"
#include "pmm/domain/instrument.hpp"
#include "pmm/exchange/i_exchange_client.hpp"

#include <cstddef>
#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// BookQuote - top of book as seen by the pricer
// -----------------------------------------------------------------------------
// source records which sides were present, so callers can tell an empty
// book (neutral 0.5 prior) apart from a real two-sided market.
// -----------------------------------------------------------------------------
struct BookQuote {
  enum class Source {
    TwoSided,
    BidsOnly,
    AsksOnly,
    EmptyBook,
  };

  double best_bid{0.0};
  double best_ask{1.0};
  double mid{0.5};
  std::size_t bid_count{0};
  std::size_t ask_count{0};
  Source source{Source::EmptyBook};
};

const char* toString(BookQuote::Source source);

// -----------------------------------------------------------------------------
// QuotePricer - fair mid-price from the live order book
// -----------------------------------------------------------------------------
//
// @brief  Reads the open orders of every participant for an instrument and
//         derives the mid-price between best bid and best ask.
//
// @details
// Pricing rules:
//   best_bid = max buy price, or 0 when there are no bids
//   best_ask = min sell price, or 1 when there are no asks
//   mid      = (best_bid + best_ask) / 2, or exactly 0.5 for an empty book
//
// The result depends only on the set of prices, never on their order in
// the exchange response.
//
// Two entry points:
//   quote()    - Result<BookQuote>; a fetch failure is an Error. This is
//                what the StrategyLoop uses, so it can decide to back off
//                instead of quoting around a made-up price.
//   midPrice() - the plain price contract: any failure maps to the 0.5
//                neutral prior and is logged, never propagated.
//
// Pure read: no side effects other than the client call and logging.
//
// Thread model:
//   Stateless apart from the client reference. Safe to share between
//   strategy threads as long as the client is.
// -----------------------------------------------------------------------------
class QuotePricer {
 public:
  static constexpr double kNeutralMid = 0.5;

  explicit QuotePricer(IExchangeClient& client);

  Result<BookQuote> quote(const domain::Instrument& instrument) const;

  double midPrice(const domain::Instrument& instrument) const;

  // Pricing rules applied to an already-fetched order list.
  static BookQuote fromOrders(const std::vector<OpenOrder>& orders);

 private:
  IExchangeClient& client_;
};

}  // namespace pmm
