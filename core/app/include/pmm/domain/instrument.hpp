#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument
// -----------------------------------------------------------------------------
// Responsibility: Identifies one tradeable outcome token of a prediction
// market. market_id is the market's condition id; token_id is the outcome
// token (asset) id that orders are placed against.
//
// Immutable for the life of a strategy run. Used as the key of the
// OrderManager's per-instrument registry slices, hence operator== and the
// std::hash specialisation below.
// -----------------------------------------------------------------------------
struct Instrument {
  std::string market_id;
  std::string token_id;
};

inline bool operator==(const Instrument& a, const Instrument& b) {
  return a.market_id == b.market_id && a.token_id == b.token_id;
}

inline bool operator!=(const Instrument& a, const Instrument& b) {
  return !(a == b);
}

inline std::string toString(const Instrument& instrument) {
  return instrument.market_id + "/" + instrument.token_id;
}

inline std::ostream& operator<<(std::ostream& os, const Instrument& instrument) {
  return os << toString(instrument);
}

// -----------------------------------------------------------------------------
// MarketDescriptor
// -----------------------------------------------------------------------------
// Responsibility: One entry of the exchange's market catalog, as returned by
// IMarketCatalog::activeMarkets(). Only used to enumerate tradeable
// instruments and their reward parameters; the quoting core never reads it.
// -----------------------------------------------------------------------------
struct OutcomeToken {
  std::string token_id;
  std::string outcome;  // e.g. "Yes" / "No"
};

struct RewardParams {
  double min_size{0.0};    // Minimum quote size that earns rewards
  double max_spread{0.0};  // Maximum spread (in cents) that earns rewards
};

struct MarketDescriptor {
  std::string condition_id;
  std::vector<OutcomeToken> tokens;
  RewardParams rewards;
  bool active{true};
  bool closed{false};
};

// Human-readable label: "Market <last 6 chars of condition id> - Outcomes:
// Yes, No".
std::string describeMarket(const MarketDescriptor& market);

// One Instrument per outcome token of the market.
std::vector<Instrument> tradeableInstruments(const MarketDescriptor& market);

}  // namespace domain
}  // namespace pmm

namespace std {

template <>
struct hash<pmm::domain::Instrument> {
  std::size_t operator()(const pmm::domain::Instrument& i) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(i.market_id);
    std::size_t h2 = std::hash<std::string>{}(i.token_id);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

}  // namespace std
