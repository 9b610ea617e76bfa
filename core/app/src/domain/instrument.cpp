#include "pmm/domain/instrument.hpp"

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// describeMarket: synthetic label built from the condition id and outcomes
// -----------------------------------------------------------------------------
std::string describeMarket(const MarketDescriptor& market) {
  const std::string& id = market.condition_id;
  std::string suffix = id.size() > 6 ? id.substr(id.size() - 6) : id;

  std::string label = "Market " + suffix + " - Outcomes: ";
  for (std::size_t i = 0; i < market.tokens.size(); ++i) {
    if (i > 0) {
      label += ", ";
    }
    label += market.tokens[i].outcome;
  }
  return label;
}

// -----------------------------------------------------------------------------
// tradeableInstruments
// -----------------------------------------------------------------------------
std::vector<Instrument> tradeableInstruments(const MarketDescriptor& market) {
  std::vector<Instrument> out;
  out.reserve(market.tokens.size());
  for (const auto& token : market.tokens) {
    out.push_back(Instrument{market.condition_id, token.token_id});
  }
  return out;
}

}  // namespace domain
}  // namespace pmm
