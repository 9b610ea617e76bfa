#pragma once

#include "pmm/domain/instrument.hpp"
#include "pmm/domain/order.hpp"

#include <string>

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// TradeStatus
// -----------------------------------------------------------------------------
// Settlement status reported by the exchange. A fill walks Matched → Mined →
// Confirmed on the happy path; Retrying and Failed cover settlement trouble.
// Only Confirmed trades contribute to realized PnL.
// -----------------------------------------------------------------------------
enum class TradeStatus {
  Matched,
  Mined,
  Confirmed,
  Retrying,
  Failed,
};

inline const char* toString(TradeStatus status) {
  switch (status) {
    case TradeStatus::Matched:   return "MATCHED";
    case TradeStatus::Mined:     return "MINED";
    case TradeStatus::Confirmed: return "CONFIRMED";
    case TradeStatus::Retrying:  return "RETRYING";
    case TradeStatus::Failed:    return "FAILED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Trade
// -----------------------------------------------------------------------------
// Immutable fill record read from the exchange. Read-only input to the
// PnlTracker; the core never creates or edits one.
// -----------------------------------------------------------------------------
struct Trade {
  std::string id;
  Instrument instrument;
  Side side{Side::Buy};
  double size{0.0};
  double price{0.0};
  TradeStatus status{TradeStatus::Matched};
};

}  // namespace domain
}  // namespace pmm
