#pragma once

#include "pmm/domain/instrument.hpp"

#include <vector>

namespace pmm {

// -----------------------------------------------------------------------------
// IMarketCatalog - market discovery
// -----------------------------------------------------------------------------
// Lists markets that currently have liquidity rewards enabled. Used by
// main() to enumerate and log tradeable instruments before runs start; the
// quoting core does not depend on it.
//
// May throw on retrieval failure.
// -----------------------------------------------------------------------------
class IMarketCatalog {
 public:
  virtual ~IMarketCatalog() = default;

  virtual std::vector<domain::MarketDescriptor> activeMarkets() = 0;
};

}  // namespace pmm
