#pragma once

namespace pmm {

// -----------------------------------------------------------------------------
// IRewardsSource - liquidity-reward accounting
// -----------------------------------------------------------------------------
// Reports the cumulative liquidity-incentive earnings of the account. The
// exchange pays rewards once a day, so a live implementation would query
// its rewards endpoint; PnlTracker only needs the running total.
//
// May throw on retrieval failure, same contract as IExchangeClient.
// -----------------------------------------------------------------------------
class IRewardsSource {
 public:
  virtual ~IRewardsSource() = default;

  virtual double rewardsTotal() = 0;
};

// Fixed amount. Used where no rewards feed is wired (paper trading, tests).
class ConstantRewardsSource final : public IRewardsSource {
 public:
  explicit ConstantRewardsSource(double total = 0.0) : total_(total) {}

  double rewardsTotal() override { return total_; }

 private:
  double total_;
};

}  // namespace pmm
