#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "arena/core/v1/types.pb.h"

namespace arena::auction {

// A placed bid. Strategies that did not bid are simply absent.
struct Bid {
  std::uint32_t strategy_index = 0;
  double        amount         = 0.0;
};

struct AuctionResult {
  bool          has_winner     = false;
  std::uint32_t winner_index   = 0;
  double        clearing_price = 0.0;
  // The outside market price beat every strategy (or nobody bid).
  bool market_won = false;
};

/*
  Sealed-bid auction mechanics. Pure and deterministic.

  A bid is eligible when it is >= floor_price and, when a market price is
  known, >= market_price. The highest eligible bid wins; equal amounts go to
  the lowest strategy_index (registration order).

      first price   clearing = winning bid
      second price  clearing = max(floor, best competing bid, market price)
*/
class AuctionModel {
 public:
  explicit AuctionModel(arena::core::v1::ClearingRule rule);

  AuctionResult Resolve(double floor_price, const std::vector<Bid>& bids, std::optional<double> market_price = std::nullopt) const;

  arena::core::v1::ClearingRule rule() const {
    return rule_;
  }

 private:
  arena::core::v1::ClearingRule rule_;
};

} // namespace arena::auction
