#include "internal/auction/auction_model.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace arena::auction {

AuctionModel::AuctionModel(arena::core::v1::ClearingRule rule) : rule_(rule) {
  if (rule_ != arena::core::v1::CLEARING_RULE_FIRST_PRICE && rule_ != arena::core::v1::CLEARING_RULE_SECOND_PRICE) {
    throw util::InvalidArgument("unsupported clearing rule " + std::to_string(static_cast<int>(rule_)));
  }
}

AuctionResult AuctionModel::Resolve(double floor_price, const std::vector<Bid>& bids, std::optional<double> market_price) const {
  const Bid* winner = nullptr;
  for (const auto& bid : bids) {
    if (bid.amount < floor_price) continue;
    if (market_price && bid.amount < *market_price) continue;
    if (winner == nullptr || bid.amount > winner->amount ||
        (bid.amount == winner->amount && bid.strategy_index < winner->strategy_index)) {
      winner = &bid;
    }
  }

  AuctionResult result;
  if (winner == nullptr) {
    result.market_won = market_price.has_value() && *market_price >= floor_price;
    return result;
  }

  result.has_winner   = true;
  result.winner_index = winner->strategy_index;

  if (rule_ == arena::core::v1::CLEARING_RULE_FIRST_PRICE) {
    result.clearing_price = winner->amount;
    return result;
  }

  double clearing = floor_price;
  for (const auto& bid : bids) {
    if (&bid == winner) continue;
    clearing = std::max(clearing, bid.amount);
  }
  if (market_price) {
    clearing = std::max(clearing, *market_price);
  }
  result.clearing_price = std::min(clearing, winner->amount);
  return result;
}

} // namespace arena::auction
