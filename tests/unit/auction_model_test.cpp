#include <cassert>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#include "internal/auction/auction_model.hpp"

namespace {

using arena::auction::AuctionModel;
using arena::auction::Bid;
using arena::core::v1::CLEARING_RULE_FIRST_PRICE;
using arena::core::v1::CLEARING_RULE_SECOND_PRICE;

void TestSecondPriceChargesRunnerUp() {
  AuctionModel model(CLEARING_RULE_SECOND_PRICE);
  const auto   result = model.Resolve(1.0, {{0, 2.0}, {1, 1.5}});
  assert(result.has_winner);
  assert(result.winner_index == 0);
  assert(result.clearing_price == 1.5);
  assert(!result.market_won);
}

void TestSecondPriceSoleBidderPaysFloor() {
  AuctionModel model(CLEARING_RULE_SECOND_PRICE);
  const auto   result = model.Resolve(1.0, {{3, 4.0}});
  assert(result.has_winner);
  assert(result.winner_index == 3);
  assert(result.clearing_price == 1.0);
}

void TestFirstPriceChargesOwnBid() {
  AuctionModel model(CLEARING_RULE_FIRST_PRICE);
  const auto   result = model.Resolve(1.0, {{0, 2.0}, {1, 1.5}});
  assert(result.has_winner);
  assert(result.winner_index == 0);
  assert(result.clearing_price == 2.0);
}

void TestBidsBelowFloorNeverWin() {
  AuctionModel model(CLEARING_RULE_SECOND_PRICE);
  const auto   result = model.Resolve(1.0, {{0, 0.5}});
  assert(!result.has_winner);
  assert(result.clearing_price == 0.0);

  const auto empty = model.Resolve(1.0, {});
  assert(!empty.has_winner);
  assert(!empty.market_won);
}

void TestTiesGoToRegistrationOrder() {
  AuctionModel model(CLEARING_RULE_SECOND_PRICE);
  const auto   result = model.Resolve(1.0, {{2, 3.0}, {1, 3.0}, {4, 2.0}});
  assert(result.has_winner);
  assert(result.winner_index == 1);
  assert(result.clearing_price == 3.0);
}

void TestMarketPriceCompetes() {
  AuctionModel model(CLEARING_RULE_SECOND_PRICE);

  const auto outbid = model.Resolve(1.0, {{0, 2.0}}, 2.5);
  assert(!outbid.has_winner);
  assert(outbid.market_won);

  const auto beaten = model.Resolve(1.0, {{0, 3.0}, {1, 1.2}}, 2.5);
  assert(beaten.has_winner);
  assert(beaten.winner_index == 0);
  assert(beaten.clearing_price == 2.5);
  assert(!beaten.market_won);

  const auto nobody = model.Resolve(1.0, {}, 0.5);
  assert(!nobody.has_winner);
  assert(!nobody.market_won);
}

void TestUnsupportedRuleIsRejected() {
  bool threw = false;
  try {
    AuctionModel model(arena::core::v1::CLEARING_RULE_UNSPECIFIED);
    (void)model;
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

void TestClearingBoundsHoldForRandomAuctions() {
  std::mt19937                           rng(20240611);
  std::uniform_real_distribution<double> price(0.0, 10.0);
  std::uniform_int_distribution<int>     count(0, 6);
  std::bernoulli_distribution            has_market(0.3);

  AuctionModel first(CLEARING_RULE_FIRST_PRICE);
  AuctionModel second(CLEARING_RULE_SECOND_PRICE);

  for (int round = 0; round < 2000; ++round) {
    const double     floor = price(rng) / 2.0;
    std::vector<Bid> bids;
    const int        n = count(rng);
    for (int i = 0; i < n; ++i) {
      bids.push_back({static_cast<std::uint32_t>(i), price(rng)});
    }
    std::optional<double> market;
    if (has_market(rng)) market = price(rng);

    const auto a = first.Resolve(floor, bids, market);
    const auto b = second.Resolve(floor, bids, market);

    // Both rules pick the same winner; only the price differs.
    assert(a.has_winner == b.has_winner);
    if (!b.has_winner) continue;
    assert(a.winner_index == b.winner_index);

    const double winning_bid = bids[b.winner_index].amount;
    assert(a.clearing_price == winning_bid);
    assert(b.clearing_price <= winning_bid);
    assert(b.clearing_price >= floor);
    if (market) assert(b.clearing_price >= *market);
    for (const auto& bid : bids) {
      assert(bid.amount <= winning_bid);
    }
  }
}

} // namespace

int main() {
  TestSecondPriceChargesRunnerUp();
  TestSecondPriceSoleBidderPaysFloor();
  TestFirstPriceChargesOwnBid();
  TestBidsBelowFloorNeverWin();
  TestTiesGoToRegistrationOrder();
  TestMarketPriceCompetes();
  TestUnsupportedRuleIsRejected();
  TestClearingBoundsHoldForRandomAuctions();

  std::cout << "arena_unit_auction_model: pass\n";
  return 0;
}
