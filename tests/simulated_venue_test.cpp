// =============================================================================
// simulated_venue_test.cpp
// =============================================================================
// Unit tests for lendswap::SimulatedVenue.
//
// Validates:
//   - Buy / sell crossing against the configured market price
//   - Non-crossing orders fill nothing and move nothing
//   - Partial fills through the fill ratio and the buyer's quote cap
//   - Proceeds stay with the venue until settle()
// =============================================================================

#include "lendswap/custody/in_memory_ledger.hpp"
#include "lendswap/domain/error.hpp"
#include "lendswap/venue/simulated_venue.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

using lendswap::Fill;
using lendswap::OrderRequest;
using lendswap::Side;
using lendswap::domain::ProtocolError;
using lendswap::math::Factor;
using lendswap::math::TokenAmount;

class SimulatedVenueTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ledger.createMint("sol", "faucet");
    ledger.createMint("usdc", "faucet");
    ledger.createVault("venue-sol", "sol", "venue");
    ledger.createVault("venue-usdc", "usdc", "venue");
    ledger.createVault("mkt-sol", "sol", "market");
    ledger.createVault("mkt-usdc", "usdc", "market");
    ledger.mint("sol", "venue-sol", "faucet", TokenAmount(1'000'000));
    ledger.mint("usdc", "venue-usdc", "faucet", TokenAmount(1'000'000));
    ledger.mint("sol", "mkt-sol", "faucet", TokenAmount(100));
    ledger.mint("usdc", "mkt-usdc", "faucet", TokenAmount(10'000));

    lendswap::SimulatedVenueConfig config;
    config.base_mint = "sol";
    config.quote_mint = "usdc";
    config.base_inventory_vault = "venue-sol";
    config.quote_inventory_vault = "venue-usdc";
    config.lots.base_lot = 10;
    config.lots.quote_lot = 2;
    config.market_price = 50;
    venue = std::make_unique<lendswap::SimulatedVenue>(ledger, config);
  }

  OrderRequest buy(std::uint64_t limit, std::uint64_t lots,
                   std::uint64_t max_quote) const {
    OrderRequest order;
    order.side = Side::Buy;
    order.limit_price = limit;
    order.max_base_qty = lots;
    order.max_native_quote = TokenAmount(max_quote);
    order.payer_vault = "mkt-usdc";
    order.owner = "market";
    return order;
  }

  OrderRequest sell(std::uint64_t limit, std::uint64_t lots) const {
    OrderRequest order;
    order.side = Side::Sell;
    order.limit_price = limit;
    order.max_base_qty = lots;
    order.payer_vault = "mkt-sol";
    order.owner = "market";
    return order;
  }

  void settle() { venue->settle("market", "mkt-sol", "mkt-usdc"); }

  std::uint64_t balanceOf(const char* vault) const {
    return ledger.balance(vault).value();
  }

  lendswap::InMemoryLedger ledger;
  std::unique_ptr<lendswap::SimulatedVenue> venue;
};

// -----------------------------------------------------------------------------
// 1. A buy at or above the market price fills at the market price; the base
//    only arrives on settle().
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, CrossingBuyFillsAtMarket) {
  const Fill fill = venue->submitOrder(buy(60, 5, 10'000));

  EXPECT_EQ(fill.price, 50u);
  EXPECT_EQ(fill.filled_base_lots, 5u);
  EXPECT_EQ(fill.native_base.value(), 50u);
  EXPECT_EQ(fill.native_quote.value(), 500u);  // 5 lots * 50 * quote_lot 2

  EXPECT_EQ(balanceOf("mkt-usdc"), 9'500u);
  EXPECT_EQ(balanceOf("mkt-sol"), 100u);

  settle();
  EXPECT_EQ(balanceOf("mkt-sol"), 150u);
  EXPECT_EQ(balanceOf("venue-sol"), 999'950u);
  EXPECT_EQ(balanceOf("venue-usdc"), 1'000'500u);
}

// -----------------------------------------------------------------------------
// 2. A buy below the market does not cross.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, NonCrossingBuyFillsNothing) {
  const Fill fill = venue->submitOrder(buy(49, 5, 10'000));
  settle();

  EXPECT_EQ(fill.filled_base_lots, 0u);
  EXPECT_TRUE(fill.native_quote.isZero());
  EXPECT_EQ(balanceOf("mkt-usdc"), 10'000u);
  EXPECT_EQ(balanceOf("mkt-sol"), 100u);
}

// -----------------------------------------------------------------------------
// 3. The buyer's quote cap limits the filled lots.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, BuyCappedByMaxQuote) {
  const Fill fill = venue->submitOrder(buy(50, 10, 350));
  EXPECT_EQ(fill.filled_base_lots, 3u);
  EXPECT_EQ(fill.native_quote.value(), 300u);
}

// -----------------------------------------------------------------------------
// 4. A sell at or below the market fills; proceeds arrive on settle().
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, CrossingSellSettlesProceeds) {
  const Fill fill = venue->submitOrder(sell(40, 4));
  EXPECT_EQ(fill.filled_base_lots, 4u);
  EXPECT_EQ(balanceOf("mkt-sol"), 60u);
  EXPECT_EQ(balanceOf("mkt-usdc"), 10'000u);

  settle();
  EXPECT_EQ(balanceOf("mkt-usdc"), 10'400u);

  // Nothing left to settle the second time.
  settle();
  EXPECT_EQ(balanceOf("mkt-usdc"), 10'400u);
}

// -----------------------------------------------------------------------------
// 5. A sell above the market does not cross.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, NonCrossingSell) {
  const Fill fill = venue->submitOrder(sell(51, 4));
  EXPECT_EQ(fill.filled_base_lots, 0u);
  EXPECT_EQ(balanceOf("mkt-sol"), 100u);
}

// -----------------------------------------------------------------------------
// 6. The fill ratio scales every fill.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, FillRatioProducesPartialFills) {
  venue->setFillRatio(Factor(5'000));
  const Fill fill = venue->submitOrder(buy(50, 8, 10'000));
  EXPECT_EQ(fill.filled_base_lots, 4u);

  EXPECT_THROW(venue->setFillRatio(Factor(10'001)), ProtocolError);
}

// -----------------------------------------------------------------------------
// 7. Price updates apply to later orders; zero is rejected.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueTest, PriceUpdates) {
  venue->setMarketPrice(100);
  EXPECT_EQ(venue->marketPrice(), 100u);
  EXPECT_EQ(venue->submitOrder(buy(60, 1, 10'000)).filled_base_lots, 0u);

  EXPECT_THROW(venue->setMarketPrice(0), ProtocolError);
  EXPECT_THROW(venue->submitOrder(buy(0, 1, 10'000)), ProtocolError);
}
