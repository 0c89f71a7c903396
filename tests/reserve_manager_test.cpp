// =============================================================================
// reserve_manager_test.cpp
// =============================================================================
// Unit tests for lendswap::ReserveManager (deposit / withdraw).
//
// Validates:
//   - First deposit mints LP 1:1, later deposits at the grown index
//   - Withdrawals pay the LP share of total liquidity
//   - A withdrawal larger than idle liquidity pays what is idle and burns
//     only the matching LP fraction
//   - Rejections leave ledger and reserve untouched and publish
//     OperationRejectedEvent
// =============================================================================

#include "lendswap/lifecycle/reserve_manager.hpp"

#include "protocol_fixture.hpp"

#include <gtest/gtest.h>

#include <memory>

using lendswap::OperationRejectedEvent;
using lendswap::ReserveUpdateEvent;
using lendswap::domain::ErrorCode;
using lendswap::domain::OperationResult;
using lendswap::math::TokenAmount;
using lendswap::math::UnixTimestamp;

class ReserveManagerTest : public lendswap_test::ProtocolFixture {
 protected:
  void SetUp() override {
    ProtocolFixture::SetUp();
    manager = std::make_unique<lendswap::ReserveManager>(governance, ledger,
                                                         ledger, clock, bus);
  }

  OperationResult deposit(std::uint64_t amount) {
    return manager->deposit(reserve, "investor", "investor-usdc",
                            "investor-lp", TokenAmount(amount));
  }

  OperationResult withdraw(std::uint64_t lp_amount) {
    return manager->withdraw(reserve, "investor", "investor-lp",
                             "investor-usdc", TokenAmount(lp_amount));
  }

  std::unique_ptr<lendswap::ReserveManager> manager;
};

// -----------------------------------------------------------------------------
// 1. The first deposit into an empty reserve mints LP one to one.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, FirstDepositMintsOneToOne) {
  const OperationResult result = deposit(1'000'000);
  ASSERT_TRUE(result.ok()) << result.message;

  EXPECT_EQ(balanceOf(reserve.lendable_vault), 1'000'000u);
  EXPECT_EQ(balanceOf("investor-lp"), 1'000'000u);
  EXPECT_EQ(balanceOf("investor-usdc"), 9'000'000u);
  EXPECT_EQ(ledger.supply(reserve.redeemable_mint).value(), 1'000'000u);
  EXPECT_EQ(reserve.state.treasurer_update.value(),
            UnixTimestamp::fromMillis(kStartMs).value());

  const auto updates = eventsOf<ReserveUpdateEvent>();
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].operation, "deposit");
  EXPECT_EQ(updates[0].vault_balance.value(), 1'000'000u);
  EXPECT_EQ(updates[0].redeemable_supply.value(), 1'000'000u);
}

// -----------------------------------------------------------------------------
// 2. After the pool doubles, a deposit mints half as many LP tokens.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, DepositAtGrownIndex) {
  ASSERT_TRUE(deposit(1'000'000).ok());
  fund(reserve.lendable_vault, "usdc", 1'000'000);

  ASSERT_TRUE(deposit(1'000'000).ok());
  EXPECT_EQ(balanceOf("investor-lp"), 1'500'000u);
  EXPECT_EQ(balanceOf(reserve.lendable_vault), 3'000'000u);
}

// -----------------------------------------------------------------------------
// 3. Withdrawing LP pays its share of total liquidity.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, WithdrawPaysShare) {
  ASSERT_TRUE(deposit(1'000'000).ok());
  fund(reserve.lendable_vault, "usdc", 1'000'000);

  ASSERT_TRUE(withdraw(400'000).ok());
  EXPECT_EQ(balanceOf("investor-lp"), 600'000u);
  EXPECT_EQ(balanceOf("investor-usdc"), 9'800'000u);
  EXPECT_EQ(balanceOf(reserve.lendable_vault), 1'200'000u);
  EXPECT_EQ(ledger.supply(reserve.redeemable_mint).value(), 600'000u);
}

// -----------------------------------------------------------------------------
// 4. With 600,000 lent out, redeeming every LP token pays the 400,000 that is
//    idle and burns only 40% of the LP.
// Why: The remaining LP still has a claim on the outstanding debt.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, WithdrawCappedByIdleLiquidity) {
  ASSERT_TRUE(deposit(1'000'000).ok());

  ledger.transfer(reserve.lendable_vault, market.quote_vault, reserve.signer,
                  TokenAmount(600'000));
  reserve.debt.total = TokenAmount(600'000);
  reserve.debt.last_update = reserve.state.treasurer_update;

  const OperationResult result = withdraw(1'000'000);
  ASSERT_TRUE(result.ok()) << result.message;

  EXPECT_EQ(balanceOf(reserve.lendable_vault), 0u);
  EXPECT_EQ(balanceOf("investor-usdc"), 9'400'000u);
  EXPECT_EQ(balanceOf("investor-lp"), 600'000u);
  EXPECT_EQ(ledger.supply(reserve.redeemable_mint).value(), 600'000u);
}

// -----------------------------------------------------------------------------
// 5. Zero amounts are invalid arguments.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, ZeroAmountsAreRejected) {
  EXPECT_EQ(deposit(0).code, ErrorCode::InvalidArgument);
  EXPECT_EQ(withdraw(0).code, ErrorCode::InvalidArgument);

  const auto rejected = eventsOf<OperationRejectedEvent>();
  ASSERT_EQ(rejected.size(), 2u);
  EXPECT_EQ(rejected[0].operation, "deposit");
  EXPECT_EQ(rejected[1].operation, "withdraw");
  EXPECT_EQ(rejected[1].subject, "investor");
  EXPECT_TRUE(eventsOf<ReserveUpdateEvent>().empty());
}

// -----------------------------------------------------------------------------
// 6. A deposit the investor cannot fund is rejected by custody and leaves the
//    reserve record as it was.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, UnfundedDepositRollsBack) {
  const lendswap::domain::Reserve before = reserve;

  EXPECT_EQ(deposit(10'000'001).code, ErrorCode::CustodyRejected);
  EXPECT_EQ(balanceOf("investor-usdc"), 10'000'000u);
  EXPECT_EQ(balanceOf(reserve.lendable_vault), 0u);
  EXPECT_EQ(ledger.supply(reserve.redeemable_mint).value(), 0u);
  EXPECT_EQ(reserve.state.treasurer_update.value(),
            before.state.treasurer_update.value());
  EXPECT_TRUE(reserve.state.borrow_rate == before.state.borrow_rate);
}

// -----------------------------------------------------------------------------
// 7. Redeeming more LP than held is a custody rejection.
// -----------------------------------------------------------------------------
TEST_F(ReserveManagerTest, OverRedemptionRollsBack) {
  ASSERT_TRUE(deposit(1'000'000).ok());
  fund(reserve.lendable_vault, "usdc", 1'000'000);
  ledger.createVault("other-lp", reserve.redeemable_mint, "other");
  ledger.mint(reserve.redeemable_mint, "other-lp", reserve.signer,
              TokenAmount(1'000'000));

  EXPECT_EQ(withdraw(1'500'000).code, ErrorCode::CustodyRejected);
  EXPECT_EQ(balanceOf("investor-lp"), 1'000'000u);
  EXPECT_EQ(balanceOf(reserve.lendable_vault), 2'000'000u);
}
