// =============================================================================
// in_memory_ledger_test.cpp
// =============================================================================
// Unit tests for lendswap::InMemoryLedger.
//
// Validates:
//   - Transfers move balances and enforce owner authority and mint match
//   - Mint / burn enforce the mint authority and keep supply in step
//   - Every rejection is a ProtocolError(CustodyRejected) and changes nothing
//   - begin / rollback restores the snapshot, commit keeps the changes
//   - Nested begin() is a programming error (std::logic_error)
// =============================================================================

#include "lendswap/custody/in_memory_ledger.hpp"
#include "lendswap/domain/error.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using lendswap::domain::ErrorCode;
using lendswap::domain::ProtocolError;
using lendswap::math::TokenAmount;

namespace {

// Runs fn and returns the ProtocolError code it threw (Ok if none).
template <typename Fn>
ErrorCode codeOf(Fn&& fn) {
  try {
    fn();
  } catch (const ProtocolError& e) {
    return e.code();
  }
  return ErrorCode::Ok;
}

}  // namespace

class InMemoryLedgerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ledger.createMint("usdc", "faucet");
    ledger.createMint("sol", "faucet");
    ledger.createVault("alice-usdc", "usdc", "alice");
    ledger.createVault("bob-usdc", "usdc", "bob");
    ledger.createVault("alice-sol", "sol", "alice");
    ledger.mint("usdc", "alice-usdc", "faucet", TokenAmount(1'000));
  }

  lendswap::InMemoryLedger ledger;
};

// -----------------------------------------------------------------------------
// 1. A transfer signed by the owner moves the amount.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, TransferMovesBalance) {
  ledger.transfer("alice-usdc", "bob-usdc", "alice", TokenAmount(400));

  EXPECT_EQ(ledger.balance("alice-usdc").value(), 600u);
  EXPECT_EQ(ledger.balance("bob-usdc").value(), 400u);
  EXPECT_EQ(ledger.supply("usdc").value(), 1'000u);
}

// -----------------------------------------------------------------------------
// 2. Transfer rejections: wrong signer, wrong mint, insufficient funds,
//    unknown vault. Balances are untouched.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, TransferRejections) {
  EXPECT_EQ(codeOf([&] {
              ledger.transfer("alice-usdc", "bob-usdc", "bob", TokenAmount(1));
            }),
            ErrorCode::CustodyRejected);
  EXPECT_EQ(codeOf([&] {
              ledger.transfer("alice-usdc", "alice-sol", "alice",
                              TokenAmount(1));
            }),
            ErrorCode::CustodyRejected);
  EXPECT_EQ(codeOf([&] {
              ledger.transfer("alice-usdc", "bob-usdc", "alice",
                              TokenAmount(1'001));
            }),
            ErrorCode::CustodyRejected);
  EXPECT_EQ(codeOf([&] {
              ledger.transfer("alice-usdc", "carol-usdc", "alice",
                              TokenAmount(1));
            }),
            ErrorCode::CustodyRejected);

  EXPECT_EQ(ledger.balance("alice-usdc").value(), 1'000u);
  EXPECT_EQ(ledger.balance("bob-usdc").value(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Only the mint authority may mint; burns need the holder's signature.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, MintAndBurnAuthority) {
  EXPECT_EQ(codeOf([&] {
              ledger.mint("usdc", "bob-usdc", "bob", TokenAmount(5));
            }),
            ErrorCode::CustodyRejected);
  EXPECT_EQ(codeOf([&] {
              ledger.mint("sol", "bob-usdc", "faucet", TokenAmount(5));
            }),
            ErrorCode::CustodyRejected);
  EXPECT_EQ(codeOf([&] {
              ledger.burn("usdc", "alice-usdc", "faucet", TokenAmount(5));
            }),
            ErrorCode::CustodyRejected);

  ledger.burn("usdc", "alice-usdc", "alice", TokenAmount(250));
  EXPECT_EQ(ledger.balance("alice-usdc").value(), 750u);
  EXPECT_EQ(ledger.supply("usdc").value(), 750u);

  EXPECT_EQ(codeOf([&] {
              ledger.burn("usdc", "alice-usdc", "alice", TokenAmount(751));
            }),
            ErrorCode::CustodyRejected);
}

// -----------------------------------------------------------------------------
// 4. rollback() restores balances and supply to the begin() snapshot.
// Why: This is what makes a rejected protocol operation leave no trace.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, RollbackRestoresSnapshot) {
  ledger.begin();
  ledger.transfer("alice-usdc", "bob-usdc", "alice", TokenAmount(300));
  ledger.mint("usdc", "bob-usdc", "faucet", TokenAmount(50));
  ledger.rollback();

  EXPECT_EQ(ledger.balance("alice-usdc").value(), 1'000u);
  EXPECT_EQ(ledger.balance("bob-usdc").value(), 0u);
  EXPECT_EQ(ledger.supply("usdc").value(), 1'000u);
}

// -----------------------------------------------------------------------------
// 5. commit() keeps the changes and allows the next transaction.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, CommitKeepsChanges) {
  ledger.begin();
  ledger.transfer("alice-usdc", "bob-usdc", "alice", TokenAmount(300));
  ledger.commit();

  EXPECT_EQ(ledger.balance("bob-usdc").value(), 300u);

  ledger.begin();
  ledger.transfer("bob-usdc", "alice-usdc", "bob", TokenAmount(100));
  ledger.rollback();
  EXPECT_EQ(ledger.balance("bob-usdc").value(), 300u);
}

// -----------------------------------------------------------------------------
// 6. begin() inside an open transaction is a logic error.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, NestedBeginThrows) {
  ledger.begin();
  EXPECT_THROW(ledger.begin(), std::logic_error);
  ledger.rollback();
  EXPECT_NO_THROW(ledger.begin());
  ledger.commit();
}

// -----------------------------------------------------------------------------
// 7. Account creation validates names and mints.
// -----------------------------------------------------------------------------
TEST_F(InMemoryLedgerTest, CreateValidation) {
  EXPECT_THROW(ledger.createMint("usdc", "faucet"), std::invalid_argument);
  EXPECT_THROW(ledger.createVault("alice-usdc", "usdc", "alice"),
               std::invalid_argument);
  EXPECT_THROW(ledger.createVault("x", "doge", "alice"),
               std::invalid_argument);
  EXPECT_TRUE(ledger.hasVault("bob-usdc"));
  EXPECT_FALSE(ledger.hasVault("carol-usdc"));
}
