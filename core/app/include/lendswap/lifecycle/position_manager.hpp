#pragma once

#include "lendswap/custody/i_custodian.hpp"
#include "lendswap/custody/i_transaction_host.hpp"
#include "lendswap/domain/error.hpp"
#include "lendswap/domain/governance.hpp"
#include "lendswap/domain/market.hpp"
#include "lendswap/domain/position.hpp"
#include "lendswap/domain/reserve.hpp"
#include "lendswap/eventbus/event_bus.hpp"
#include "lendswap/time/i_time_provider.hpp"
#include "lendswap/venue/i_venue.hpp"

#include <cstdint>
#include <string>

namespace lendswap {

struct OpenRequest {
  std::uint64_t limit_price{0};  // quote lots per base lot
  std::uint64_t base_qty{0};     // base lots funded by the trader
  math::Factor leverage{math::Factor::kOne};
};

struct CloseRequest {
  std::uint64_t limit_price{0};
  std::uint64_t base_qty{0};     // base lots to sell
};

// -----------------------------------------------------------------------------
// PositionManager - open / close / liquidate leveraged positions
// -----------------------------------------------------------------------------
//
// @brief  Sequences venue orders, custodial transfers and reserve accounting
//         for the three position operations.
//
// @details
// open(request):
//   1. ONE <= leverage <= max_leverage_factor, else InvalidLeverageFactor.
//   2. Borrowed base lots = (leverage - ONE) * base_qty; the order buys
//      base_qty + borrowed lots. The borrowed share of the quote cost is
//      drawn from the reserve vault, the rest from the trader.
//   3. Buy IOC at limit_price and settle into the market vaults.
//   4. Unspent quote goes back to the reserve first, up to the borrowed
//      amount. What was actually kept becomes the loan.
//   5. A non-zero loan must keep market.total_loan strictly below
//      pool_utilization_allowance * total liquidity (BorrowLimitExceeded),
//      then accrues treasury, refreshes the borrow rate and calls
//      increaseDebt with a rate multiplier that grows linearly from ONE at
//      leverage ONE to max_rate_multiplier at max_leverage_factor.
//   6. Remaining quote returns to the trader; receipt tokens for the filled
//      base quantity are minted to the position's receipt account.
//
// close(request):
//   Burns receipts for base_qty lots, sells them, repays the projected debt
//   from the proceeds (all of it, or as much as the proceeds cover with the
//   loan reduced pro rata), updates reserve accounting and pays the rest to
//   the trader.
//
// liquidate(liquidator_vault):
//   Sells the entire receipt balance at limit price 1. Rejected with
//   LiquidateHealthyPosition, after the unwind, when proceeds exceed
//   debt * (1 + liquidation_margin). Otherwise pays the liquidator
//   liquidation_reward of the proceeds (capped by max_liquidation_reward
//   unless the cap is zero), repays up to the debt to the reserve, pays any
//   surplus to the trader and writes the full debt off the position.
//
// Atomicity:
//   Every operation runs through runAtomically(). On failure the ledger is
//   rolled back, the Market / Reserve / Position references are left exactly
//   as passed in, an OperationRejectedEvent is published and the error is
//   returned. On success the references are updated and
//   PositionUpdateEvent + ReserveUpdateEvent are published.
//
// Thread model:
//   Not internally synchronized. The caller (LendingEngine) must hold
//   exclusive access to the three records and to the custodian.
//
// Ownership:
//   References to the custodian, venue, transaction host, clock and bus;
//   all must outlive the manager. Governance is copied.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  PositionManager(const domain::Governance& governance, ICustodian& custodian,
                  IVenue& venue, ITransactionHost& host,
                  const ITimeProvider& clock, EventBus& bus);

  // Checks that `market` trades the venue's pair and borrows the reserve's
  // lendable asset. InvalidMint otherwise.
  domain::OperationResult initializeMarket(const domain::Market& market,
                                           const domain::Reserve& reserve);

  // Zeroed position in Uninitialized.
  static domain::Position initializePosition(
      const domain::AccountId& trader, const domain::AccountId& market,
      const domain::AccountId& receipt_account,
      const domain::AccountId& trader_quote_vault);

  domain::OperationResult open(domain::Market& market,
                               domain::Reserve& reserve,
                               domain::Position& position,
                               const OpenRequest& request);

  domain::OperationResult close(domain::Market& market,
                                domain::Reserve& reserve,
                                domain::Position& position,
                                const CloseRequest& request);

  domain::OperationResult liquidate(domain::Market& market,
                                    domain::Reserve& reserve,
                                    domain::Position& position,
                                    const domain::AccountId& liquidator_vault);

  const domain::Governance& governance() const { return governance_; }

 private:
  void doOpen(domain::Market& market, domain::Reserve& reserve,
              domain::Position& position, const OpenRequest& request,
              math::UnixTimestamp now);
  void doClose(domain::Market& market, domain::Reserve& reserve,
               domain::Position& position, const CloseRequest& request,
               math::UnixTimestamp now);
  void doLiquidate(domain::Market& market, domain::Reserve& reserve,
                   domain::Position& position,
                   const domain::AccountId& liquidator_vault,
                   math::UnixTimestamp now);

  // Reserve-side bookkeeping of a repayment: treasury accrual, debt
  // decrease and borrow-rate refresh. `reserve_liquidity` is the vault
  // balance at the start of the operation.
  void recordRepayment(domain::Reserve& reserve,
                       domain::PositionState& position,
                       math::UnixTimestamp now, math::TokenAmount debt_change,
                       math::TokenAmount reserve_liquidity);

  // (leverage - ONE) * (max_rate_multiplier - ONE)
  //   / (max_leverage_factor - ONE) + ONE
  math::Factor rateMultiplier(math::Factor leverage) const;

  // Sends whatever quote is left in the market vault to the trader.
  void returnTraderFunds(const domain::Market& market,
                         const domain::Position& position);

  domain::OperationResult finish(const std::string& operation,
                                 const domain::OperationResult& result,
                                 const domain::Market& market,
                                 const domain::Reserve& reserve,
                                 const domain::Position& position);

  domain::Governance governance_;
  ICustodian& custodian_;
  IVenue& venue_;
  ITransactionHost& host_;
  const ITimeProvider& clock_;
  EventBus& bus_;
};

}  // namespace lendswap
