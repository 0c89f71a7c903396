#pragma once

#include "lendswap/custody/i_custodian.hpp"
#include "lendswap/custody/i_transaction_host.hpp"
#include "lendswap/domain/error.hpp"
#include "lendswap/domain/governance.hpp"
#include "lendswap/domain/reserve.hpp"
#include "lendswap/eventbus/event_bus.hpp"
#include "lendswap/time/i_time_provider.hpp"

#include <string>

namespace lendswap {

// -----------------------------------------------------------------------------
// ReserveManager - liquidity provider deposits and withdrawals
// -----------------------------------------------------------------------------
//
// @brief  Moves lendable tokens in and out of a reserve's vault against
//         redeemable (LP) tokens.
//
// @details
// deposit(amount):
//   Accrues treasury on the projected pool debt, refreshes the borrow rate
//   for the added liquidity, then mints mintAmount(amount, supply,
//   availableLiquidity) LP tokens for the investor after pulling `amount`
//   from the investor vault.
//
// withdraw(redeemable_amount):
//   Values the LP tokens with calculateShare(redeemable_amount, supply,
//   availableLiquidity). If that value exceeds the idle vault balance only
//   the idle balance is paid out and a proportional number of LP tokens is
//   burned; the rest stays with the investor. The valuation uses the pool
//   state before treasury accrual.
//
// Both reject a zero amount with InvalidArgument. Atomicity, events and
// logging follow PositionManager.
//
// Thread model:
//   Not internally synchronized; LendingEngine serializes access.
// -----------------------------------------------------------------------------
class ReserveManager {
 public:
  ReserveManager(const domain::Governance& governance, ICustodian& custodian,
                 ITransactionHost& host, const ITimeProvider& clock,
                 EventBus& bus);

  domain::OperationResult deposit(domain::Reserve& reserve,
                                  const domain::AccountId& investor,
                                  const domain::AccountId& investor_vault,
                                  const domain::AccountId& investor_lp_vault,
                                  math::TokenAmount amount);

  domain::OperationResult withdraw(domain::Reserve& reserve,
                                   const domain::AccountId& investor,
                                   const domain::AccountId& investor_lp_vault,
                                   const domain::AccountId& investor_vault,
                                   math::TokenAmount redeemable_amount);

 private:
  void doDeposit(domain::Reserve& reserve, const domain::AccountId& investor,
                 const domain::AccountId& investor_vault,
                 const domain::AccountId& investor_lp_vault,
                 math::TokenAmount amount, math::UnixTimestamp now);
  void doWithdraw(domain::Reserve& reserve, const domain::AccountId& investor,
                  const domain::AccountId& investor_lp_vault,
                  const domain::AccountId& investor_vault,
                  math::TokenAmount redeemable_amount,
                  math::UnixTimestamp now);

  domain::OperationResult finish(const std::string& operation,
                                 const domain::AccountId& investor,
                                 const domain::OperationResult& result,
                                 const domain::Reserve& reserve);

  domain::Governance governance_;
  ICustodian& custodian_;
  ITransactionHost& host_;
  const ITimeProvider& clock_;
  EventBus& bus_;
};

}  // namespace lendswap
