#include "lendswap/lifecycle/reserve_manager.hpp"

#include "lendswap/accounting/reserve_accounting.hpp"
#include "lendswap/lifecycle/atomic_operation.hpp"
#include "lendswap/math/liquidity.hpp"

#include <chrono>
#include <iostream>

namespace lendswap {

using domain::AccountId;
using domain::ErrorCode;
using domain::OperationResult;
using domain::ProtocolError;
using domain::Reserve;
using math::TokenAmount;
using math::UnixTimestamp;

namespace {
constexpr const char* kComponent = "ReserveManager";
}  // namespace

ReserveManager::ReserveManager(const domain::Governance& governance,
                               ICustodian& custodian, ITransactionHost& host,
                               const ITimeProvider& clock, EventBus& bus)
    : governance_(governance),
      custodian_(custodian),
      host_(host),
      clock_(clock),
      bus_(bus) {}

OperationResult ReserveManager::deposit(Reserve& reserve,
                                        const AccountId& investor,
                                        const AccountId& investor_vault,
                                        const AccountId& investor_lp_vault,
                                        TokenAmount amount) {
  const UnixTimestamp now = UnixTimestamp::fromMillis(clock_.now_ms());
  Reserve next = reserve;
  const OperationResult result =
      runAtomically(host_, kComponent, "deposit", [&] {
        doDeposit(next, investor, investor_vault, investor_lp_vault, amount,
                  now);
        reserve = next;
      });
  return finish("deposit", investor, result, reserve);
}

OperationResult ReserveManager::withdraw(Reserve& reserve,
                                         const AccountId& investor,
                                         const AccountId& investor_lp_vault,
                                         const AccountId& investor_vault,
                                         TokenAmount redeemable_amount) {
  const UnixTimestamp now = UnixTimestamp::fromMillis(clock_.now_ms());
  Reserve next = reserve;
  const OperationResult result =
      runAtomically(host_, kComponent, "withdraw", [&] {
        doWithdraw(next, investor, investor_lp_vault, investor_vault,
                   redeemable_amount, now);
        reserve = next;
      });
  return finish("withdraw", investor, result, reserve);
}

void ReserveManager::doDeposit(Reserve& reserve, const AccountId& investor,
                               const AccountId& investor_vault,
                               const AccountId& investor_lp_vault,
                               TokenAmount amount, UnixTimestamp now) {
  if (amount.isZero()) {
    throw ProtocolError(ErrorCode::InvalidArgument, "deposit amount is zero");
  }

  const TokenAmount total_debt = accounting::projectTotalDebt(reserve.debt, now);
  accounting::accrueTreasury(reserve, governance_, total_debt, now);

  const TokenAmount liquidity = custodian_.balance(reserve.lendable_vault);
  accounting::refreshBorrowRate(reserve, governance_, liquidity, amount,
                                TokenAmount(0), total_debt, TokenAmount(0),
                                TokenAmount(0));

  const TokenAmount supply = custodian_.supply(reserve.redeemable_mint);
  const TokenAmount total_liquidity =
      accounting::availableLiquidity(reserve, total_debt, liquidity);
  const TokenAmount minted = math::mintAmount(amount, supply, total_liquidity);

  custodian_.transfer(investor_vault, reserve.lendable_vault, investor, amount);
  custodian_.mint(reserve.redeemable_mint, investor_lp_vault, reserve.signer,
                  minted);
}

void ReserveManager::doWithdraw(Reserve& reserve, const AccountId& investor,
                                const AccountId& investor_lp_vault,
                                const AccountId& investor_vault,
                                TokenAmount redeemable_amount,
                                UnixTimestamp now) {
  if (redeemable_amount.isZero()) {
    throw ProtocolError(ErrorCode::InvalidArgument, "withdraw amount is zero");
  }

  const TokenAmount liquidity = custodian_.balance(reserve.lendable_vault);
  const TokenAmount supply = custodian_.supply(reserve.redeemable_mint);
  const TokenAmount total_debt = accounting::projectTotalDebt(reserve.debt, now);
  const TokenAmount total_liquidity =
      accounting::availableLiquidity(reserve, total_debt, liquidity);

  TokenAmount payout =
      math::calculateShare(redeemable_amount, supply, total_liquidity);
  TokenAmount burned = redeemable_amount;
  if (payout > liquidity) {
    // Only idle liquidity can leave; burn the matching share of LP tokens.
    const math::Wad portion = liquidity.toWad().wadDiv(payout.toWad());
    burned = redeemable_amount.toWad().wadMul(portion).toTokenAmount();
    payout = liquidity;
  }

  accounting::accrueTreasury(reserve, governance_, total_debt, now);
  accounting::refreshBorrowRate(reserve, governance_, liquidity,
                                TokenAmount(0), payout, total_debt,
                                TokenAmount(0), TokenAmount(0));

  custodian_.burn(reserve.redeemable_mint, investor_lp_vault, investor,
                  burned);
  custodian_.transfer(reserve.lendable_vault, investor_vault, reserve.signer,
                      payout);
}

OperationResult ReserveManager::finish(const std::string& operation,
                                       const AccountId& investor,
                                       const OperationResult& result,
                                       const Reserve& reserve) {
  const auto stamp = std::chrono::system_clock::now();

  if (!result.ok()) {
    OperationRejectedEvent rejected;
    rejected.operation = operation;
    rejected.subject = investor;
    rejected.code = result.code;
    rejected.message = result.message;
    rejected.timestamp = stamp;
    bus_.publish(rejected);
    return result;
  }

  const TokenAmount vault_balance = custodian_.balance(reserve.lendable_vault);
  const TokenAmount supply = custodian_.supply(reserve.redeemable_mint);
  std::cout << "[" << kComponent << "] " << operation << " by " << investor
            << ": vault=" << vault_balance.value()
            << " lp_supply=" << supply.value()
            << " debt=" << reserve.debt.total.value() << "\n";

  ReserveUpdateEvent update;
  update.operation = operation;
  update.reserve = reserve;
  update.vault_balance = vault_balance;
  update.redeemable_supply = supply;
  update.timestamp = stamp;
  bus_.publish(update);
  return result;
}

}  // namespace lendswap
