#include "lendswap/accounting/reserve_accounting.hpp"

#include "lendswap/domain/error.hpp"
#include "lendswap/math/interest.hpp"

namespace lendswap {
namespace accounting {

using domain::expectValue;
using math::Rate;
using math::Ray;
using math::TokenAmount;
using math::UnixTimestamp;

namespace {

// Token amount lifted onto the Ray scale for rate weighting.
Ray weight(TokenAmount amount) { return amount.toWad().toRay(); }

}  // namespace

TokenAmount projectTotalDebt(const domain::ReserveDebt& debt,
                             UnixTimestamp now) {
  const Ray multiplier =
      math::calculateCompounded(debt.average_rate, debt.last_update, now);
  return debt.total.toRay().rayMul(multiplier).toTokenAmount();
}

TokenAmount projectPositionDebt(const domain::PositionState& position,
                                UnixTimestamp now) {
  const Ray multiplier =
      math::calculateCompounded(position.rate, position.timestamp, now);
  return position.amount.toRay().rayMul(multiplier).toTokenAmount();
}

std::pair<TokenAmount, TokenAmount> debtIncrease(
    const domain::PositionState& position, UnixTimestamp now) {
  if (position.amount.isZero()) {
    return {TokenAmount(0), TokenAmount(0)};
  }
  const TokenAmount current = projectPositionDebt(position, now);
  const TokenAmount increase = expectValue(current.checkedSub(position.amount),
                                           "position debt decreased");
  return {current, increase};
}

void accrueTreasury(domain::Reserve& reserve,
                    const domain::Governance& governance,
                    TokenAmount current_total_debt, UnixTimestamp now) {
  TokenAmount fee(0);
  if (!current_total_debt.isZero()) {
    const TokenAmount previous_debt =
        projectTotalDebt(reserve.debt, reserve.state.treasurer_update);
    const TokenAmount accrued = expectValue(
        current_total_debt.checkedSub(previous_debt), "invalid debt");
    fee = governance.treasureFactor().percentageOf(accrued);
  }

  reserve.state.treasure_accrued =
      expectValue(reserve.state.treasure_accrued.checkedAdd(fee),
                  "accrued treasure overflow");
  reserve.state.treasurer_update = now;
}

TokenAmount availableLiquidity(const domain::Reserve& reserve,
                               TokenAmount total_debt,
                               TokenAmount vault_balance) {
  const TokenAmount gross = expectValue(total_debt.checkedAdd(vault_balance),
                                        "total liquidity overflow");
  return expectValue(gross.checkedSub(reserve.state.treasure_accrued),
                     "total liquidity underflow");
}

void refreshBorrowRate(domain::Reserve& reserve,
                       const domain::Governance& governance,
                       TokenAmount liquidity, TokenAmount liquidity_added,
                       TokenAmount liquidity_removed, TokenAmount debt,
                       TokenAmount debt_added, TokenAmount debt_removed) {
  const TokenAmount next_debt = expectValue(
      expectValue(debt.checkedAdd(debt_added), "debt overflow")
          .checkedSub(debt_removed),
      "debt underflow");
  const TokenAmount next_liquidity = expectValue(
      expectValue(liquidity.checkedAdd(liquidity_added), "liquidity overflow")
          .checkedSub(liquidity_removed),
      "liquidity underflow");

  reserve.state.borrow_rate = math::borrowRate(
      next_debt, next_liquidity, governance.baseBorrowRate(),
      governance.excessSlope(), governance.optimalSlope(),
      governance.optimalUtilization());
}

void increaseDebt(domain::Reserve& reserve, domain::PositionState& position,
                  UnixTimestamp now, TokenAmount previous_total,
                  TokenAmount amount, math::Factor rate_multiplier) {
  const Rate rate(
      rate_multiplier.percentageMul(reserve.state.borrow_rate.value()));
  const Ray amount_rate = weight(amount).rayMul(rate.toRay());

  const auto [current_debt, increase] = debtIncrease(position, now);

  const TokenAmount next_total =
      expectValue(previous_total.checkedAdd(amount), "total debt overflow");
  reserve.debt.total = next_total;

  position.amount = expectValue(
      expectValue(position.amount.checkedAdd(amount), "amount overflow")
          .checkedAdd(increase),
      "amount overflow");

  const TokenAmount next_position_debt =
      expectValue(current_debt.checkedAdd(amount), "debt overflow");
  const Ray blended_position = expectValue(
      position.rate.toRay().rayMul(weight(current_debt)).checkedAdd(amount_rate),
      "rate overflow");
  position.rate = blended_position.rayDiv(weight(next_position_debt)).toRate();
  position.timestamp = now;

  const Ray blended_pool = expectValue(
      reserve.debt.average_rate.toRay()
          .rayMul(weight(previous_total))
          .checkedAdd(amount_rate),
      "rate overflow");
  reserve.debt.average_rate = blended_pool.rayDiv(weight(next_total)).toRate();
  reserve.debt.last_update = now;
}

void decreaseDebt(domain::Reserve& reserve, domain::PositionState& position,
                  UnixTimestamp now, TokenAmount pool_total_debt,
                  TokenAmount amount) {
  const auto [current_debt, increase] = debtIncrease(position, now);

  if (pool_total_debt <= amount) {
    reserve.debt.average_rate = Rate(0);
    reserve.debt.total = TokenAmount(0);
  } else {
    const TokenAmount next_total = *pool_total_debt.checkedSub(amount);
    reserve.debt.total = next_total;

    const Ray pool_share =
        reserve.debt.average_rate.toRay().rayMul(weight(pool_total_debt));
    const Ray position_share = position.rate.toRay().rayMul(weight(amount));

    if (position_share >= pool_share) {
      reserve.debt.average_rate = Rate(0);
      reserve.debt.total = TokenAmount(0);
    } else {
      reserve.debt.average_rate = (*pool_share.checkedSub(position_share))
                                      .rayDiv(weight(next_total))
                                      .toRate();
    }
  }

  if (amount == current_debt) {
    position.rate = Rate(0);
    position.amount = TokenAmount(0);
    position.timestamp = UnixTimestamp(0);
  } else {
    position.amount = expectValue(
        expectValue(position.amount.checkedAdd(increase), "amount overflow")
            .checkedSub(amount),
        "amount underflow");
    position.timestamp = now;
  }

  reserve.debt.last_update = now;
}

}  // namespace accounting
}  // namespace lendswap
