#pragma once

#include "lendswap/domain/governance.hpp"
#include "lendswap/domain/position.hpp"
#include "lendswap/domain/reserve.hpp"
#include "lendswap/math/fixed_point.hpp"

#include <utility>

namespace lendswap {
namespace accounting {

// -----------------------------------------------------------------------------
// Reserve accounting
// -----------------------------------------------------------------------------
//
// @brief  Pure state transitions over Reserve and PositionState: debt
//         projection, treasury accrual, borrow-rate refresh and the two debt
//         mutations (increase on borrow, decrease on repay).
//
// @details
// None of these functions talk to the custodian or the venue. The lifecycle
// managers call them in a fixed order inside one operation:
//
//   total = projectTotalDebt(reserve.debt, now)
//   accrueTreasury(reserve, gov, total, now)
//   increaseDebt / decreaseDebt (when debt moves)
//   refreshBorrowRate(...)
//
// Every arithmetic failure throws domain::ArithmeticFault. Callers work on
// copies of the records, so a throw leaves the persisted records untouched.
//
// Thread-safety: Stateless. Records are passed by reference and must be
// exclusively owned by the calling operation.
// -----------------------------------------------------------------------------

// total * compound(average_rate, last_update, now)
math::TokenAmount projectTotalDebt(const domain::ReserveDebt& debt,
                                   math::UnixTimestamp now);

// amount * compound(rate, timestamp, now)
math::TokenAmount projectPositionDebt(const domain::PositionState& position,
                                      math::UnixTimestamp now);

// (projected debt, projected debt - amount); (0, 0) for a position with no
// debt.
std::pair<math::TokenAmount, math::TokenAmount> debtIncrease(
    const domain::PositionState& position, math::UnixTimestamp now);

// -------------------------------------------------------------------------
// accrueTreasury(reserve, governance, current_total_debt, now)
// -------------------------------------------------------------------------
// @brief  Credits the treasury with its share of interest accrued since
//         the previous treasury checkpoint, then advances the checkpoint.
//
// @details
// previous = debt.total compounded from debt.last_update to
//            state.treasurer_update
// fee      = treasure_factor * (current_total_debt - previous)
//
// No fee while the pool has no debt. current < previous cannot happen while
// the checkpoints are maintained by this module and faults if it does.
// -------------------------------------------------------------------------
void accrueTreasury(domain::Reserve& reserve,
                    const domain::Governance& governance,
                    math::TokenAmount current_total_debt,
                    math::UnixTimestamp now);

// total_debt + vault_balance - treasure_accrued; faults if negative.
math::TokenAmount availableLiquidity(const domain::Reserve& reserve,
                                     math::TokenAmount total_debt,
                                     math::TokenAmount vault_balance);

// Sets state.borrow_rate from the utilization implied by the post-operation
// debt (debt + debt_added - debt_removed) and liquidity (liquidity +
// liquidity_added - liquidity_removed).
void refreshBorrowRate(domain::Reserve& reserve,
                       const domain::Governance& governance,
                       math::TokenAmount liquidity,
                       math::TokenAmount liquidity_added,
                       math::TokenAmount liquidity_removed,
                       math::TokenAmount debt,
                       math::TokenAmount debt_added,
                       math::TokenAmount debt_removed);

// -------------------------------------------------------------------------
// increaseDebt(reserve, position, now, previous_total, amount, multiplier)
// -------------------------------------------------------------------------
// @brief  Records `amount` of new borrowing by `position`.
//
// @details
// The position borrows at borrow_rate * rate_multiplier. Its interest
// accrued so far is capitalized into `amount`, and its rate becomes the
// debt-weighted blend of the old rate on the current debt and the new rate
// on the new principal. The pool total becomes previous_total + amount and
// its average rate is blended the same way. Both checkpoints move to `now`.
//
// `previous_total` must be the pool debt projected to `now`.
// -------------------------------------------------------------------------
void increaseDebt(domain::Reserve& reserve, domain::PositionState& position,
                  math::UnixTimestamp now, math::TokenAmount previous_total,
                  math::TokenAmount amount, math::Factor rate_multiplier);

// -------------------------------------------------------------------------
// decreaseDebt(reserve, position, now, pool_total_debt, amount)
// -------------------------------------------------------------------------
// @brief  Records a repayment of `amount` by `position`.
//
// @details
// Pool side: total = pool_total_debt - amount and the position's rate share
// is removed from the average rate. When the repayment reaches or exceeds
// the pool total, or the position's rate share reaches or exceeds the
// pool's, both the pool total and the average rate are zeroed. Position
// debt and pool debt accrue separately and drift by rounding; this is how
// the last borrower clears the pool.
//
// Position side: a repayment equal to the projected debt zeroes the
// position (rate, amount, timestamp); otherwise accrued interest is
// capitalized and `amount` subtracted.
//
// `pool_total_debt` must be the pool debt projected to `now`.
// -------------------------------------------------------------------------
void decreaseDebt(domain::Reserve& reserve, domain::PositionState& position,
                  math::UnixTimestamp now, math::TokenAmount pool_total_debt,
                  math::TokenAmount amount);

}  // namespace accounting
}  // namespace lendswap
