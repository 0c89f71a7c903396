#pragma once

#include "lendswap/math/fixed_point.hpp"

namespace lendswap {
namespace math {

// -----------------------------------------------------------------------------
// Interest accrual engine
// -----------------------------------------------------------------------------
//
// @brief  Pure functions that turn per-second rates and elapsed time into
//         compounding multipliers, and pool utilization into a borrow rate.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// calculateCompounded(rate, last_update, now)
// -------------------------------------------------------------------------
// @brief  Compounding multiplier (Ray, ONE == 1.0) for `rate` applied per
//         second over [last_update, now].
//
// @details
// Truncated binomial expansion of (1 + r)^n with n = now - last_update:
//
//   1 + r*n + sum_{i=1..4} term_{i+1}
//   term_1     = r * n                      (raw integer product)
//   term_{i+1} = rayMul(r, term_i * (n - i)) / (i + 1)
//
// The series stops as soon as n - i reaches zero, so short intervals use
// fewer terms. Returns exactly ONE when n == 0.
//
// @throws domain::ArithmeticFault when now < last_update or on overflow.
// -------------------------------------------------------------------------
Ray calculateCompounded(Rate rate, UnixTimestamp last_update,
                        UnixTimestamp now);

// debt / (liquidity + debt). An empty pool (both zero) has utilization 0.
Ray calculateUtilization(TokenAmount debt, TokenAmount liquidity);

// -------------------------------------------------------------------------
// borrowRate(...)
// -------------------------------------------------------------------------
// @brief  Two-slope kinked borrow rate.
//
// @details
//   u  = utilization(debt, liquidity)
//   u > optimal:  base + optimal_slope
//                 + excess_slope * (u - optimal) / (1 - optimal)
//   u <= optimal: base + optimal_slope * u / optimal
//
// `base` is read on the Rate scale and converted to Ray before summing;
// the result is converted back to Rate. Both branches meet at the kink.
//
// @throws domain::ArithmeticFault on overflow or when optimal == 0.
// -------------------------------------------------------------------------
Rate borrowRate(TokenAmount debt, TokenAmount liquidity, Rate base,
                Ray excess_slope, Ray optimal_slope, Ray optimal_utilization);

}  // namespace math
}  // namespace lendswap
