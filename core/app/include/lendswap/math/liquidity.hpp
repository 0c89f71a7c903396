#pragma once

#include "lendswap/math/fixed_point.hpp"

namespace lendswap {
namespace math {

// Redeemable (LP) tokens to mint for a deposit of `amount` into a pool whose
// redeemable supply is `total_supply` and whose total liquidity (idle plus
// lent out, net of treasury) is `total_liquidity`. The exchange index is
// supply / liquidity, or 1.0 while either side is empty.
TokenAmount mintAmount(TokenAmount amount, TokenAmount total_supply,
                       TokenAmount total_liquidity);

// (part / total) * total_liquidity, computed on the Wad scale. Zero when
// total == 0. Values LP tokens on withdrawal and pro-rates a position's
// loan on a partial repayment.
TokenAmount calculateShare(TokenAmount part, TokenAmount total,
                           TokenAmount total_liquidity);

}  // namespace math
}  // namespace lendswap
