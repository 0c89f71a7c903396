#include "lendswap/math/liquidity.hpp"

namespace lendswap {
namespace math {

TokenAmount mintAmount(TokenAmount amount, TokenAmount total_supply,
                       TokenAmount total_liquidity) {
  Wad index = Wad::one();
  if (!total_supply.isZero() && !total_liquidity.isZero()) {
    index = total_supply.toWad().wadDiv(total_liquidity.toWad());
  }
  return amount.toWad().wadMul(index).toTokenAmount();
}

TokenAmount calculateShare(TokenAmount part, TokenAmount total,
                           TokenAmount total_liquidity) {
  Wad share(0);
  if (!total.isZero()) {
    share = part.toWad().wadDiv(total.toWad());
  }
  return share.wadMul(total_liquidity.toWad()).toTokenAmount();
}

}  // namespace math
}  // namespace lendswap
