#include "lendswap/math/interest.hpp"

#include "lendswap/domain/error.hpp"

namespace lendswap {
namespace math {

using domain::ArithmeticFault;
using domain::expectValue;

namespace {

// Number of binomial terms after the linear one.
constexpr std::uint64_t kExtraSeriesTerms = 4;

}  // namespace

Ray calculateCompounded(Rate rate, UnixTimestamp last_update,
                        UnixTimestamp now) {
  if (now < last_update) {
    throw ArithmeticFault("calculateCompounded: invalid timestamps");
  }

  const std::uint64_t elapsed = now.value() - last_update.value();
  Ray result = Ray::one();
  if (elapsed == 0) {
    return result;
  }

  const Ray rate_ray = rate.toRay();

  Ray term = expectValue(rate_ray.checkedMul(Ray(elapsed)),
                         "calculateCompounded overflow");
  result = expectValue(result.checkedAdd(term), "calculateCompounded overflow");

  for (std::uint64_t i = 1; i <= kExtraSeriesTerms; ++i) {
    if (elapsed <= i) {
      break;
    }
    const std::uint64_t multiplier = elapsed - i;

    term = expectValue(term.checkedMul(Ray(multiplier)),
                       "calculateCompounded overflow");
    term = expectValue(rate_ray.rayMul(term).checkedDiv(Ray(i + 1)),
                       "calculateCompounded overflow");
    result =
        expectValue(result.checkedAdd(term), "calculateCompounded overflow");
  }

  return result;
}

Ray calculateUtilization(TokenAmount debt, TokenAmount liquidity) {
  const Ray total = expectValue(liquidity.toRay().checkedAdd(debt.toRay()),
                                "utilization overflow");
  if (total.isZero()) {
    return Ray(0);
  }
  return debt.toRay().rayDiv(total);
}

Rate borrowRate(TokenAmount debt, TokenAmount liquidity, Rate base,
                Ray excess_slope, Ray optimal_slope,
                Ray optimal_utilization) {
  const Ray utilization = calculateUtilization(debt, liquidity);
  const Ray base_ray = base.toRay();

  Ray rate;
  auto excess = utilization.checkedSub(optimal_utilization);
  if (excess.has_value() && !excess->isZero()) {
    const Ray excess_ratio = excess->rayDiv(optimal_utilization.invert());
    const Ray with_slope = expectValue(base_ray.checkedAdd(optimal_slope),
                                       "borrowRate overflow");
    rate = expectValue(with_slope.checkedAdd(excess_slope.rayMul(excess_ratio)),
                       "borrowRate overflow");
  } else {
    const Ray ratio = utilization.rayDiv(optimal_utilization);
    rate = expectValue(base_ray.checkedAdd(optimal_slope.rayMul(ratio)),
                       "borrowRate overflow");
  }

  return rate.toRate();
}

}  // namespace math
}  // namespace lendswap
