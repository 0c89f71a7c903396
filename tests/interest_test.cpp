// =============================================================================
// interest_test.cpp
// =============================================================================
// Unit tests for the interest model (compounding, utilization, borrow rate).
//
// Validates:
//   - Compounding identity at zero elapsed time and linear first step
//   - Compounded multiplier is monotonic in elapsed time and tracks e^(r*t)
//   - A clock running backwards is an ArithmeticFault
//   - Utilization of an empty pool is zero
//   - The two-slope borrow curve is continuous at the optimal utilization
// =============================================================================

#include "lendswap/domain/error.hpp"
#include "lendswap/math/interest.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using lendswap::u128;
using lendswap::domain::ArithmeticFault;
using lendswap::math::Rate;
using lendswap::math::Ray;
using lendswap::math::TokenAmount;
using lendswap::math::UnixTimestamp;
using lendswap::math::toString;

namespace {

constexpr std::uint64_t kSecondsPerYear = 31'536'000;

// 5% a year, per second, at Rate scale.
const Rate kFivePercent(static_cast<u128>(1'585'489'599ULL) *
                        Rate::kRayRatio);

double toDouble(Ray value) {
  return static_cast<double>(value.value()) / static_cast<double>(Ray::kOne);
}

}  // namespace

class InterestTest : public ::testing::Test {
 protected:
  const Rate base{static_cast<u128>(634'195'839'675'291'000ULL)};
  const Ray optimal_slope{static_cast<u128>(1'268'391'679ULL)};
  const Ray excess_slope{static_cast<u128>(23'782'343'987ULL)};
  const Ray optimal_utilization{static_cast<u128>(800'000'000'000'000'000ULL)};

  Rate rateAt(std::uint64_t debt, std::uint64_t liquidity) const {
    return lendswap::math::borrowRate(TokenAmount(debt),
                                      TokenAmount(liquidity), base,
                                      excess_slope, optimal_slope,
                                      optimal_utilization);
  }

  const UnixTimestamp t0{1'700'000'000};
};

// -----------------------------------------------------------------------------
// 1. No elapsed time means a multiplier of exactly one.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, ZeroElapsedIsIdentity) {
  EXPECT_TRUE(lendswap::math::calculateCompounded(kFivePercent, t0, t0) ==
              Ray::one());
  EXPECT_TRUE(lendswap::math::calculateCompounded(Rate(0), t0,
                                                  UnixTimestamp(t0.value() +
                                                                1000)) ==
              Ray::one());
}

// -----------------------------------------------------------------------------
// 2. One second of interest is ONE + rate.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, SingleSecondIsLinear) {
  const Ray one_second = lendswap::math::calculateCompounded(
      kFivePercent, t0, UnixTimestamp(t0.value() + 1));
  EXPECT_EQ(toString(one_second.value()), "1000000001585489599");
}

// -----------------------------------------------------------------------------
// 3. The multiplier never decreases as time passes.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, MonotonicInElapsedTime) {
  const std::uint64_t samples[] = {1,      2,         3,
                                    5,      60,        3600,
                                    86'400, 2'592'000, kSecondsPerYear,
                                    5 * kSecondsPerYear};
  Ray previous = Ray::one();
  for (std::uint64_t elapsed : samples) {
    const Ray current = lendswap::math::calculateCompounded(
        kFivePercent, t0, UnixTimestamp(t0.value() + elapsed));
    EXPECT_TRUE(current > previous) << "elapsed=" << elapsed;
    previous = current;
  }
}

// -----------------------------------------------------------------------------
// 4. A year at 5% compounds to e^0.05 within the truncated series error.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, AnnualCompoundingMatchesExponential) {
  const Ray year = lendswap::math::calculateCompounded(
      kFivePercent, t0, UnixTimestamp(t0.value() + kSecondsPerYear));
  EXPECT_NEAR(toDouble(year), 1.0512710963760241, 1e-8);
}

// -----------------------------------------------------------------------------
// 5. A checkpoint in the future is a fault, never a silent zero.
// Why: It means a record was written with a clock ahead of the current one.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, BackwardsClockFaults) {
  EXPECT_THROW(lendswap::math::calculateCompounded(
                   kFivePercent, t0, UnixTimestamp(t0.value() - 1)),
               ArithmeticFault);
}

// -----------------------------------------------------------------------------
// 6. An empty pool has zero utilization and pays the base rate.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, EmptyPoolUtilizationIsZero) {
  EXPECT_TRUE(lendswap::math::calculateUtilization(TokenAmount(0),
                                                   TokenAmount(0)) == Ray(0));
  EXPECT_EQ(toString(rateAt(0, 0).value()), "634195839000000000");
  EXPECT_EQ(toString(rateAt(0, 1'000'000).value()), "634195839000000000");
}

// -----------------------------------------------------------------------------
// 7. Utilization is debt / (debt + liquidity).
// -----------------------------------------------------------------------------
TEST_F(InterestTest, UtilizationRatio) {
  EXPECT_EQ(toString(lendswap::math::calculateUtilization(TokenAmount(200'000),
                                                          TokenAmount(800'000))
                         .value()),
            "200000000000000000");
  EXPECT_TRUE(lendswap::math::calculateUtilization(TokenAmount(5),
                                                   TokenAmount(0)) ==
              Ray::one());
}

// -----------------------------------------------------------------------------
// 8. At the kink the rate is base + optimal_slope, and both neighbours are
//    within a rounding step of it.
// Why: A jump at the kink would let one unit of debt swing the rate.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, BorrowRateContinuousAtKink) {
  const Rate at_kink = rateAt(800, 200);
  const Rate expected =
      Ray(base.toRay().value() + optimal_slope.value()).toRate();
  EXPECT_TRUE(at_kink == expected);

  const Rate below = rateAt(799'999, 200'001);
  const Rate above = rateAt(800'001, 199'999);
  EXPECT_TRUE(below < at_kink);
  EXPECT_TRUE(above > at_kink);

  const u128 tolerance =
      Ray(optimal_slope.value() / 1000).toRate().value();
  EXPECT_TRUE(at_kink.value() - below.value() < tolerance);
  EXPECT_TRUE(above.value() - at_kink.value() <
              Ray(excess_slope.value() / 1000).toRate().value());
}

// -----------------------------------------------------------------------------
// 9. Full utilization pays base + optimal_slope + excess_slope.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, FullUtilizationRate) {
  EXPECT_EQ(toString(rateAt(1000, 0).value()), "25684931505000000000");
}

// -----------------------------------------------------------------------------
// 10. Below the kink the slope is linear in utilization.
// -----------------------------------------------------------------------------
TEST_F(InterestTest, LinearBelowKink) {
  // 20% utilization: base + optimal_slope * 0.25
  const Rate quarter = rateAt(200'000, 800'000);
  const u128 expected_ray =
      base.toRay().value() + (optimal_slope.value() * 25 + 50) / 100;
  EXPECT_EQ(toString(quarter.value()), toString(expected_ray * Rate::kRayRatio));
}
