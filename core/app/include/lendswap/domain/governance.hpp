#pragma once

#include "lendswap/math/fixed_point.hpp"

namespace lendswap {
namespace domain {

// -----------------------------------------------------------------------------
// Governance - protocol-wide parameter snapshot
// -----------------------------------------------------------------------------
//
// @brief  Read-only economic parameters consumed by reserve accounting and
//         the position lifecycle.
//
// @details
// Values are stored exactly as the governance authority publishes them:
// 128-bit integers at 1e18 accuracy for factors and the reward cap, and raw
// scaled integers for rates and slopes. The accessors normalize on read:
//
//   Factor accessors     raw / 1e18 -> Factor (10'000 == 100%)
//   maxLiquidationReward raw / 1e18 -> TokenAmount
//   baseBorrowRate       raw        -> Rate
//   excessSlope, optimalSlope, optimalUtilization
//                        raw        -> Ray
//
// A normalized value that does not fit 64 bits is a configuration fault and
// throws ArithmeticFault.
//
// Loaded from the `governance` section of the engine config file
// (config/engine_config.hpp). Copied by value into every component that
// needs it; nothing mutates it after load.
// -----------------------------------------------------------------------------
struct Governance {
  static constexpr u128 kAccuracyDivisor = 1'000'000'000'000'000'000ULL;

  u128 pool_utilization_allowance{0};
  u128 base_borrow_rate{0};
  u128 excess_slope{0};
  u128 optimal_slope{0};
  u128 optimal_utilization{0};
  u128 treasure_factor{0};
  u128 max_leverage_factor{0};
  u128 max_rate_multiplier{0};
  u128 liquidation_margin{0};
  u128 liquidation_reward{0};
  u128 max_liquidation_reward{0};

  // Inverse of the accuracy normalization: value * 1e18.
  static u128 withAccuracy(std::uint64_t value);

  math::Factor poolUtilizationAllowance() const;
  math::Factor treasureFactor() const;
  math::Factor maxLeverageFactor() const;
  math::Factor maxRateMultiplier() const;
  math::Factor liquidationMargin() const;
  math::Factor liquidationReward() const;
  math::TokenAmount maxLiquidationReward() const;

  math::Rate baseBorrowRate() const { return math::Rate(base_borrow_rate); }
  math::Ray excessSlope() const { return math::Ray(excess_slope); }
  math::Ray optimalSlope() const { return math::Ray(optimal_slope); }
  math::Ray optimalUtilization() const {
    return math::Ray(optimal_utilization);
  }
};

}  // namespace domain
}  // namespace lendswap
