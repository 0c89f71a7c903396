#include "lendswap/domain/governance.hpp"

#include "lendswap/domain/error.hpp"

#include <string>

namespace lendswap {
namespace domain {

namespace {

std::uint64_t applyAccuracy(u128 value, const char* field) {
  auto normalized = math::narrowToU64(value / Governance::kAccuracyDivisor);
  if (!normalized) {
    throw ArithmeticFault(std::string("Governance::") + field + " overflow");
  }
  return *normalized;
}

}  // namespace

u128 Governance::withAccuracy(std::uint64_t value) {
  return static_cast<u128>(value) * kAccuracyDivisor;
}

math::Factor Governance::poolUtilizationAllowance() const {
  return math::Factor(
      applyAccuracy(pool_utilization_allowance, "pool_utilization_allowance"));
}

math::Factor Governance::treasureFactor() const {
  return math::Factor(applyAccuracy(treasure_factor, "treasure_factor"));
}

math::Factor Governance::maxLeverageFactor() const {
  return math::Factor(
      applyAccuracy(max_leverage_factor, "max_leverage_factor"));
}

math::Factor Governance::maxRateMultiplier() const {
  return math::Factor(
      applyAccuracy(max_rate_multiplier, "max_rate_multiplier"));
}

math::Factor Governance::liquidationMargin() const {
  return math::Factor(applyAccuracy(liquidation_margin, "liquidation_margin"));
}

math::Factor Governance::liquidationReward() const {
  return math::Factor(applyAccuracy(liquidation_reward, "liquidation_reward"));
}

math::TokenAmount Governance::maxLiquidationReward() const {
  return math::TokenAmount(
      applyAccuracy(max_liquidation_reward, "max_liquidation_reward"));
}

}  // namespace domain
}  // namespace lendswap
