#include "lendswap/math/fixed_point.hpp"

#include "lendswap/domain/error.hpp"

namespace lendswap {
namespace math {

using domain::expectValue;

UnixTimestamp UnixTimestamp::fromMillis(std::int64_t ms) {
  if (ms <= 0) {
    return UnixTimestamp(0);
  }
  return UnixTimestamp(static_cast<std::uint64_t>(ms / 1000));
}

// -----------------------------------------------------------------------------
// TokenAmount
// -----------------------------------------------------------------------------
std::optional<TokenAmount> TokenAmount::fromU128(u128 value) {
  auto narrowed = narrowToU64(value);
  if (!narrowed) {
    return std::nullopt;
  }
  return TokenAmount(*narrowed);
}

Wad TokenAmount::toWad() const { return Wad(static_cast<u128>(value())); }

Ray TokenAmount::toRay() const { return Ray(static_cast<u128>(value())); }

// -----------------------------------------------------------------------------
// Factor
// -----------------------------------------------------------------------------
u128 Factor::percentageMul(u128 v) const {
  return expectValue(
      mulDivRoundHalfUp(v, static_cast<u128>(value()), kOne),
      "Factor::percentageMul overflow");
}

TokenAmount Factor::percentageOf(TokenAmount amount) const {
  return expectValue(
      TokenAmount::fromU128(percentageMul(static_cast<u128>(amount.value()))),
      "Factor::percentageOf result exceeds 64 bits");
}

Factor Factor::invert() const {
  return expectValue(one().checkedSub(*this), "Factor::invert overflow");
}

// -----------------------------------------------------------------------------
// Wad
// -----------------------------------------------------------------------------
Wad Wad::wadMul(Wad other) const {
  return Wad(expectValue(mulDivRoundHalfUp(value(), other.value(), kOne),
                         "Wad::wadMul overflow"));
}

Wad Wad::wadDiv(Wad other) const {
  return Wad(expectValue(divRoundHalfUp(value(), other.value(), kOne),
                         "Wad::wadDiv overflow or division by zero"));
}

Ray Wad::toRay() const {
  return Ray(expectValue(math::checkedMul<u128>(value(), 1'000'000'000ULL),
                         "Wad::toRay overflow"));
}

TokenAmount Wad::toTokenAmount() const {
  return expectValue(TokenAmount::fromU128(value()),
                     "Wad::toTokenAmount exceeds 64 bits");
}

// -----------------------------------------------------------------------------
// Ray
// -----------------------------------------------------------------------------
Ray Ray::rayMul(Ray other) const {
  return Ray(expectValue(mulDivRoundHalfUp(value(), other.value(), kOne),
                         "Ray::rayMul overflow"));
}

Ray Ray::rayDiv(Ray other) const {
  return Ray(expectValue(divRoundHalfUp(value(), other.value(), kOne),
                         "Ray::rayDiv overflow or division by zero"));
}

Ray Ray::invert() const {
  return expectValue(one().checkedSub(*this), "Ray::invert overflow");
}

Rate Ray::toRate() const {
  return Rate(expectValue(math::checkedMul<u128>(value(), Rate::kRayRatio),
                          "Ray::toRate overflow"));
}

TokenAmount Ray::toTokenAmount() const {
  return expectValue(TokenAmount::fromU128(value()),
                     "Ray::toTokenAmount exceeds 64 bits");
}

// -----------------------------------------------------------------------------
// Rate
// -----------------------------------------------------------------------------
Ray Rate::toRay() const { return Ray(value() / kRayRatio); }

}  // namespace math
}  // namespace lendswap
