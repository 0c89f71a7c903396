#pragma once

#include "lendswap/math/checked_math.hpp"

#include <cstdint>
#include <optional>

namespace lendswap {
namespace math {

// -----------------------------------------------------------------------------
// Fixed-point numeric kernel
// -----------------------------------------------------------------------------
//
// @brief  Strongly typed integers for every quantity the accounting code
//         touches, each with its own implied scale.
//
// @details
//
//   Type           Backing     Scale (ONE)      Used for
//   -------------  ----------  ---------------  ------------------------------
//   UnixTimestamp  uint64      seconds          checkpoints, elapsed time
//   TokenAmount    uint64      native units     balances, principal, debt
//   Factor         uint64      10'000           leverage, fees, margins
//   Wad            u128        1e9              share / ratio math
//   Ray            u128        1e18             interest / rate math
//   Rate           u128        Ray * 1e9        stored per-second rates
//
// Rules:
//   - checkedAdd / checkedSub / checkedMul / checkedDiv operate on the raw
//     integers and return std::nullopt on overflow, underflow or division
//     by zero. They never renormalize.
//   - wadMul / wadDiv / rayMul / rayDiv / percentageMul renormalize with
//     round-half-up and throw domain::ArithmeticFault on overflow. These are
//     the only cross-scale operations.
//   - A TokenAmount converts to Wad / Ray by reinterpreting the raw integer
//     (no scaling); rayMul of such a value by a Ray multiplier therefore
//     yields a token amount again.
//
// Thread-safety: Value types, no shared state.
// -----------------------------------------------------------------------------
template <typename Derived, typename Rep>
class Scalar {
 public:
  using rep_type = Rep;

  constexpr Scalar() = default;
  constexpr explicit Scalar(Rep value) : value_(value) {}

  constexpr Rep value() const { return value_; }
  constexpr bool isZero() const { return value_ == 0; }

  std::optional<Derived> checkedAdd(Derived other) const {
    return wrap(math::checkedAdd<Rep>(value_, other.value()));
  }
  std::optional<Derived> checkedSub(Derived other) const {
    return wrap(math::checkedSub<Rep>(value_, other.value()));
  }
  std::optional<Derived> checkedMul(Derived other) const {
    return wrap(math::checkedMul<Rep>(value_, other.value()));
  }
  std::optional<Derived> checkedDiv(Derived other) const {
    return wrap(math::checkedDiv<Rep>(value_, other.value()));
  }

  friend constexpr bool operator==(const Derived& a, const Derived& b) {
    return a.value() == b.value();
  }
  friend constexpr bool operator!=(const Derived& a, const Derived& b) {
    return a.value() != b.value();
  }
  friend constexpr bool operator<(const Derived& a, const Derived& b) {
    return a.value() < b.value();
  }
  friend constexpr bool operator<=(const Derived& a, const Derived& b) {
    return a.value() <= b.value();
  }
  friend constexpr bool operator>(const Derived& a, const Derived& b) {
    return a.value() > b.value();
  }
  friend constexpr bool operator>=(const Derived& a, const Derived& b) {
    return a.value() >= b.value();
  }

 private:
  static std::optional<Derived> wrap(std::optional<Rep> raw) {
    if (!raw.has_value()) {
      return std::nullopt;
    }
    return Derived(*raw);
  }

  Rep value_{0};
};

class Wad;
class Ray;
class Rate;

// Whole seconds since the Unix epoch.
class UnixTimestamp : public Scalar<UnixTimestamp, std::uint64_t> {
 public:
  using Scalar::Scalar;

  // Truncates a millisecond clock reading to whole seconds. Negative
  // readings (a clock that was never advanced) map to zero.
  static UnixTimestamp fromMillis(std::int64_t ms);
};

class TokenAmount : public Scalar<TokenAmount, std::uint64_t> {
 public:
  using Scalar::Scalar;

  static std::optional<TokenAmount> fromU128(u128 value);

  Wad toWad() const;
  Ray toRay() const;
};

// Basis-point style percentage: 10'000 == 100%. Values above ONE are legal
// (leverage factors, rate multipliers).
class Factor : public Scalar<Factor, std::uint64_t> {
 public:
  static constexpr std::uint64_t kOne = 10'000;
  static constexpr std::uint64_t kHalf = 5'000;

  using Scalar::Scalar;

  static constexpr Factor one() { return Factor(kOne); }

  // (value * factor + HALF) / ONE
  u128 percentageMul(u128 value) const;

  // percentageMul applied to a token amount; faults if the result no longer
  // fits 64 bits.
  TokenAmount percentageOf(TokenAmount amount) const;

  // ONE - factor; faults when factor > ONE.
  Factor invert() const;
};

class Wad : public Scalar<Wad, u128> {
 public:
  static constexpr u128 kOne = 1'000'000'000ULL;
  static constexpr u128 kHalf = 500'000'000ULL;

  using Scalar::Scalar;

  static constexpr Wad one() { return Wad(kOne); }

  Wad wadMul(Wad other) const;
  Wad wadDiv(Wad other) const;

  // value * 1e9
  Ray toRay() const;
  TokenAmount toTokenAmount() const;
};

class Ray : public Scalar<Ray, u128> {
 public:
  static constexpr u128 kOne = 1'000'000'000'000'000'000ULL;
  static constexpr u128 kHalf = 500'000'000'000'000'000ULL;

  using Scalar::Scalar;

  static constexpr Ray one() { return Ray(kOne); }

  Ray rayMul(Ray other) const;
  Ray rayDiv(Ray other) const;

  // ONE - value; faults when value > ONE.
  Ray invert() const;

  // value * 1e9
  Rate toRate() const;
  TokenAmount toTokenAmount() const;
};

// Per-second rate as stored in reserve and position records. One extra
// factor of 1e9 over Ray keeps sub-ray precision for very small rates.
class Rate : public Scalar<Rate, u128> {
 public:
  static constexpr u128 kRayRatio = 1'000'000'000ULL;

  using Scalar::Scalar;

  // value / 1e9 (truncating)
  Ray toRay() const;
};

}  // namespace math
}  // namespace lendswap
