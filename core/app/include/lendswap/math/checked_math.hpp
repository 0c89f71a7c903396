#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lendswap {

// 128-bit unsigned backing integer for the Wad / Ray / Rate scales.
using u128 = unsigned __int128;

namespace math {

// -----------------------------------------------------------------------------
// Checked unsigned arithmetic
// -----------------------------------------------------------------------------
//
// @brief  Overflow-aware add / sub / mul / div on any unsigned integer type
//         (std::uint64_t and u128 in practice).
//
// @details
// Every helper returns std::nullopt instead of wrapping. The accounting code
// never uses the raw operators on balances or scaled values; it goes through
// these helpers (directly or via the fixed-point types) so that an overflow
// surfaces as a fault rather than as a silently wrong balance.
//
// The maximum of Rep is computed as ~Rep{0} because std::numeric_limits is
// not specialized for unsigned __int128 in strict ISO mode.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------
template <typename Rep>
constexpr Rep maxOf() {
  return static_cast<Rep>(~Rep{0});
}

template <typename Rep>
constexpr std::optional<Rep> checkedAdd(Rep a, Rep b) {
  const Rep sum = static_cast<Rep>(a + b);
  if (sum < a) {
    return std::nullopt;
  }
  return sum;
}

template <typename Rep>
constexpr std::optional<Rep> checkedSub(Rep a, Rep b) {
  if (b > a) {
    return std::nullopt;
  }
  return static_cast<Rep>(a - b);
}

template <typename Rep>
constexpr std::optional<Rep> checkedMul(Rep a, Rep b) {
  if (a != 0 && b > maxOf<Rep>() / a) {
    return std::nullopt;
  }
  return static_cast<Rep>(a * b);
}

template <typename Rep>
constexpr std::optional<Rep> checkedDiv(Rep a, Rep b) {
  if (b == 0) {
    return std::nullopt;
  }
  return static_cast<Rep>(a / b);
}

// -------------------------------------------------------------------------
// mulDivRoundHalfUp / divRoundHalfUp
// -------------------------------------------------------------------------
// @brief  The two renormalizing operations shared by every scaled type.
//
//   mulDivRoundHalfUp(a, b, one) = (a * b + one / 2) / one
//   divRoundHalfUp(a, b, one)    = (a * one + b / 2) / b
//
// Both round the exact quotient to the nearest integer with ties going up.
// std::nullopt on overflow of any intermediate or division by zero.
// -------------------------------------------------------------------------
std::optional<u128> mulDivRoundHalfUp(u128 a, u128 b, u128 one);
std::optional<u128> divRoundHalfUp(u128 a, u128 b, u128 one);

// Narrows to 64 bits; std::nullopt when the value does not fit.
std::optional<std::uint64_t> narrowToU64(u128 value);

// Decimal rendering and parsing of 128-bit values (JSON and logs carry
// them as strings). parseU128 rejects empty input, non-digits and overflow.
std::string toString(u128 value);
std::optional<u128> parseU128(const std::string& text);

}  // namespace math
}  // namespace lendswap
