#include "lendswap/math/checked_math.hpp"

#include <algorithm>

namespace lendswap {
namespace math {

std::optional<u128> mulDivRoundHalfUp(u128 a, u128 b, u128 one) {
  if (one == 0) {
    return std::nullopt;
  }
  auto product = checkedMul<u128>(a, b);
  if (!product) {
    return std::nullopt;
  }
  auto rounded = checkedAdd<u128>(*product, one / 2);
  if (!rounded) {
    return std::nullopt;
  }
  return *rounded / one;
}

std::optional<u128> divRoundHalfUp(u128 a, u128 b, u128 one) {
  if (b == 0) {
    return std::nullopt;
  }
  auto scaled = checkedMul<u128>(a, one);
  if (!scaled) {
    return std::nullopt;
  }
  auto rounded = checkedAdd<u128>(*scaled, b / 2);
  if (!rounded) {
    return std::nullopt;
  }
  return *rounded / b;
}

std::optional<std::uint64_t> narrowToU64(u128 value) {
  if (value > static_cast<u128>(maxOf<std::uint64_t>())) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(value);
}

std::string toString(u128 value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value != 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::optional<u128> parseU128(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  u128 value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto shifted = checkedMul<u128>(value, 10);
    if (!shifted) {
      return std::nullopt;
    }
    auto next = checkedAdd<u128>(*shifted, static_cast<u128>(c - '0'));
    if (!next) {
      return std::nullopt;
    }
    value = *next;
  }
  return value;
}

}  // namespace math
}  // namespace lendswap
