#pragma once

#include "lendswap/time/i_time_provider.hpp"

namespace lendswap {

// Wall-clock ITimeProvider used by the lendswap binary.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace lendswap
