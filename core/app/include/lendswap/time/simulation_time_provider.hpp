#pragma once

#include "lendswap/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace lendswap {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly. Tests use it to step
//         interest accrual forward by exact numbers of seconds.
//
// @details
// Starts at 0 ms. advance_time() sets an absolute time; advance_seconds()
// moves forward relative to the current value. Monotonicity is the caller's
// responsibility.
//
// Thread model:
//   Atomic load / store; safe for one writer and many readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);
  void advance_seconds(std::int64_t seconds);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace lendswap
