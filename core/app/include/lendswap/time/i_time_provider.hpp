#pragma once

#include <cstdint>

namespace lendswap {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" away from std::chrono::system_clock so interest
//         accrual can be driven by a deterministic clock in tests.
//
// @details
// Every protocol operation reads the clock exactly once, at its start, and
// converts the reading to whole seconds (math::UnixTimestamp::fromMillis).
// All debt projections of that operation use the same instant.
//
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value set by the caller (tests, replay).
//
// Implementations must be non-decreasing across calls; compounding faults
// on a clock that runs backwards past a stored checkpoint.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace lendswap
