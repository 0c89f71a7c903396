#pragma once

#include "lendswap/domain/error.hpp"

#include <chrono>
#include <string>

namespace lendswap {

// Wall-clock time attached to telemetry. Protocol time (interest accrual)
// is math::UnixTimestamp; this is only for observers.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// OperationRejectedEvent
// -----------------------------------------------------------------------------
// Published after an operation failed and its effects were rolled back.
// `code` is InternalFault for arithmetic / invariant faults, a tier-1 code
// otherwise.
// -----------------------------------------------------------------------------
struct OperationRejectedEvent {
  std::string operation;       // "open", "close", "liquidate", "deposit", ...
  std::string subject;         // trader or investor id
  domain::ErrorCode code{domain::ErrorCode::Ok};
  std::string message;
  Timestamp timestamp{};
};

}  // namespace lendswap
