#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace lendswap {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode
// -----------------------------------------------------------------------------
//
// @brief  Outcome of a protocol operation as seen by the caller.
//
// @details
// Two tiers share this enum:
//
//   Tier 1 - rejected input. The request was well-formed enough to run but
//   violates a business rule (bad leverage, borrow limit, healthy position
//   liquidation, ...). The caller can correct and retry.
//
//   Tier 2 - InternalFault. An arithmetic overflow, a division by zero or a
//   broken accounting invariant. The operation is aborted and nothing it did
//   is kept; there is no finer classification.
//
// Ok is only ever carried by a successful OperationResult.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  Ok,
  InvalidArgument,
  InvalidMint,
  InvalidLeverageFactor,
  BorrowLimitExceeded,
  LiquidateHealthyPosition,
  InvalidPositionState,
  CustodyRejected,
  InternalFault,
};

const char* errorCodeToString(ErrorCode code);

// -----------------------------------------------------------------------------
// ProtocolError - tier 1, thrown inside an operation
// -----------------------------------------------------------------------------
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// -----------------------------------------------------------------------------
// ArithmeticFault - tier 2, thrown inside an operation
// -----------------------------------------------------------------------------
class ArithmeticFault : public std::runtime_error {
 public:
  explicit ArithmeticFault(const std::string& message)
      : std::runtime_error(message) {}
};

// -------------------------------------------------------------------------
// expectValue(optional, what)
// -------------------------------------------------------------------------
// @brief  Unwraps a checked-arithmetic result or raises ArithmeticFault.
//
// @param  value  Result of a checked helper (std::nullopt on overflow).
// @param  what   Short description of the computation, used as the fault
//                message.
// -------------------------------------------------------------------------
template <typename T>
T expectValue(std::optional<T> value, const char* what) {
  if (!value.has_value()) {
    throw ArithmeticFault(what);
  }
  return *std::move(value);
}

// -----------------------------------------------------------------------------
// OperationResult
// -----------------------------------------------------------------------------
//
// @brief  Value returned across the operation boundary. Exceptions of the
//         two tiers above never escape an operation; they are converted to
//         this record after the operation's effects have been rolled back.
// -----------------------------------------------------------------------------
struct OperationResult {
  ErrorCode code{ErrorCode::Ok};
  std::string message;

  bool ok() const { return code == ErrorCode::Ok; }

  static OperationResult success() { return OperationResult{}; }
  static OperationResult failure(ErrorCode code, std::string message) {
    return OperationResult{code, std::move(message)};
  }
};

}  // namespace domain
}  // namespace lendswap
