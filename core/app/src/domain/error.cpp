#include "lendswap/domain/error.hpp"

namespace lendswap {
namespace domain {

const char* errorCodeToString(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::Ok:                       return "Ok";
    case E::InvalidArgument:          return "InvalidArgument";
    case E::InvalidMint:              return "InvalidMint";
    case E::InvalidLeverageFactor:    return "InvalidLeverageFactor";
    case E::BorrowLimitExceeded:      return "BorrowLimitExceeded";
    case E::LiquidateHealthyPosition: return "LiquidateHealthyPosition";
    case E::InvalidPositionState:     return "InvalidPositionState";
    case E::CustodyRejected:          return "CustodyRejected";
    case E::InternalFault:            return "InternalFault";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace lendswap
