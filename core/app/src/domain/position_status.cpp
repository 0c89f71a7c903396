#include "lendswap/domain/position_status.hpp"

namespace lendswap {
namespace domain {

bool isValidTransition(PositionStatus current, PositionStatus next) {
  using S = PositionStatus;

  switch (current) {
    case S::Uninitialized:
    case S::Closed:
    case S::Liquidated:
      return next == S::Open;

    case S::Open:
    case S::PartiallyRepaid:
      return next == S::Open ||
             next == S::PartiallyRepaid ||
             next == S::Closed ||
             next == S::Liquidated;
  }

  return false;
}

const char* positionStatusToString(PositionStatus status) {
  using S = PositionStatus;
  switch (status) {
    case S::Uninitialized:   return "Uninitialized";
    case S::Open:            return "Open";
    case S::PartiallyRepaid: return "PartiallyRepaid";
    case S::Closed:          return "Closed";
    case S::Liquidated:      return "Liquidated";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace lendswap
