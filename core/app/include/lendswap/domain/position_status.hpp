#pragma once

namespace lendswap {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus - leveraged position lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Every state a position record can occupy.
//
// @details
// Legal transitions (checked by isValidTransition):
//
//   Uninitialized ──> Open
//   Open ───────────> Open | PartiallyRepaid | Closed | Liquidated
//   PartiallyRepaid > Open | PartiallyRepaid | Closed | Liquidated
//   Closed ─────────> Open
//   Liquidated ─────> Open
//
// Open -> Open is adding to an existing position. Closed and Liquidated
// records hold zero loan and zero debt, so they can be opened again.
// Close and liquidate are only legal while the position holds exposure
// (Open or PartiallyRepaid).
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Uninitialized,    // Record created, never opened
  Open,             // Holds receipts and (usually) debt
  PartiallyRepaid,  // A close left receipts or debt behind
  Closed,           // No receipts and no debt remain
  Liquidated,       // Force-closed by a third party
};

bool isValidTransition(PositionStatus current, PositionStatus next);

const char* positionStatusToString(PositionStatus status);

}  // namespace domain
}  // namespace lendswap
