#pragma once

#include "lendswap/domain/account.hpp"
#include "lendswap/domain/position_status.hpp"
#include "lendswap/math/fixed_point.hpp"

namespace lendswap {
namespace domain {

// -----------------------------------------------------------------------------
// PositionState - debt bookkeeping of one leveraged position
// -----------------------------------------------------------------------------
//
// @details
//   loan       Principal currently borrowed from the reserve. Used for the
//              market's borrow limit; does not compound.
//   amount     Debt as of `timestamp` (principal plus interest capitalized
//              at the last checkpoint).
//   rate       Per-second rate the debt compounds at after `timestamp`.
//   timestamp  Last debt checkpoint.
//
// Projected debt at time t is amount * compound(rate, timestamp, t)
// (accounting::projectPositionDebt). A fully repaid position has
// rate == amount == timestamp == 0.
// -----------------------------------------------------------------------------
struct PositionState {
  math::TokenAmount loan;
  math::Rate rate;
  math::TokenAmount amount;
  math::UnixTimestamp timestamp;
};

// -----------------------------------------------------------------------------
// Position - one trader's leveraged exposure in one market
// -----------------------------------------------------------------------------
//
// @brief  Persistent record keyed by (market, trader).
//
// @details
// `receipt_account` holds the receipt tokens minted on open; it is owned by
// the market signer so only the protocol can burn from it.
// `trader_quote_vault` is where the trader funds opens from and receives
// close / liquidation proceeds.
//
// Value type. The authoritative copy lives in LendingEngine; telemetry
// events carry copies.
// -----------------------------------------------------------------------------
struct Position {
  AccountId trader;
  AccountId market;
  AccountId receipt_account;
  AccountId trader_quote_vault;

  PositionStatus status{PositionStatus::Uninitialized};
  PositionState state;
};

}  // namespace domain
}  // namespace lendswap
