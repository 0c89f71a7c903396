#pragma once

#include "lendswap/domain/account.hpp"
#include "lendswap/math/fixed_point.hpp"

namespace lendswap {
namespace domain {

// Rate and treasury checkpoint of a reserve.
struct ReserveState {
  math::Rate borrow_rate;
  math::TokenAmount treasure_accrued;
  math::UnixTimestamp treasurer_update;
};

// Pool-wide debt aggregate. `total` is the debt as of `last_update`; it
// compounds at `average_rate` until the next checkpoint.
struct ReserveDebt {
  math::Rate average_rate;
  math::TokenAmount total;
  math::UnixTimestamp last_update;
};

// -----------------------------------------------------------------------------
// Reserve - one shared liquidity pool for a single lendable asset
// -----------------------------------------------------------------------------
//
// @brief  Persistent record of a pool: which vault holds its idle liquidity,
//         which mint issues its redeemable (LP) tokens, and the aggregate
//         debt / rate / treasury state maintained by reserve accounting.
//
// Ownership: Owned by LendingEngine. Operations receive a reference and work
// on a copy that is written back only when the operation commits.
// -----------------------------------------------------------------------------
struct Reserve {
  AccountId id;
  AccountId signer;
  AccountId lendable_mint;
  AccountId lendable_vault;
  AccountId redeemable_mint;

  ReserveState state;
  ReserveDebt debt;
};

}  // namespace domain
}  // namespace lendswap
