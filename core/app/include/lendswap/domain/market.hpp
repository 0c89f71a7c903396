#pragma once

#include "lendswap/domain/account.hpp"
#include "lendswap/math/fixed_point.hpp"

namespace lendswap {
namespace domain {

struct MarketState {
  // Sum of the loan principal of every position in this market. Drives the
  // borrow-limit check on open.
  math::TokenAmount total_loan;
};

// -----------------------------------------------------------------------------
// Market - a base/quote pair traded with leverage against one reserve
// -----------------------------------------------------------------------------
//
// The quote asset is the reserve's lendable asset. `base_vault` and
// `quote_vault` are the market's own settlement vaults at the venue; the
// quote vault is empty between operations. Receipt tokens minted from
// `receipt_mint` represent base held on behalf of position owners.
// -----------------------------------------------------------------------------
struct Market {
  AccountId id;
  AccountId signer;
  AccountId reserve;

  AccountId base_mint;
  AccountId base_vault;
  AccountId quote_mint;
  AccountId quote_vault;
  AccountId receipt_mint;

  MarketState state;
};

}  // namespace domain
}  // namespace lendswap
