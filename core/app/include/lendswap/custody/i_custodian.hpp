#pragma once

#include "lendswap/domain/account.hpp"
#include "lendswap/math/fixed_point.hpp"

namespace lendswap {

// -----------------------------------------------------------------------------
// ICustodian - abstract custodial token layer
// -----------------------------------------------------------------------------
//
// @brief  Moves, creates and destroys tokens on behalf of the protocol.
//
// @details
// The core never holds balances itself. Every token movement of an
// operation (drawing a loan, funding an order, repaying the reserve,
// minting receipts and LP tokens) goes through this interface.
//
// Each mutating call names the signing `authority`:
//   transfer  authority must own `from`
//   mint      authority must be the mint authority of `mint`
//   burn      authority must own `from`
//
// A rejected call (unknown account, wrong mint, wrong authority,
// insufficient balance, supply overflow) throws
// domain::ProtocolError(ErrorCode::CustodyRejected) and moves nothing.
//
// Zero-amount calls are legal and are no-ops.
//
// Implementations:
//   InMemoryLedger - balance map with snapshot rollback (tests, demo).
//
// Ownership:
//   Owned by the caller (main() or a test fixture). Managers hold a
//   reference; it must outlive them.
// -----------------------------------------------------------------------------
class ICustodian {
 public:
  virtual ~ICustodian() = default;

  virtual math::TokenAmount balance(const domain::AccountId& vault) const = 0;
  virtual math::TokenAmount supply(const domain::AccountId& mint) const = 0;

  virtual void transfer(const domain::AccountId& from,
                        const domain::AccountId& to,
                        const domain::AccountId& authority,
                        math::TokenAmount amount) = 0;

  virtual void mint(const domain::AccountId& mint,
                    const domain::AccountId& to,
                    const domain::AccountId& authority,
                    math::TokenAmount amount) = 0;

  virtual void burn(const domain::AccountId& mint,
                    const domain::AccountId& from,
                    const domain::AccountId& authority,
                    math::TokenAmount amount) = 0;
};

}  // namespace lendswap
