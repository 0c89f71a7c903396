#pragma once

#include "lendswap/domain/account.hpp"
#include "lendswap/math/fixed_point.hpp"

#include <cstdint>

namespace lendswap {

enum class Side { Buy, Sell };

// Venue unit conversion: native amount = lots * lot size.
struct LotSizes {
  std::uint64_t base_lot{1};
  std::uint64_t quote_lot{1};
};

struct MarketMints {
  domain::AccountId base_mint;
  domain::AccountId quote_mint;
};

// -----------------------------------------------------------------------------
// OrderRequest - one immediate-or-cancel order
// -----------------------------------------------------------------------------
//
//   limit_price       quote lots per base lot
//   max_base_qty      base lots
//   max_native_quote  cap on native quote spent (Buy) incl. fees
//   payer_vault       funds the order: quote vault for Buy, base vault for
//                     Sell
//   owner             authority that owns payer_vault; proceeds are held for
//                     this owner until settle()
// -----------------------------------------------------------------------------
struct OrderRequest {
  Side side{Side::Buy};
  std::uint64_t limit_price{0};
  std::uint64_t max_base_qty{0};
  math::TokenAmount max_native_quote;
  domain::AccountId payer_vault;
  domain::AccountId owner;
};

// Result of an order. Whatever did not fill was cancelled.
struct Fill {
  std::uint64_t order_id{0};
  std::uint64_t price{0};
  std::uint64_t filled_base_lots{0};
  math::TokenAmount native_base;
  math::TokenAmount native_quote;
};

// -----------------------------------------------------------------------------
// IVenue - abstract order-execution venue
// -----------------------------------------------------------------------------
//
// @brief  The external order book a market trades on.
//
// @details
// submitOrder() takes the order's funds from the payer vault immediately;
// matched proceeds are held for the owner and only reach the owner's vaults
// on settle(). The lifecycle managers always call settle() right after
// submitOrder() within the same operation.
//
// A venue rejection throws domain::ProtocolError. A non-crossing order is
// not an error: it returns a Fill with zero quantities.
//
// Implementations:
//   SimulatedVenue - fills at a configured market price against inventory
//                    vaults in the custodian (tests, demo).
// -----------------------------------------------------------------------------
class IVenue {
 public:
  virtual ~IVenue() = default;

  virtual LotSizes lotSizes() const = 0;
  virtual MarketMints mints() const = 0;

  virtual Fill submitOrder(const OrderRequest& request) = 0;

  virtual void settle(const domain::AccountId& owner,
                      const domain::AccountId& base_vault,
                      const domain::AccountId& quote_vault) = 0;
};

}  // namespace lendswap
