#pragma once

#include "lendswap/custody/i_custodian.hpp"
#include "lendswap/venue/i_venue.hpp"

#include <cstdint>
#include <unordered_map>

namespace lendswap {

struct SimulatedVenueConfig {
  domain::AccountId authority{"venue"};
  domain::AccountId base_mint;
  domain::AccountId quote_mint;
  // Venue-owned vaults the simulated counterparty trades from.
  domain::AccountId base_inventory_vault;
  domain::AccountId quote_inventory_vault;
  LotSizes lots;
  // Quote lots per base lot.
  std::uint64_t market_price{1};
  // Share of each order's base quantity that fills (10'000 == all).
  math::Factor fill_ratio{math::Factor::kOne};
};

// -----------------------------------------------------------------------------
// SimulatedVenue - deterministic counterparty for tests and the demo binary
// -----------------------------------------------------------------------------
//
// @brief  Fills immediate-or-cancel orders at a single configured market
//         price, moving tokens through the injected custodian.
//
// @details
// Fill model:
//   - Buy crosses when market_price <= limit_price; Sell when
//     market_price >= limit_price. Non-crossing orders fill nothing.
//   - Crossing orders fill fill_ratio * max_base_qty lots at market_price,
//     further capped for a Buy by what max_native_quote can pay for.
//   - The payer's side is debited at submit; the counterparty side is held
//     per owner and paid out from the inventory vaults on settle().
//   - No fees.
//
// setMarketPrice() / setFillRatio() let tests and the command surface move
// the market between operations.
//
// Thread model:
//   Not internally synchronized; LendingEngine serializes access.
//
// Ownership:
//   Holds a reference to the custodian; it must outlive the venue.
// -----------------------------------------------------------------------------
class SimulatedVenue final : public IVenue {
 public:
  SimulatedVenue(ICustodian& custodian, SimulatedVenueConfig config);

  LotSizes lotSizes() const override { return config_.lots; }
  MarketMints mints() const override;

  Fill submitOrder(const OrderRequest& request) override;

  void settle(const domain::AccountId& owner,
              const domain::AccountId& base_vault,
              const domain::AccountId& quote_vault) override;

  void setMarketPrice(std::uint64_t price);
  void setFillRatio(math::Factor ratio);

  std::uint64_t marketPrice() const { return config_.market_price; }

 private:
  struct Unsettled {
    math::TokenAmount base;
    math::TokenAmount quote;
  };

  ICustodian& custodian_;
  SimulatedVenueConfig config_;
  // Order ids start at 1; 0 marks a Fill that never reached the book.
  std::uint64_t next_order_id_{1};
  std::unordered_map<domain::AccountId, Unsettled> unsettled_;
};

}  // namespace lendswap
