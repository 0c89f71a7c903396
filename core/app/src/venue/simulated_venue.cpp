#include "lendswap/venue/simulated_venue.hpp"

#include "lendswap/domain/error.hpp"

#include <algorithm>
#include <utility>

namespace lendswap {

using domain::ErrorCode;
using domain::ProtocolError;
using math::TokenAmount;

SimulatedVenue::SimulatedVenue(ICustodian& custodian,
                               SimulatedVenueConfig config)
    : custodian_(custodian), config_(std::move(config)) {}

MarketMints SimulatedVenue::mints() const {
  return MarketMints{config_.base_mint, config_.quote_mint};
}

void SimulatedVenue::setMarketPrice(std::uint64_t price) {
  if (price == 0) {
    throw ProtocolError(ErrorCode::InvalidArgument,
                        "market price must be positive");
  }
  config_.market_price = price;
}

void SimulatedVenue::setFillRatio(math::Factor ratio) {
  if (ratio > math::Factor::one()) {
    throw ProtocolError(ErrorCode::InvalidArgument,
                        "fill ratio above 100%");
  }
  config_.fill_ratio = ratio;
}

// -----------------------------------------------------------------------------
// submitOrder: match against the configured market price
// -----------------------------------------------------------------------------
Fill SimulatedVenue::submitOrder(const OrderRequest& request) {
  if (request.limit_price == 0 || request.max_base_qty == 0) {
    throw ProtocolError(ErrorCode::InvalidArgument,
                        "venue: zero price or quantity");
  }

  Fill fill;
  fill.order_id = next_order_id_++;
  fill.price = config_.market_price;

  const bool crosses = request.side == Side::Buy
                           ? config_.market_price <= request.limit_price
                           : config_.market_price >= request.limit_price;
  if (!crosses) {
    return fill;
  }

  const auto lot_cost = math::checkedMul<std::uint64_t>(
      config_.market_price, config_.lots.quote_lot);
  if (!lot_cost) {
    throw ProtocolError(ErrorCode::InvalidArgument, "venue: price overflow");
  }

  std::uint64_t lots = domain::expectValue(
      math::narrowToU64(config_.fill_ratio.percentageMul(request.max_base_qty)),
      "venue: fill quantity overflow");
  if (request.side == Side::Buy) {
    lots = std::min(lots, request.max_native_quote.value() / *lot_cost);
  }
  if (lots == 0) {
    return fill;
  }

  const auto native_quote = math::checkedMul<std::uint64_t>(lots, *lot_cost);
  const auto native_base =
      math::checkedMul<std::uint64_t>(lots, config_.lots.base_lot);
  if (!native_quote || !native_base) {
    throw ProtocolError(ErrorCode::InvalidArgument,
                        "venue: fill amount overflow");
  }

  fill.filled_base_lots = lots;
  fill.native_base = TokenAmount(*native_base);
  fill.native_quote = TokenAmount(*native_quote);

  Unsettled& pending = unsettled_[request.owner];
  if (request.side == Side::Buy) {
    custodian_.transfer(request.payer_vault, config_.quote_inventory_vault,
                        request.owner, fill.native_quote);
    pending.base = domain::expectValue(pending.base.checkedAdd(fill.native_base),
                                       "venue: unsettled overflow");
  } else {
    custodian_.transfer(request.payer_vault, config_.base_inventory_vault,
                        request.owner, fill.native_base);
    pending.quote =
        domain::expectValue(pending.quote.checkedAdd(fill.native_quote),
                            "venue: unsettled overflow");
  }

  return fill;
}

// -----------------------------------------------------------------------------
// settle: pay out matched proceeds held for `owner`
// -----------------------------------------------------------------------------
void SimulatedVenue::settle(const domain::AccountId& owner,
                            const domain::AccountId& base_vault,
                            const domain::AccountId& quote_vault) {
  auto it = unsettled_.find(owner);
  if (it == unsettled_.end()) {
    return;
  }
  const Unsettled pending = it->second;
  unsettled_.erase(it);

  custodian_.transfer(config_.base_inventory_vault, base_vault,
                      config_.authority, pending.base);
  custodian_.transfer(config_.quote_inventory_vault, quote_vault,
                      config_.authority, pending.quote);
}

}  // namespace lendswap
