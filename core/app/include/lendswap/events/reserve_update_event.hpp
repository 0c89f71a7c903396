#pragma once

#include "lendswap/domain/reserve.hpp"
#include "lendswap/events/event_types.hpp"

#include <string>

namespace lendswap {

// Snapshot of a reserve after any committed operation that touched it.
// `vault_balance` is the idle liquidity in the lendable vault at commit.
struct ReserveUpdateEvent {
  std::string operation;
  domain::Reserve reserve;
  math::TokenAmount vault_balance;
  math::TokenAmount redeemable_supply;
  Timestamp timestamp{};
};

}  // namespace lendswap
