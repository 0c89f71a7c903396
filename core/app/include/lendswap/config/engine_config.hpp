#pragma once

#include "lendswap/domain/account.hpp"
#include "lendswap/domain/governance.hpp"
#include "lendswap/domain/market.hpp"
#include "lendswap/domain/reserve.hpp"
#include "lendswap/math/fixed_point.hpp"
#include "lendswap/venue/i_venue.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lendswap {

struct VenueSettings {
  domain::AccountId authority{"venue"};
  domain::AccountId base_inventory_vault;
  domain::AccountId quote_inventory_vault;
  LotSizes lots;
  std::uint64_t market_price{1};
  math::Factor fill_ratio{math::Factor::kOne};
  // Counterparty inventory seeded into the inventory vaults.
  math::TokenAmount base_inventory;
  math::TokenAmount quote_inventory;
};

struct IpcSettings {
  // Empty endpoints disable the IPC server.
  std::string cmd_endpoint;
  std::string pub_endpoint;
};

// A vault created and funded at start-up (traders, investors, liquidators).
struct SeedAccount {
  domain::AccountId owner;
  domain::AccountId vault;
  domain::AccountId mint;
  math::TokenAmount amount;
};

// -----------------------------------------------------------------------------
// EngineConfig - everything LendingEngine needs to come up
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (all sections required except `ipc` and `accounts`):
//
//   {
//     "mint_authority": "faucet",
//     "governance": { "pool_utilization_allowance": "8000000...", ... },
//     "reserve":    { "id", "signer", "lendable_mint", "lendable_vault",
//                     "redeemable_mint" },
//     "market":     { "id", "signer", "base_mint", "base_vault",
//                     "quote_mint", "quote_vault", "receipt_mint" },
//     "venue":      { "authority", "base_inventory_vault",
//                     "quote_inventory_vault", "base_lot", "quote_lot",
//                     "market_price", "fill_ratio", "base_inventory",
//                     "quote_inventory" },
//     "ipc":        { "cmd_endpoint", "pub_endpoint" },
//     "accounts":   [ { "owner", "vault", "mint", "amount" } ]
//   }
//
// Governance values are the raw 128-bit integers as published (factors at
// 1e18 accuracy) and must be JSON strings of decimal digits. Token amounts
// may be strings or unsigned integers.
//
// Errors: missing keys, wrong types and out-of-range numbers throw
// std::runtime_error naming the offending key.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::AccountId mint_authority{"faucet"};
  domain::Governance governance;
  domain::Reserve reserve;
  domain::Market market;
  VenueSettings venue;
  IpcSettings ipc;
  std::vector<SeedAccount> accounts;
};

EngineConfig parseEngineConfig(const std::string& json_text);

EngineConfig loadEngineConfig(const std::string& path);

}  // namespace lendswap
