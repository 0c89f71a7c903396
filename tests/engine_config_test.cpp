// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for parseEngineConfig / loadEngineConfig.
//
// Validates:
//   - A complete document populates governance, records, venue, IPC and
//     seed accounts (128-bit governance values as decimal strings)
//   - Optional sections fall back to defaults
//   - Missing keys, wrong types and out-of-range values are reported as
//     std::runtime_error naming the key
// =============================================================================

#include "lendswap/config/engine_config.hpp"
#include "lendswap/math/checked_math.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using lendswap::EngineConfig;
using lendswap::parseEngineConfig;
using lendswap::math::toString;
using nlohmann::json;

namespace {

json baseDocument() {
  return json::parse(R"({
    "governance": {
      "pool_utilization_allowance": "8000000000000000000000",
      "base_borrow_rate": "634195839675291000",
      "excess_slope": "23782343987",
      "optimal_slope": "1268391679",
      "optimal_utilization": "800000000000000000",
      "treasure_factor": "1000000000000000000000",
      "max_leverage_factor": "50000000000000000000000",
      "max_rate_multiplier": "20000000000000000000000",
      "liquidation_margin": "500000000000000000000",
      "liquidation_reward": "100000000000000000000",
      "max_liquidation_reward": "0"
    },
    "reserve": {
      "id": "usdc-reserve",
      "signer": "reserve-signer",
      "lendable_mint": "usdc",
      "lendable_vault": "reserve-usdc",
      "redeemable_mint": "lp-usdc"
    },
    "market": {
      "id": "sol-usdc",
      "signer": "market-signer",
      "base_mint": "sol",
      "base_vault": "market-sol",
      "quote_mint": "usdc",
      "quote_vault": "market-usdc",
      "receipt_mint": "receipt-sol"
    },
    "venue": {
      "authority": "venue",
      "base_inventory_vault": "venue-sol",
      "quote_inventory_vault": "venue-usdc",
      "base_lot": 10,
      "quote_lot": 2,
      "market_price": 200,
      "base_inventory": 1000000,
      "quote_inventory": "100000000000"
    }
  })");
}

// Expects parseEngineConfig(doc) to throw with `key` in the message.
void expectConfigError(const json& doc, const std::string& key) {
  try {
    parseEngineConfig(doc.dump());
    FAIL() << "expected a config error for " << key;
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(key), std::string::npos)
        << "message was: " << e.what();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. The base document parses into the expected records.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ParsesCompleteDocument) {
  json doc = baseDocument();
  doc["ipc"] = {{"cmd_endpoint", "tcp://127.0.0.1:6000"},
                {"pub_endpoint", "tcp://127.0.0.1:6001"}};
  doc["accounts"] = json::array(
      {{{"owner", "trader"}, {"vault", "trader-usdc"}, {"mint", "usdc"},
        {"amount", "5000000"}},
       {{"owner", "liquidator"}, {"vault", "liquidator-usdc"},
        {"mint", "usdc"}, {"amount", 0}}});

  const EngineConfig config = parseEngineConfig(doc.dump());

  EXPECT_EQ(config.mint_authority, "faucet");
  EXPECT_EQ(toString(config.governance.pool_utilization_allowance),
            "8000000000000000000000");
  EXPECT_EQ(config.governance.poolUtilizationAllowance().value(), 8'000u);
  EXPECT_EQ(config.governance.maxLeverageFactor().value(), 50'000u);
  EXPECT_EQ(toString(config.governance.baseBorrowRate().value()),
            "634195839675291000");
  EXPECT_EQ(config.governance.maxLiquidationReward().value(), 0u);

  EXPECT_EQ(config.reserve.id, "usdc-reserve");
  EXPECT_EQ(config.reserve.lendable_vault, "reserve-usdc");
  EXPECT_EQ(config.market.id, "sol-usdc");
  EXPECT_EQ(config.market.reserve, "usdc-reserve");
  EXPECT_EQ(config.market.receipt_mint, "receipt-sol");

  EXPECT_EQ(config.venue.lots.base_lot, 10u);
  EXPECT_EQ(config.venue.lots.quote_lot, 2u);
  EXPECT_EQ(config.venue.market_price, 200u);
  EXPECT_EQ(config.venue.fill_ratio.value(), 10'000u);
  EXPECT_EQ(config.venue.base_inventory.value(), 1'000'000u);
  EXPECT_EQ(config.venue.quote_inventory.value(), 100'000'000'000u);

  EXPECT_EQ(config.ipc.cmd_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.ipc.pub_endpoint, "tcp://127.0.0.1:6001");

  ASSERT_EQ(config.accounts.size(), 2u);
  EXPECT_EQ(config.accounts[0].owner, "trader");
  EXPECT_EQ(config.accounts[0].amount.value(), 5'000'000u);
  EXPECT_EQ(config.accounts[1].vault, "liquidator-usdc");
  EXPECT_EQ(config.accounts[1].amount.value(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Without ipc / accounts the engine runs headless with no seed vaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, OptionalSectionsDefault) {
  const EngineConfig config = parseEngineConfig(baseDocument().dump());
  EXPECT_TRUE(config.ipc.cmd_endpoint.empty());
  EXPECT_TRUE(config.ipc.pub_endpoint.empty());
  EXPECT_TRUE(config.accounts.empty());
}

// -----------------------------------------------------------------------------
// 3. Missing sections and keys name the key.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, MissingKeysAreReported) {
  json doc = baseDocument();
  doc.erase("venue");
  expectConfigError(doc, "venue");

  doc = baseDocument();
  doc["governance"].erase("excess_slope");
  expectConfigError(doc, "excess_slope");

  doc = baseDocument();
  doc["market"].erase("quote_vault");
  expectConfigError(doc, "quote_vault");
}

// -----------------------------------------------------------------------------
// 4. Governance values must be decimal strings that fit 128 bits.
// Why: JSON numbers lose precision past 2^53; the scaled values do not fit.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, GovernanceValuesMustBeDecimalStrings) {
  json doc = baseDocument();
  doc["governance"]["optimal_slope"] = 1268391679;
  expectConfigError(doc, "optimal_slope");

  doc = baseDocument();
  doc["governance"]["treasure_factor"] =
      "340282366920938463463374607431768211456";
  expectConfigError(doc, "treasure_factor");

  doc = baseDocument();
  doc["governance"]["liquidation_margin"] = "5%";
  expectConfigError(doc, "liquidation_margin");
}

// -----------------------------------------------------------------------------
// 5. Venue values are range checked.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, VenueValuesAreRangeChecked) {
  json doc = baseDocument();
  doc["venue"]["base_lot"] = 0;
  expectConfigError(doc, "venue");

  doc = baseDocument();
  doc["venue"]["market_price"] = 0;
  expectConfigError(doc, "market_price");

  doc = baseDocument();
  doc["venue"]["fill_ratio"] = 10001;
  expectConfigError(doc, "fill_ratio");

  doc = baseDocument();
  doc["venue"]["market_price"] = -5;
  expectConfigError(doc, "market_price");

  doc = baseDocument();
  doc["venue"]["quote_inventory"] = "18446744073709551616";
  expectConfigError(doc, "quote_inventory");
}

// -----------------------------------------------------------------------------
// 6. Malformed documents and unreadable files.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, MalformedInput) {
  EXPECT_THROW(parseEngineConfig("{ not json"), std::runtime_error);
  EXPECT_THROW(parseEngineConfig("[1, 2, 3]"), std::runtime_error);
  EXPECT_THROW(lendswap::loadEngineConfig("/nonexistent/lendswap.json"),
               std::runtime_error);
}
