#include "lendswap/config/engine_config.hpp"

#include "lendswap/math/checked_math.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace lendswap {

using nlohmann::json;

namespace {

[[noreturn]] void configError(const std::string& key,
                              const std::string& problem) {
  throw std::runtime_error("config: " + key + ": " + problem);
}

const json& section(const json& parent, const std::string& key) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    configError(key, "missing");
  }
  return *it;
}

std::string readString(const json& parent, const std::string& key) {
  const json& value = section(parent, key);
  if (!value.is_string()) {
    configError(key, "expected a string");
  }
  return value.get<std::string>();
}

std::uint64_t readU64(const json& parent, const std::string& key) {
  const json& value = section(parent, key);
  if (!value.is_number_unsigned()) {
    configError(key, "expected an unsigned integer");
  }
  return value.get<std::uint64_t>();
}

u128 readU128(const json& parent, const std::string& key) {
  const json& value = section(parent, key);
  if (!value.is_string()) {
    configError(key, "expected a decimal string");
  }
  auto parsed = math::parseU128(value.get<std::string>());
  if (!parsed) {
    configError(key, "not a 128-bit unsigned integer");
  }
  return *parsed;
}

math::TokenAmount readAmount(const json& parent, const std::string& key) {
  const json& value = section(parent, key);
  if (value.is_number_unsigned()) {
    return math::TokenAmount(value.get<std::uint64_t>());
  }
  auto amount = math::TokenAmount::fromU128(readU128(parent, key));
  if (!amount) {
    configError(key, "token amount does not fit 64 bits");
  }
  return *amount;
}

domain::Governance parseGovernance(const json& j) {
  domain::Governance g;
  g.pool_utilization_allowance = readU128(j, "pool_utilization_allowance");
  g.base_borrow_rate = readU128(j, "base_borrow_rate");
  g.excess_slope = readU128(j, "excess_slope");
  g.optimal_slope = readU128(j, "optimal_slope");
  g.optimal_utilization = readU128(j, "optimal_utilization");
  g.treasure_factor = readU128(j, "treasure_factor");
  g.max_leverage_factor = readU128(j, "max_leverage_factor");
  g.max_rate_multiplier = readU128(j, "max_rate_multiplier");
  g.liquidation_margin = readU128(j, "liquidation_margin");
  g.liquidation_reward = readU128(j, "liquidation_reward");
  g.max_liquidation_reward = readU128(j, "max_liquidation_reward");
  return g;
}

domain::Reserve parseReserve(const json& j) {
  domain::Reserve r;
  r.id = readString(j, "id");
  r.signer = readString(j, "signer");
  r.lendable_mint = readString(j, "lendable_mint");
  r.lendable_vault = readString(j, "lendable_vault");
  r.redeemable_mint = readString(j, "redeemable_mint");
  return r;
}

domain::Market parseMarket(const json& j, const domain::Reserve& reserve) {
  domain::Market m;
  m.id = readString(j, "id");
  m.signer = readString(j, "signer");
  m.reserve = reserve.id;
  m.base_mint = readString(j, "base_mint");
  m.base_vault = readString(j, "base_vault");
  m.quote_mint = readString(j, "quote_mint");
  m.quote_vault = readString(j, "quote_vault");
  m.receipt_mint = readString(j, "receipt_mint");
  return m;
}

VenueSettings parseVenue(const json& j) {
  VenueSettings v;
  v.authority = readString(j, "authority");
  v.base_inventory_vault = readString(j, "base_inventory_vault");
  v.quote_inventory_vault = readString(j, "quote_inventory_vault");
  v.lots.base_lot = readU64(j, "base_lot");
  v.lots.quote_lot = readU64(j, "quote_lot");
  if (v.lots.base_lot == 0 || v.lots.quote_lot == 0) {
    configError("venue", "lot sizes must be positive");
  }
  v.market_price = readU64(j, "market_price");
  if (v.market_price == 0) {
    configError("market_price", "must be positive");
  }
  if (j.contains("fill_ratio")) {
    const std::uint64_t ratio = readU64(j, "fill_ratio");
    if (ratio > math::Factor::kOne) {
      configError("fill_ratio", "above 10000");
    }
    v.fill_ratio = math::Factor(ratio);
  }
  v.base_inventory = readAmount(j, "base_inventory");
  v.quote_inventory = readAmount(j, "quote_inventory");
  return v;
}

}  // namespace

EngineConfig parseEngineConfig(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("config: invalid JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw std::runtime_error("config: top level must be an object");
  }

  EngineConfig config;
  if (root.contains("mint_authority")) {
    config.mint_authority = readString(root, "mint_authority");
  }
  config.governance = parseGovernance(section(root, "governance"));
  config.reserve = parseReserve(section(root, "reserve"));
  config.market = parseMarket(section(root, "market"), config.reserve);
  config.venue = parseVenue(section(root, "venue"));

  if (root.contains("ipc")) {
    const json& ipc = section(root, "ipc");
    config.ipc.cmd_endpoint = readString(ipc, "cmd_endpoint");
    config.ipc.pub_endpoint = readString(ipc, "pub_endpoint");
  }

  if (root.contains("accounts")) {
    const json& accounts = section(root, "accounts");
    if (!accounts.is_array()) {
      configError("accounts", "expected an array");
    }
    for (const auto& entry : accounts) {
      SeedAccount seed;
      seed.owner = readString(entry, "owner");
      seed.vault = readString(entry, "vault");
      seed.mint = readString(entry, "mint");
      seed.amount = readAmount(entry, "amount");
      config.accounts.push_back(std::move(seed));
    }
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace lendswap
