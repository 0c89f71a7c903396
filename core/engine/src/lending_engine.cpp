#include "lendswap/engine/lending_engine.hpp"

#include "lendswap/domain/error.hpp"
#include "lendswap/math/checked_math.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace lendswap {

using domain::AccountId;
using domain::ErrorCode;
using domain::OperationResult;
using domain::Position;
using domain::ProtocolError;
using math::TokenAmount;
using nlohmann::json;

namespace {

SimulatedVenueConfig venueConfigFrom(const EngineConfig& config) {
  SimulatedVenueConfig venue;
  venue.authority = config.venue.authority;
  venue.base_mint = config.market.base_mint;
  venue.quote_mint = config.market.quote_mint;
  venue.base_inventory_vault = config.venue.base_inventory_vault;
  venue.quote_inventory_vault = config.venue.quote_inventory_vault;
  venue.lots = config.venue.lots;
  venue.market_price = config.venue.market_price;
  venue.fill_ratio = config.venue.fill_ratio;
  return venue;
}

// --- Request field readers: malformed input is an InvalidArgument ----------

[[noreturn]] void badRequest(const std::string& message) {
  throw ProtocolError(ErrorCode::InvalidArgument, message);
}

std::string requireString(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string()) {
    badRequest(std::string("missing string field '") + key + "'");
  }
  return it->get<std::string>();
}

std::uint64_t requireU64(const json& request, const char* key) {
  auto it = request.find(key);
  if (it != request.end() && it->is_number_unsigned()) {
    return it->get<std::uint64_t>();
  }
  if (it != request.end() && it->is_number_integer() &&
      it->get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(it->get<std::int64_t>());
  }
  if (it != request.end() && it->is_string()) {
    auto parsed = math::parseU128(it->get<std::string>());
    if (parsed) {
      auto narrowed = math::narrowToU64(*parsed);
      if (narrowed) {
        return *narrowed;
      }
    }
  }
  badRequest(std::string("field '") + key +
             "' must be an unsigned 64-bit integer");
}

TokenAmount requireAmount(const json& request, const char* key) {
  return TokenAmount(requireU64(request, key));
}

std::string amountString(TokenAmount amount) {
  return math::toString(amount.value());
}

// Replies may echo client text; invalid UTF-8 is replaced, never thrown.
std::string serialize(const json& reply) {
  return reply.dump(-1, ' ', false, json::error_handler_t::replace);
}

json resultJson(const OperationResult& result) {
  json reply;
  reply["status"] = result.ok() ? "ok" : "error";
  reply["code"] = domain::errorCodeToString(result.code);
  reply["message"] = result.message;
  return reply;
}

json positionJson(const domain::Position& position) {
  json p;
  p["trader"] = position.trader;
  p["status"] = domain::positionStatusToString(position.status);
  p["loan"] = amountString(position.state.loan);
  p["debt"] = amountString(position.state.amount);
  p["rate"] = math::toString(position.state.rate.value());
  p["checkpoint"] = position.state.timestamp.value();
  return p;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: provision the ledger and bind the market
// -----------------------------------------------------------------------------
LendingEngine::LendingEngine(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      venue_(ledger_, venueConfigFrom(config_)),
      reserve_manager_(config_.governance, ledger_, ledger_, clock_, bus_),
      position_manager_(config_.governance, ledger_, venue_, ledger_, clock_,
                        bus_),
      reserve_(config_.reserve),
      market_(config_.market) {
  try {
    provisionLedger();
  } catch (const ProtocolError& e) {
    throw std::runtime_error(std::string("ledger setup failed: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("ledger setup failed: ") + e.what());
  }

  const OperationResult bound =
      position_manager_.initializeMarket(market_, reserve_);
  if (!bound.ok()) {
    throw std::runtime_error("market " + market_.id + ": " + bound.message);
  }
}

LendingEngine::~LendingEngine() { stop(); }

void LendingEngine::provisionLedger() {
  const AccountId& faucet = config_.mint_authority;

  ledger_.createMint(reserve_.lendable_mint, faucet);
  if (market_.quote_mint != reserve_.lendable_mint) {
    ledger_.createMint(market_.quote_mint, faucet);
  }
  ledger_.createMint(market_.base_mint, faucet);
  ledger_.createMint(reserve_.redeemable_mint, reserve_.signer);
  ledger_.createMint(market_.receipt_mint, market_.signer);

  ledger_.createVault(reserve_.lendable_vault, reserve_.lendable_mint,
                      reserve_.signer);
  ledger_.createVault(market_.base_vault, market_.base_mint, market_.signer);
  ledger_.createVault(market_.quote_vault, market_.quote_mint,
                      market_.signer);

  const VenueSettings& venue = config_.venue;
  ledger_.createVault(venue.base_inventory_vault, market_.base_mint,
                      venue.authority);
  ledger_.createVault(venue.quote_inventory_vault, market_.quote_mint,
                      venue.authority);
  ledger_.mint(market_.base_mint, venue.base_inventory_vault, faucet,
               venue.base_inventory);
  ledger_.mint(market_.quote_mint, venue.quote_inventory_vault, faucet,
               venue.quote_inventory);

  for (const SeedAccount& seed : config_.accounts) {
    ensureVault(seed.vault, seed.mint, seed.owner);
    ledger_.mint(seed.mint, seed.vault, faucet, seed.amount);
  }

  std::cout << "[LendingEngine] ledger provisioned: reserve=" << reserve_.id
            << " market=" << market_.id << " seed_accounts="
            << config_.accounts.size() << "\n";
}

void LendingEngine::ensureVault(const AccountId& vault, const AccountId& mint,
                                const AccountId& owner) {
  if (!ledger_.hasVault(vault)) {
    ledger_.createVault(vault, mint, owner);
  }
}

AccountId LendingEngine::lpVaultId(const AccountId& investor) const {
  return reserve_.redeemable_mint + ":" + investor;
}

AccountId LendingEngine::receiptAccountId(const AccountId& trader) const {
  return market_.receipt_mint + ":" + trader;
}

// -----------------------------------------------------------------------------
// start() / stop(): IPC server and telemetry bridges
// -----------------------------------------------------------------------------
void LendingEngine::start() {
  if (running_) {
    return;
  }

  if (!config_.ipc.cmd_endpoint.empty() && !config_.ipc.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
    ipc_server_->start();

    telemetry_subscriptions_.push_back(bus_.subscribe<PositionUpdateEvent>(
        [this](const PositionUpdateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    telemetry_subscriptions_.push_back(bus_.subscribe<ReserveUpdateEvent>(
        [this](const ReserveUpdateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    telemetry_subscriptions_.push_back(bus_.subscribe<OperationRejectedEvent>(
        [this](const OperationRejectedEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
  }

  running_ = true;
  std::cout << "[LendingEngine] started"
            << (ipc_server_ ? " with IPC" : " without IPC") << ".\n";
}

void LendingEngine::stop() {
  if (!running_) {
    return;
  }

  for (auto id : telemetry_subscriptions_) {
    bus_.unsubscribe(id);
  }
  telemetry_subscriptions_.clear();

  // Joins the worker, which may be inside executeCommand().
  ipc_server_.reset();

  running_ = false;
  std::cout << "[LendingEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch under the engine mutex, reply
// -----------------------------------------------------------------------------
std::string LendingEngine::executeCommand(const std::string& cmd) {
  json request = json::parse(cmd, nullptr, false);
  std::string command;
  if (request.is_discarded() || !request.is_object()) {
    command = cmd;
    request = json::object();
  } else if (request.contains("command") && request["command"].is_string()) {
    command = request["command"].get<std::string>();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    return serialize(dispatch(command, request));
  } catch (const ProtocolError& e) {
    std::cerr << "[LendingEngine] " << command << " rejected: " << e.what()
              << "\n";
    return serialize(
        resultJson(OperationResult::failure(e.code(), e.what())));
  }
}

json LendingEngine::dispatch(const std::string& command, const json& request) {
  if (command == "PING") {
    json reply = resultJson(OperationResult::success());
    reply["response"] = "PONG";
    return reply;
  }
  if (command == "STATUS") {
    return handleStatus();
  }
  if (command == "deposit") {
    return handleDeposit(request);
  }
  if (command == "withdraw") {
    return handleWithdraw(request);
  }
  if (command == "open_position") {
    return handleOpen(request);
  }
  if (command == "close_position") {
    return handleClose(request);
  }
  if (command == "liquidate") {
    return handleLiquidate(request);
  }
  if (command == "set_price") {
    return handleSetPrice(request);
  }
  badRequest("unknown command: " + command);
}

json LendingEngine::handleStatus() const {
  json reply = resultJson(OperationResult::success());

  json reserve;
  reserve["id"] = reserve_.id;
  reserve["borrow_rate"] = math::toString(reserve_.state.borrow_rate.value());
  reserve["treasure_accrued"] = amountString(reserve_.state.treasure_accrued);
  reserve["total_debt"] = amountString(reserve_.debt.total);
  reserve["average_rate"] = math::toString(reserve_.debt.average_rate.value());
  reserve["vault_balance"] =
      amountString(ledger_.balance(reserve_.lendable_vault));
  reserve["redeemable_supply"] =
      amountString(ledger_.supply(reserve_.redeemable_mint));
  reply["reserve"] = std::move(reserve);

  json market;
  market["id"] = market_.id;
  market["total_loan"] = amountString(market_.state.total_loan);
  market["price"] = venue_.marketPrice();
  reply["market"] = std::move(market);

  json positions = json::array();
  for (const auto& entry : positions_) {
    positions.push_back(positionJson(entry.second));
  }
  reply["positions"] = std::move(positions);
  return reply;
}

json LendingEngine::handleDeposit(const json& request) {
  const AccountId investor = requireString(request, "investor");
  const AccountId vault = requireString(request, "vault");
  const TokenAmount amount = requireAmount(request, "amount");

  const AccountId lp_vault = lpVaultId(investor);
  ensureVault(lp_vault, reserve_.redeemable_mint, investor);

  json reply = resultJson(
      reserve_manager_.deposit(reserve_, investor, vault, lp_vault, amount));
  reply["lp_balance"] = amountString(ledger_.balance(lp_vault));
  return reply;
}

json LendingEngine::handleWithdraw(const json& request) {
  const AccountId investor = requireString(request, "investor");
  const AccountId vault = requireString(request, "vault");
  const TokenAmount amount = requireAmount(request, "amount");

  const AccountId lp_vault = lpVaultId(investor);
  ensureVault(lp_vault, reserve_.redeemable_mint, investor);

  json reply = resultJson(
      reserve_manager_.withdraw(reserve_, investor, lp_vault, vault, amount));
  reply["lp_balance"] = amountString(ledger_.balance(lp_vault));
  return reply;
}

json LendingEngine::handleOpen(const json& request) {
  const AccountId trader = requireString(request, "trader");
  const AccountId vault = requireString(request, "vault");

  OpenRequest open;
  open.limit_price = requireU64(request, "limit_price");
  open.base_qty = requireU64(request, "base_qty");
  open.leverage = request.contains("leverage")
                      ? math::Factor(requireU64(request, "leverage"))
                      : math::Factor::one();

  const AccountId receipt_account = receiptAccountId(trader);
  ensureVault(receipt_account, market_.receipt_mint, market_.signer);

  auto it = positions_.find(trader);
  if (it == positions_.end()) {
    it = positions_
             .emplace(trader, PositionManager::initializePosition(
                                  trader, market_.id, receipt_account, vault))
             .first;
  }
  // The payout vault only moves when the open commits.
  Position candidate = it->second;
  candidate.trader_quote_vault = vault;

  const OperationResult result =
      position_manager_.open(market_, reserve_, candidate, open);
  if (result.ok()) {
    it->second = candidate;
  }
  json reply = resultJson(result);
  reply["position"] = positionJson(it->second);
  if (it->second.status == domain::PositionStatus::Uninitialized) {
    positions_.erase(it);
  }
  return reply;
}

json LendingEngine::handleClose(const json& request) {
  const AccountId trader = requireString(request, "trader");

  CloseRequest close;
  close.limit_price = requireU64(request, "limit_price");
  close.base_qty = requireU64(request, "base_qty");

  auto it = positions_.find(trader);
  if (it == positions_.end()) {
    throw ProtocolError(ErrorCode::InvalidPositionState,
                        "no position for trader " + trader);
  }
  json reply =
      resultJson(position_manager_.close(market_, reserve_, it->second, close));
  reply["position"] = positionJson(it->second);
  return reply;
}

json LendingEngine::handleLiquidate(const json& request) {
  const AccountId trader = requireString(request, "trader");
  const AccountId liquidator_vault = requireString(request, "liquidator_vault");

  auto it = positions_.find(trader);
  if (it == positions_.end()) {
    throw ProtocolError(ErrorCode::InvalidPositionState,
                        "no position for trader " + trader);
  }
  json reply = resultJson(position_manager_.liquidate(
      market_, reserve_, it->second, liquidator_vault));
  reply["position"] = positionJson(it->second);
  return reply;
}

json LendingEngine::handleSetPrice(const json& request) {
  venue_.setMarketPrice(requireU64(request, "price"));
  std::cout << "[LendingEngine] market price set to " << venue_.marketPrice()
            << "\n";
  json reply = resultJson(OperationResult::success());
  reply["price"] = venue_.marketPrice();
  return reply;
}

// -----------------------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------------------
domain::Reserve LendingEngine::reserve() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserve_;
}

domain::Market LendingEngine::market() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return market_;
}

std::optional<domain::Position> LendingEngine::position(
    const AccountId& trader) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = positions_.find(trader);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

TokenAmount LendingEngine::balance(const AccountId& vault) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.balance(vault);
}

}  // namespace lendswap
