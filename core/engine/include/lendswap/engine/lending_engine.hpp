#pragma once

#include "lendswap/config/engine_config.hpp"
#include "lendswap/custody/in_memory_ledger.hpp"
#include "lendswap/domain/market.hpp"
#include "lendswap/domain/position.hpp"
#include "lendswap/domain/reserve.hpp"
#include "lendswap/eventbus/event_bus.hpp"
#include "lendswap/lifecycle/position_manager.hpp"
#include "lendswap/lifecycle/reserve_manager.hpp"
#include "lendswap/network/ipc_server.hpp"
#include "lendswap/time/i_time_provider.hpp"
#include "lendswap/venue/simulated_venue.hpp"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lendswap {

// -----------------------------------------------------------------------------
// LendingEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the protocol: owns the ledger, the venue, the
//         reserve / market / position records and both lifecycle managers,
//         and exposes them through a JSON command surface.
//
// @details
// Construction provisions the in-memory ledger from the config (mints,
// protocol vaults, venue inventory, seed accounts) and validates the market
// against the venue and reserve. Any problem throws std::runtime_error.
//
// executeCommand() accepts either a bare command name ("PING", "STATUS") or
// a JSON object with a "command" field:
//
//   deposit         investor, vault, amount
//   withdraw        investor, vault, amount   (LP tokens)
//   open_position   trader, vault, limit_price, base_qty, leverage
//   close_position  trader, limit_price, base_qty
//   liquidate       trader, liquidator_vault
//   set_price       price
//
// Every reply carries "status" ("ok" / "error"), "code" (ErrorCode name) and
// "message". Amounts are accepted as unsigned integers or decimal strings
// and returned as decimal strings.
//
// Investor LP vaults and position receipt accounts are created on first use
// (see lpVaultId() / receiptAccountId()).
//
// Thread model:
//   One mutex serializes every command and accessor, which is the exclusive
//   access the managers require. EventBus callbacks run while that mutex is
//   held and must not call back into the engine. start() / stop() are called
//   from the owning thread; executeCommand() may be called from any thread
//   (the IPC worker in production).
//
// Ownership:
//   LendingEngine
//    ├── config_             (EngineConfig - value)
//    ├── clock_              (const ITimeProvider& - non-owning)
//    ├── ledger_             (InMemoryLedger - value)
//    ├── venue_              (SimulatedVenue - value, references ledger_)
//    ├── bus_                (EventBus - value)
//    ├── reserve_manager_    (ReserveManager - value)
//    ├── position_manager_   (PositionManager - value)
//    ├── reserve_, market_, positions_   (records)
//    └── ipc_server_         (unique_ptr<IpcServer>, only when endpoints set)
// -----------------------------------------------------------------------------
class LendingEngine {
 public:
  LendingEngine(EngineConfig config, const ITimeProvider& clock);

  ~LendingEngine();

  LendingEngine(const LendingEngine&) = delete;
  LendingEngine& operator=(const LendingEngine&) = delete;
  LendingEngine(LendingEngine&&) = delete;
  LendingEngine& operator=(LendingEngine&&) = delete;

  // Starts the IPC server when both ipc endpoints are configured and bridges
  // telemetry events to it. Idempotent.
  void start();

  // Stops the IPC server. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one command and returns the JSON reply.
  //
  // @details
  // Malformed requests (bad JSON, missing or mistyped fields, unknown
  // commands) are answered with code "InvalidArgument"; they never throw.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }

  // Snapshots, taken under the engine mutex.
  domain::Reserve reserve() const;
  domain::Market market() const;
  std::optional<domain::Position> position(
      const domain::AccountId& trader) const;
  math::TokenAmount balance(const domain::AccountId& vault) const;

  domain::AccountId lpVaultId(const domain::AccountId& investor) const;
  domain::AccountId receiptAccountId(const domain::AccountId& trader) const;

 private:
  void provisionLedger();
  void ensureVault(const domain::AccountId& vault,
                   const domain::AccountId& mint,
                   const domain::AccountId& owner);

  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& request);
  nlohmann::json handleStatus() const;
  nlohmann::json handleDeposit(const nlohmann::json& request);
  nlohmann::json handleWithdraw(const nlohmann::json& request);
  nlohmann::json handleOpen(const nlohmann::json& request);
  nlohmann::json handleClose(const nlohmann::json& request);
  nlohmann::json handleLiquidate(const nlohmann::json& request);
  nlohmann::json handleSetPrice(const nlohmann::json& request);

  EngineConfig config_;
  const ITimeProvider& clock_;

  InMemoryLedger ledger_;
  SimulatedVenue venue_;
  EventBus bus_;
  ReserveManager reserve_manager_;
  PositionManager position_manager_;

  domain::Reserve reserve_;
  domain::Market market_;
  std::map<domain::AccountId, domain::Position> positions_;

  mutable std::mutex mutex_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;
  bool running_{false};
};

}  // namespace lendswap
