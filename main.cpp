// -----------------------------------------------------------------------------
// lendswap - single executable entry point.
//
//   1) Load the engine config (JSON) named on the command line.
//   2) Create the LendingEngine on the wall clock. The engine provisions the
//      in-memory ledger and the simulated venue from the config.
//   3) Subscribe console logging for position and reserve telemetry.
//   4) Start the engine (IPC command / telemetry sockets when configured)
//      and idle on the main thread until Ctrl-C.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread   → waits for SIGINT
//   ipc thread    → IpcServer command loop; runs LendingEngine commands
// -----------------------------------------------------------------------------

#include "lendswap/config/engine_config.hpp"
#include "lendswap/engine/lending_engine.hpp"
#include "lendswap/math/checked_math.hpp"
#include "lendswap/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

// Set from the SIGINT handler, polled by main().
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/lendswap.json";

  lendswap::EngineConfig config;
  try {
    config = lendswap::loadEngineConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  lendswap::LiveTimeProvider clock;

  std::unique_ptr<lendswap::LendingEngine> engine;
  try {
    engine = std::make_unique<lendswap::LendingEngine>(std::move(config),
                                                       clock);
  } catch (const std::exception& e) {
    std::cerr << "[main] engine setup failed: " << e.what() << "\n";
    return 1;
  }

  engine->eventBus().subscribe<lendswap::PositionUpdateEvent>(
      [](const lendswap::PositionUpdateEvent& e) {
        std::cout << "[PositionUpdate] " << e.operation
                  << " trader=" << e.position.trader << " status="
                  << lendswap::domain::positionStatusToString(
                         e.position.status)
                  << " receipts=" << e.receipt_balance.value()
                  << " market_total_loan=" << e.market_total_loan.value()
                  << "\n";
      });

  engine->eventBus().subscribe<lendswap::ReserveUpdateEvent>(
      [](const lendswap::ReserveUpdateEvent& e) {
        std::cout << "[ReserveUpdate] " << e.operation
                  << " vault=" << e.vault_balance.value()
                  << " debt=" << e.reserve.debt.total.value()
                  << " borrow_rate="
                  << lendswap::math::toString(
                         e.reserve.state.borrow_rate.value())
                  << "\n";
      });

  std::signal(SIGINT, sigint_handler);

  try {
    engine->start();
  } catch (const std::exception& e) {
    std::cerr << "[main] start failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] running with config " << config_path << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine->stop();
  return 0;
}
