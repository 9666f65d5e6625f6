// -----------------------------------------------------------------------------
// vault_ledger — standalone ledger process.
//
//   vault_ledger [config.json]
//
//   1) Load LedgerConfig (defaults when no path is given).
//   2) Build the in-memory collaborators from the config seeds:
//      KeyringAuthorizationProvider (identities) and TokenLedger
//      (settlement_accounts). The clock is the wall clock.
//   3) Create the LedgerEngine, subscribe logging callbacks, and start it,
//      restoring snapshot_path if that file exists.
//   4) Serve commands over ZeroMQ until Ctrl-C, then stop (which writes the
//      snapshot).
//
// Thread layout:
//   main thread   → waits for SIGINT
//   IPC thread    → IpcServer REP/PUB loop, runs every command
// -----------------------------------------------------------------------------

#include "vault/auth/keyring_authorization_provider.hpp"
#include "vault/config/config_loader.hpp"
#include "vault/domain/ledger_error.hpp"
#include "vault/engine/ledger_engine.hpp"
#include "vault/events/event.hpp"
#include "vault/persistence/json_snapshot.hpp"
#include "vault/settlement/token_ledger.hpp"
#include "vault/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag: the only global in the program. Set by the SIGINT handler,
// polled by the main thread.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  vault::LedgerConfig config;
  if (argc > 1) {
    try {
      config = vault::loadLedgerConfig(argv[1]);
    } catch (const vault::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded config from " << argv[1] << "\n";
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators.
  // -------------------------------------------------------------------------
  vault::LiveTimeProvider clock;

  vault::KeyringAuthorizationProvider keyring;
  for (const auto& seed : config.identities) {
    keyring.registerIdentity(seed.identity, seed.proof);
  }

  vault::TokenLedger token_ledger;
  for (const auto& seed : config.settlement_accounts) {
    token_ledger.openAccount(seed.address, seed.owner, seed.balance);
  }

  std::cout << "[main] " << config.identities.size() << " identity(ies), "
            << config.settlement_accounts.size()
            << " settlement account(s) seeded.\n";

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  vault::LedgerEngine engine(clock, keyring, token_ledger, config);

  engine.eventBus().subscribe<vault::TradeExecutedEvent>(
      [](const vault::TradeExecutedEvent& e) {
        std::cout << "[main] Trade executed: order=" << e.order.id
                  << " asset=" << e.asset.id << " " << e.previous_owner
                  << " -> " << e.buyer << " settled=" << e.settled_amount
                  << "\n";
      });

  engine.eventBus().subscribe<vault::TradeRejectedEvent>(
      [](const vault::TradeRejectedEvent& e) {
        std::cout << "[main] Trade rejected: order=" << e.order_id
                  << " error=" << vault::errorCodeToString(e.error) << "\n";
      });

  std::unique_ptr<vault::JsonSnapshotSource> snapshot;
  try {
    if (!config.snapshot_path.empty()) {
      snapshot = std::make_unique<vault::JsonSnapshotSource>(
          config.snapshot_path);
    }
    engine.start(snapshot.get());
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[main] Snapshot " << config.snapshot_path
              << " is unreadable: " << e.what() << "\n";
    return 1;
  } catch (const vault::LedgerError& e) {
    std::cerr << "[main] Snapshot " << config.snapshot_path
              << " is invalid: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }
  snapshot.reset();

  // -------------------------------------------------------------------------
  // 4) Serve until Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Ledger running. Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();

  return 0;
}
