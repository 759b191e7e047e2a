// -----------------------------------------------------------------------------
// custody_node: single executable entry point.
//
//   1) Load ServiceConfig from the JSON file named by argv[1], or use the
//      built-in defaults when no path is given.
//   2) Create the CustodyEngine on a LiveTimeProvider clock.
//   3) Subscribe a console logger to committed events (runs on the audit
//      loop thread).
//   4) Start the engine: audit loop, then REP command + PUB telemetry
//      sockets.
//   5) Wait for Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread   → waits for SIGINT
//   audit thread  → console logger + telemetry bridge
//   ipc thread    → command handling (lifecycle transitions) + PUB socket
// -----------------------------------------------------------------------------

#include "custody/codec/json_codec.hpp"
#include "custody/config/service_config.hpp"
#include "custody/engine/custody_engine.hpp"
#include "custody/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. Lock-free atomic<bool> stores are
// async-signal-safe; the main thread polls it.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  custody::ServiceConfig config;
  if (argc > 1) {
    try {
      config = custody::loadServiceConfig(argv[1]);
    } catch (const std::runtime_error& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] configuration loaded from " << argv[1] << "\n";
  } else {
    std::cout << "[main] no configuration file given, using defaults.\n";
  }

  // -------------------------------------------------------------------------
  // 2) Engine on wall-clock time.
  // -------------------------------------------------------------------------
  custody::LiveTimeProvider clock;
  custody::CustodyEngine engine(clock, std::move(config));

  // -------------------------------------------------------------------------
  // 3) Console logger for every committed event.
  // -------------------------------------------------------------------------
  engine.auditEventBus().subscribe([](const custody::Event& e) {
    std::cout << "[Audit] #" << custody::sequenceIdOf(e) << " "
              << custody::codec::eventTypeName(e) << " product="
              << custody::productIdOf(e) << "\n";
  });

  // -------------------------------------------------------------------------
  // 4) Start. A bind failure on either socket ends the process.
  // -------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot start IPC server: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] custody_node running. Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait for SIGINT, then stop (joins IPC and audit threads).
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();

  return 0;
}
