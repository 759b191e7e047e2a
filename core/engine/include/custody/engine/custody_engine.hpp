#pragma once

#include "custody/audit/event_log.hpp"
#include "custody/concurrent/event_loop_thread.hpp"
#include "custody/config/service_config.hpp"
#include "custody/ledger/in_memory_token_ledger.hpp"
#include "custody/lifecycle/lifecycle_engine.hpp"
#include "custody/network/ipc_server.hpp"
#include "custody/registry/in_memory_role_registry.hpp"
#include "custody/store/product_store.hpp"
#include "custody/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace custody {

// -----------------------------------------------------------------------------
// CustodyEngine
// -----------------------------------------------------------------------------
//
// @brief  Service root. Owns the product store, the role registry, the token
//         ledger, the event log, the lifecycle engine, the audit event loop
//         and the optional IPC server.
//
// @details
// main() and the tests construct one CustodyEngine and drive it either
// through lifecycle() directly or through executeCommand(), the JSON command
// surface that the IpcServer's REP socket is bound to.
//
// Thread layout:
//
//   caller thread(s)   → lifecycle transitions (per-record locking)
//   audit_loop thread  → EventBus observers of committed events
//   ipc thread         → REP command handling + PUB telemetry
//
// Event flow (wired in start()):
//   LifecycleEngine → EventLog::append → sink → audit_loop.push
//   audit_loop bus  → IpcServer::pushTelemetry  (when IPC is enabled)
//
// Before start() the EventLog still records every event but nothing is
// forwarded to the audit loop.
//
// Ownership:
//   CustodyEngine
//    ├── config_        (ServiceConfig, value, immutable after bootstrap)
//    ├── roles_         (InMemoryRoleRegistry, value)
//    ├── ledger_        (InMemoryTokenLedger, value)
//    ├── store_         (ProductStore, value)
//    ├── event_log_     (EventLog, value)
//    ├── lifecycle_     (LifecycleEngine, value, refers to the four above)
//    ├── audit_loop_    (EventLoopThread, value)
//    └── ipc_server_    (unique_ptr<IpcServer>, created in start())
//
// The clock is not owned; it must outlive the engine.
// Declaration order is construction order: the lifecycle engine is built
// after everything it refers to.
// -----------------------------------------------------------------------------
class CustodyEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock   Time source for event timestamps. Must outlive this
  //                 engine.
  // @param  config  Endpoints and bootstrap state. An empty endpoint
  //                 disables the IpcServer.
  //
  // @details
  // Seeds the registry (roles, verified flags) and the ledger (balances,
  // operator allowances) from config. No threads are spawned and no
  // sockets are opened.
  // -------------------------------------------------------------------------
  CustodyEngine(const ITimeProvider& clock, ServiceConfig config);

  // Destructor calls stop().
  ~CustodyEngine();

  CustodyEngine(const CustodyEngine&) = delete;
  CustodyEngine& operator=(const CustodyEngine&) = delete;
  CustodyEngine(CustodyEngine&&) = delete;
  CustodyEngine& operator=(CustodyEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Starts the audit loop, binds the EventLog sink to it, then
  //         brings up the IpcServer and its telemetry bridge.
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound; the
  // audit loop is then stopped again and running() stays false.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Detaches the sink and joins the audit loop, then drops the
  //         telemetry bridge and joins the IpcServer thread.
  //
  // Idempotent. start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Parses one JSON command, dispatches it, returns the JSON reply.
  //
  // @details
  // Request: {"op": "<name>", "caller": "<principal>", ...}
  //
  //   ping                                   → {"status":"ok","response":"pong"}
  //   status                                 → counts of products and events
  //   createProduct   name, origin, price
  //   payForProduct   product_id
  //   shipProduct     product_id, location
  //   receiveProduct  product_id
  //   raiseDispute    product_id
  //   resolveDispute  product_id
  //   verifyUser      principal
  //   grantRole       principal, role
  //   revokeRole      principal, role
  //   getProduct      product_id
  //   events          [since], [product_id]
  //   balance         principal
  //
  // Transitions reply {"status":"ok","product_id":N,"product":{...}} or
  // {"status":"rejected","error":"<Kind>","product_id":N}. Malformed JSON,
  // missing or mistyped fields and unknown ops reply
  // {"status":"error","response":"..."} without touching any state.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  LifecycleEngine& lifecycle() { return lifecycle_; }
  const EventLog& eventLog() const { return event_log_; }
  InMemoryRoleRegistry& roles() { return roles_; }
  InMemoryTokenLedger& ledger() { return ledger_; }
  const ProductStore& store() const { return store_; }

  // Observers of committed events. Callbacks run on the audit loop thread.
  EventBus& auditEventBus() { return audit_loop_.eventBus(); }

 private:
  void bootstrap();

  nlohmann::json dispatch(const nlohmann::json& request);
  nlohmann::json transitionReply(const domain::TransitionResult& result);

  ServiceConfig config_;

  InMemoryRoleRegistry roles_;
  InMemoryTokenLedger ledger_;
  ProductStore store_;
  EventLog event_log_;
  LifecycleEngine lifecycle_;

  EventLoopThread audit_loop_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  bool running_{false};
};

}  // namespace custody
