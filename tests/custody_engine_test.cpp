// =============================================================================
// custody_engine_test.cpp
// =============================================================================
// Unit tests for custody::CustodyEngine.
//
// Validates:
//   - Bootstrap seeds roles, verification, balances and allowances
//   - executeCommand(): ping, status, the full custody flow over JSON
//   - Domain rejections reply "rejected" with the error kind
//   - Malformed requests reply "error" and leave state untouched
//   - events / balance / getProduct queries
//   - start() forwards committed events to auditEventBus() subscribers;
//     start()/stop() are idempotent and the destructor stops the engine
//   - A start() whose bind fails leaves the engine fully stopped
//
// IPC is disabled (empty endpoints) except in the bind-failure tests, which
// only bind loopback sockets.
// =============================================================================

#include "custody/engine/custody_engine.hpp"
#include "custody/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include <zmq.hpp>

using nlohmann::json;

class CustodyEngineTest : public ::testing::Test {
 protected:
  custody::SimulationTimeProvider sim_clock{1'700'000'000'000};

  static custody::ServiceConfig makeConfig() {
    custody::ServiceConfig config;
    config.command_endpoint = "";
    config.telemetry_endpoint = "";
    config.admin = "admin";
    config.operator_id = "escrow";
    config.roles["farm"] = {custody::domain::Role::Producer};
    config.roles["carrier"] = {custody::domain::Role::Shipper};
    config.roles["shop"] = {custody::domain::Role::Buyer};
    config.verified = {"farm", "carrier", "shop"};
    config.balances["shop"] = 500;
    config.allowances["shop"] = 500;
    return config;
  }

  static json call(custody::CustodyEngine& engine, const json& request) {
    return json::parse(engine.executeCommand(request.dump()));
  }
};

// -----------------------------------------------------------------------------
// 1. Bootstrap state is visible without start().
// -----------------------------------------------------------------------------
TEST_F(CustodyEngineTest, BootstrapSeedsRegistryAndLedger) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  EXPECT_FALSE(engine.running());
  EXPECT_TRUE(engine.roles().hasRole("admin", custody::domain::Role::Admin));
  EXPECT_TRUE(engine.roles().isVerified("farm"));
  EXPECT_EQ(engine.ledger().balanceOf("shop"), 500u);
  EXPECT_EQ(engine.ledger().allowance("shop", "escrow"), 500u);
  EXPECT_EQ(engine.store().size(), 0u);
}

TEST_F(CustodyEngineTest, PingAndStatus) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  auto pong = call(engine, {{"op", "ping"}});
  EXPECT_EQ(pong["status"], "ok");
  EXPECT_EQ(pong["response"], "pong");

  auto status = call(engine, {{"op", "status"}});
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["products"], 0);
  EXPECT_EQ(status["events"], 0);
  EXPECT_EQ(status["last_sequence"], 0);
  ASSERT_EQ(status["admins"].size(), 1u);
  EXPECT_EQ(status["admins"][0], "admin");
}

// -----------------------------------------------------------------------------
// 2. Full custody flow over the JSON surface: create, pay, ship, receive.
// -----------------------------------------------------------------------------
TEST_F(CustodyEngineTest, FullFlowOverCommands) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  auto created = call(engine, {{"op", "createProduct"},
                               {"caller", "farm"},
                               {"name", "Coffee"},
                               {"origin", "Arusha"},
                               {"price", 120}});
  ASSERT_EQ(created["status"], "ok");
  const auto id = created["product_id"].get<std::uint64_t>();
  EXPECT_EQ(id, 1u);
  EXPECT_EQ(created["product"]["stage"], "Created");
  EXPECT_EQ(created["product"]["location"], "Arusha");

  auto paid = call(engine,
                   {{"op", "payForProduct"}, {"caller", "shop"}, {"product_id", id}});
  ASSERT_EQ(paid["status"], "ok");
  EXPECT_EQ(paid["product"]["is_paid"], true);

  auto shipped = call(engine, {{"op", "shipProduct"},
                               {"caller", "carrier"},
                               {"product_id", id},
                               {"location", "Mombasa"}});
  ASSERT_EQ(shipped["status"], "ok");
  EXPECT_EQ(shipped["product"]["shipper"], "carrier");
  EXPECT_EQ(shipped["product"]["location"], "Mombasa");

  auto received = call(
      engine, {{"op", "receiveProduct"}, {"caller", "shop"}, {"product_id", id}});
  ASSERT_EQ(received["status"], "ok");
  EXPECT_EQ(received["product"]["buyer"], "shop");
  EXPECT_EQ(received["product"]["stage"], "Received");

  EXPECT_EQ(engine.ledger().balanceOf("shop"), 380u);
  EXPECT_EQ(engine.ledger().balanceOf("farm"), 120u);

  auto balance = call(engine, {{"op", "balance"}, {"principal", "shop"}});
  EXPECT_EQ(balance["balance"], 380);
  EXPECT_EQ(balance["allowance"], 380);

  auto events = call(engine, {{"op", "events"}});
  ASSERT_EQ(events["events"].size(), 4u);
  EXPECT_EQ(events["events"][0]["type"], "product_created");
  EXPECT_EQ(events["events"][3]["type"], "product_received");
  EXPECT_EQ(events["last_sequence"], 4);

  auto tail = call(engine, {{"op", "events"}, {"since", 2}});
  ASSERT_EQ(tail["events"].size(), 2u);
  EXPECT_EQ(tail["events"][0]["type"], "product_shipped");
}

// -----------------------------------------------------------------------------
// 3. Domain rejections carry the error kind and the product id.
// -----------------------------------------------------------------------------
TEST_F(CustodyEngineTest, RejectionsReportErrorKind) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  auto unauthorized = call(engine, {{"op", "createProduct"},
                                    {"caller", "shop"},
                                    {"name", "Tea"},
                                    {"origin", "Kericho"},
                                    {"price", 10}});
  EXPECT_EQ(unauthorized["status"], "rejected");
  EXPECT_EQ(unauthorized["error"], "Unauthorized");

  auto missing = call(
      engine, {{"op", "payForProduct"}, {"caller", "shop"}, {"product_id", 42}});
  EXPECT_EQ(missing["status"], "rejected");
  EXPECT_EQ(missing["error"], "NotFound");
  EXPECT_EQ(missing["product_id"], 42);

  auto expensive = call(engine, {{"op", "createProduct"},
                                 {"caller", "farm"},
                                 {"name", "Saffron"},
                                 {"origin", "Herat"},
                                 {"price", 10'000}});
  const auto id = expensive["product_id"].get<std::uint64_t>();

  auto unpaid = call(engine, {{"op", "shipProduct"},
                              {"caller", "carrier"},
                              {"product_id", id},
                              {"location", "Port"}});
  EXPECT_EQ(unpaid["error"], "InvalidState");

  auto broke = call(
      engine, {{"op", "payForProduct"}, {"caller", "shop"}, {"product_id", id}});
  EXPECT_EQ(broke["error"], "InsufficientFunds");
  EXPECT_FALSE(broke.contains("product"));

  auto lookup = call(engine, {{"op", "getProduct"}, {"product_id", id}});
  EXPECT_EQ(lookup["product"]["is_paid"], false);
  EXPECT_EQ(engine.eventLog().size(), 1u);
}

TEST_F(CustodyEngineTest, AdminCommandsGateOnAdminRole) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  auto refused = call(engine, {{"op", "grantRole"},
                               {"caller", "farm"},
                               {"principal", "newcomer"},
                               {"role", "Shipper"}});
  EXPECT_EQ(refused["error"], "Unauthorized");

  auto granted = call(engine, {{"op", "grantRole"},
                               {"caller", "admin"},
                               {"principal", "newcomer"},
                               {"role", "Shipper"}});
  EXPECT_EQ(granted["status"], "ok");
  auto verified = call(engine, {{"op", "verifyUser"},
                                {"caller", "admin"},
                                {"principal", "newcomer"}});
  EXPECT_EQ(verified["status"], "ok");
  EXPECT_TRUE(engine.roles().hasRole("newcomer", custody::domain::Role::Shipper));
  EXPECT_TRUE(engine.roles().isVerified("newcomer"));

  auto revoked = call(engine, {{"op", "revokeRole"},
                               {"caller", "admin"},
                               {"principal", "newcomer"},
                               {"role", "Shipper"}});
  EXPECT_EQ(revoked["status"], "ok");
  EXPECT_FALSE(
      engine.roles().hasRole("newcomer", custody::domain::Role::Shipper));
}

TEST_F(CustodyEngineTest, DisputeRoundTripOverCommands) {
  custody::CustodyEngine engine(sim_clock, makeConfig());
  auto created = call(engine, {{"op", "createProduct"},
                               {"caller", "farm"},
                               {"name", "Cocoa"},
                               {"origin", "Kumasi"},
                               {"price", 50}});
  const auto id = created["product_id"].get<std::uint64_t>();

  auto raised = call(
      engine, {{"op", "raiseDispute"}, {"caller", "farm"}, {"product_id", id}});
  EXPECT_EQ(raised["product"]["is_disputed"], true);

  auto stranger = call(
      engine, {{"op", "raiseDispute"}, {"caller", "shop"}, {"product_id", id}});
  EXPECT_EQ(stranger["error"], "Unauthorized");

  auto resolved = call(
      engine, {{"op", "resolveDispute"}, {"caller", "admin"}, {"product_id", id}});
  EXPECT_EQ(resolved["product"]["is_disputed"], false);

  auto history = call(engine, {{"op", "events"}, {"product_id", id}});
  ASSERT_EQ(history["events"].size(), 3u);
  EXPECT_EQ(history["events"][1]["raised_by"], "farm");
  EXPECT_EQ(history["events"][2]["resolved_by"], "admin");
}

// -----------------------------------------------------------------------------
// 4. Malformed input replies "error" and never mutates state.
// -----------------------------------------------------------------------------
TEST_F(CustodyEngineTest, MalformedRequestsReplyError) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  auto garbage = json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(garbage["status"], "error");

  auto array = json::parse(engine.executeCommand("[1, 2]"));
  EXPECT_EQ(array["status"], "error");

  auto no_op = call(engine, {{"caller", "farm"}});
  EXPECT_EQ(no_op["status"], "error");

  auto unknown = call(engine, {{"op", "teleport"}, {"caller", "farm"}});
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "unknown command: teleport");

  auto no_price = call(engine, {{"op", "createProduct"},
                                {"caller", "farm"},
                                {"name", "Tea"},
                                {"origin", "Kericho"}});
  EXPECT_EQ(no_price["status"], "error");

  auto negative = call(engine, {{"op", "createProduct"},
                                {"caller", "farm"},
                                {"name", "Tea"},
                                {"origin", "Kericho"},
                                {"price", -3}});
  EXPECT_EQ(negative["status"], "error");

  auto bad_role = call(engine, {{"op", "grantRole"},
                                {"caller", "admin"},
                                {"principal", "x"},
                                {"role", "Overlord"}});
  EXPECT_EQ(bad_role["status"], "error");
  EXPECT_EQ(bad_role["response"], "unknown role 'Overlord'");

  EXPECT_EQ(engine.store().size(), 0u);
  EXPECT_EQ(engine.eventLog().size(), 0u);
}

// -----------------------------------------------------------------------------
// 5. After start(), committed events reach auditEventBus() subscribers on
//    the audit loop thread.
// -----------------------------------------------------------------------------
TEST_F(CustodyEngineTest, StartForwardsEventsToAuditBus) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  std::promise<custody::ProductCreatedEvent> promise;
  auto future = promise.get_future();
  std::atomic<bool> delivered{false};

  engine.auditEventBus().subscribe<custody::ProductCreatedEvent>(
      [&](const custody::ProductCreatedEvent& e) {
        if (!delivered.exchange(true)) {
          promise.set_value(e);
        }
      });

  engine.start();
  ASSERT_TRUE(engine.running());

  auto result = engine.lifecycle().createProduct("farm", "Coffee", "Arusha", 5);
  ASSERT_TRUE(result.ok());

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  auto event = future.get();
  EXPECT_EQ(event.product_id, result.product_id);
  EXPECT_EQ(event.producer, "farm");
  EXPECT_EQ(event.sequence_id, 1u);

  engine.stop();
  EXPECT_FALSE(engine.running());
}

TEST_F(CustodyEngineTest, StartStopIdempotent) {
  custody::CustodyEngine engine(sim_clock, makeConfig());

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.running());

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.running());

  // Restart after stop.
  engine.start();
  EXPECT_TRUE(engine.running());
  engine.stop();
}

TEST_F(CustodyEngineTest, DestructorStopsRunningEngine) {
  {
    custody::CustodyEngine engine(sim_clock, makeConfig());
    engine.start();
    ASSERT_TRUE(engine.lifecycle()
                    .createProduct("farm", "Coffee", "Arusha", 5)
                    .ok());
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 6. The command endpoint is already taken: start() throws, nothing keeps
//    running, and the engine can be stopped and retried.
// -----------------------------------------------------------------------------
TEST_F(CustodyEngineTest, FailedBindLeavesEngineStopped) {
  zmq::context_t context(1);
  zmq::socket_t holder(context, zmq::socket_type::rep);
  holder.set(zmq::sockopt::linger, 0);
  holder.bind("tcp://127.0.0.1:*");
  const std::string taken = holder.get(zmq::sockopt::last_endpoint);

  auto config = makeConfig();
  config.command_endpoint = taken;
  config.telemetry_endpoint = "tcp://127.0.0.1:*";
  custody::CustodyEngine engine(sim_clock, config);

  std::atomic<int> delivered{0};
  engine.auditEventBus().subscribe(
      [&delivered](const custody::Event&) { delivered.fetch_add(1); });

  EXPECT_THROW(engine.start(), zmq::error_t);
  EXPECT_FALSE(engine.running());

  // No sink is attached: the event is logged but never forwarded.
  ASSERT_TRUE(engine.lifecycle()
                  .createProduct("farm", "Coffee", "Arusha", 5)
                  .ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(delivered.load(), 0);
  EXPECT_EQ(engine.eventLog().size(), 1u);

  auto status = call(engine, {{"op", "status"}});
  EXPECT_FALSE(status.contains("commands_served"));
  EXPECT_FALSE(status.contains("events_published"));

  EXPECT_NO_THROW(engine.stop());
  EXPECT_THROW(engine.start(), zmq::error_t);
  EXPECT_FALSE(engine.running());
}

TEST_F(CustodyEngineTest, InvalidEndpointLeavesEngineStopped) {
  auto config = makeConfig();
  config.command_endpoint = "bogus://nowhere";
  config.telemetry_endpoint = "bogus://nowhere-else";
  custody::CustodyEngine engine(sim_clock, config);

  EXPECT_THROW(engine.start(), zmq::error_t);
  EXPECT_FALSE(engine.running());

  auto status = call(engine, {{"op", "status"}});
  EXPECT_EQ(status["status"], "ok");
  EXPECT_FALSE(status.contains("commands_served"));
}
