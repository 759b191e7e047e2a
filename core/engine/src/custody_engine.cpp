#include "custody/engine/custody_engine.hpp"

#include "custody/codec/json_codec.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace custody {

using domain::Principal;
using domain::ProductId;
using domain::TransitionResult;

namespace {

// A request that parsed as JSON but lacks a field or carries one of the
// wrong type. Caught in executeCommand() next to nlohmann::json::exception.
class BadRequest : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

const nlohmann::json& requireField(const nlohmann::json& request,
                                   const char* field) {
  auto it = request.find(field);
  if (it == request.end()) {
    throw BadRequest(std::string("missing field '") + field + "'");
  }
  return *it;
}

std::string requireString(const nlohmann::json& request, const char* field) {
  const auto& value = requireField(request, field);
  if (!value.is_string()) {
    throw BadRequest(std::string("field '") + field + "' must be a string");
  }
  return value.get<std::string>();
}

std::uint64_t requireUnsigned(const nlohmann::json& request,
                              const char* field) {
  const auto& value = requireField(request, field);
  const bool non_negative =
      value.is_number_unsigned() ||
      (value.is_number_integer() && value.get<std::int64_t>() >= 0);
  if (!non_negative) {
    throw BadRequest(std::string("field '") + field +
                     "' must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

domain::Role requireRole(const nlohmann::json& request) {
  const std::string name = requireString(request, "role");
  auto role = domain::roleFromString(name);
  if (!role) {
    throw BadRequest("unknown role '" + name + "'");
  }
  return *role;
}

nlohmann::json errorReply(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CustodyEngine::CustodyEngine(const ITimeProvider& clock, ServiceConfig config)
    : config_(std::move(config)),
      roles_(config_.admin),
      ledger_(config_.operator_id),
      event_log_(clock),
      lifecycle_(store_, roles_, ledger_, event_log_) {
  bootstrap();
}

CustodyEngine::~CustodyEngine() { stop(); }

// -----------------------------------------------------------------------------
// bootstrap(): seed registry and ledger from config
// -----------------------------------------------------------------------------
void CustodyEngine::bootstrap() {
  for (const auto& [principal, granted] : config_.roles) {
    for (auto role : granted) {
      roles_.grantRole(principal, role);
    }
  }
  for (const auto& principal : config_.verified) {
    roles_.markVerified(principal);
  }
  for (const auto& [principal, amount] : config_.balances) {
    if (!ledger_.mint(principal, amount)) {
      throw std::runtime_error("cannot mint " + std::to_string(amount) +
                               " to '" + principal + "'");
    }
  }
  for (const auto& [principal, amount] : config_.allowances) {
    ledger_.approve(principal, config_.operator_id, amount);
  }

  std::cout << "[CustodyEngine] bootstrapped: admin=" << config_.admin
            << " operator=" << config_.operator_id << " principals="
            << config_.roles.size() << " supply=" << ledger_.totalSupply()
            << "\n";
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void CustodyEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Audit loop first, so the sink has somewhere to deliver ----------
  audit_loop_.start();
  event_log_.setSink([this](const Event& e) { audit_loop_.push(e); });

  // ---  2) IpcServer (commands + telemetry) --------------------------------
  // Kept local until both sockets are bound. A failed bind unwinds step 1
  // so the engine is left exactly as it was before start().
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    auto server = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    try {
      server->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[CustodyEngine] IPC start failed: " << e.what() << "\n";
      event_log_.setSink({});
      audit_loop_.stop();
      throw;
    }
    ipc_server_ = std::move(server);

    telemetry_subscription_ = audit_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[CustodyEngine] started"
            << (ipc_server_ ? " with IPC." : " without IPC.") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void CustodyEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Detach the sink and join the audit loop --------------------------
  // Commands still arriving on the IPC thread are logged but not forwarded.
  event_log_.setSink({});
  audit_loop_.stop();

  // ---  2) No bridge callback can run now; drop it and join the IPC thread --
  if (telemetry_subscription_) {
    audit_loop_.eventBus().unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  running_ = false;

  std::cout << "[CustodyEngine] stopped. " << event_log_.size()
            << " event(s) in log.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON boundary
// -----------------------------------------------------------------------------
std::string CustodyEngine::executeCommand(const std::string& request) {
  nlohmann::json response;

  try {
    const auto parsed = nlohmann::json::parse(request);
    if (!parsed.is_object()) {
      response = errorReply("request must be a JSON object");
    } else {
      response = dispatch(parsed);
    }
  } catch (const nlohmann::json::exception& e) {
    response = errorReply(std::string("malformed request: ") + e.what());
  } catch (const BadRequest& e) {
    response = errorReply(e.what());
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per op
// -----------------------------------------------------------------------------
nlohmann::json CustodyEngine::dispatch(const nlohmann::json& request) {
  const std::string op = requireString(request, "op");

  if (op == "ping") {
    nlohmann::json response;
    response["status"] = "ok";
    response["response"] = "pong";
    return response;
  }

  if (op == "status") {
    nlohmann::json response;
    response["status"] = "ok";
    response["products"] = store_.size();
    response["events"] = event_log_.size();
    response["last_sequence"] = event_log_.lastSequence();
    response["admins"] = roles_.members(domain::Role::Admin);
    if (ipc_server_) {
      response["commands_served"] = ipc_server_->commandsServed();
      response["events_published"] = ipc_server_->eventsPublished();
    }
    return response;
  }

  if (op == "getProduct") {
    const ProductId id = requireUnsigned(request, "product_id");
    auto product = lifecycle_.getProduct(id);
    if (!product) {
      return codec::resultToJson(
          TransitionResult::failure(domain::TransitionError::NotFound, id));
    }
    nlohmann::json response;
    response["status"] = "ok";
    response["product"] = codec::productToJson(*product);
    return response;
  }

  if (op == "events") {
    std::uint64_t since = 0;
    if (request.contains("since")) {
      since = requireUnsigned(request, "since");
    }
    std::vector<Event> events;
    if (request.contains("product_id")) {
      const ProductId id = requireUnsigned(request, "product_id");
      for (auto& e : event_log_.forProduct(id)) {
        if (sequenceIdOf(e) > since) {
          events.push_back(std::move(e));
        }
      }
    } else {
      events = event_log_.since(since);
    }
    nlohmann::json response;
    response["status"] = "ok";
    response["events"] = codec::eventsToJson(events);
    response["last_sequence"] = event_log_.lastSequence();
    return response;
  }

  if (op == "balance") {
    const Principal principal = requireString(request, "principal");
    nlohmann::json response;
    response["status"] = "ok";
    response["principal"] = principal;
    response["balance"] = ledger_.balanceOf(principal);
    response["allowance"] = ledger_.allowance(principal, config_.operator_id);
    return response;
  }

  // Everything below acts on behalf of a caller.
  const Principal caller = requireString(request, "caller");

  if (op == "createProduct") {
    const std::string name = requireString(request, "name");
    const std::string origin = requireString(request, "origin");
    const domain::Amount price = requireUnsigned(request, "price");
    return transitionReply(
        lifecycle_.createProduct(caller, name, origin, price));
  }
  if (op == "payForProduct") {
    return transitionReply(lifecycle_.payForProduct(
        caller, requireUnsigned(request, "product_id")));
  }
  if (op == "shipProduct") {
    const ProductId id = requireUnsigned(request, "product_id");
    const std::string location = requireString(request, "location");
    return transitionReply(lifecycle_.shipProduct(caller, id, location));
  }
  if (op == "receiveProduct") {
    return transitionReply(lifecycle_.receiveProduct(
        caller, requireUnsigned(request, "product_id")));
  }
  if (op == "raiseDispute") {
    return transitionReply(lifecycle_.raiseDispute(
        caller, requireUnsigned(request, "product_id")));
  }
  if (op == "resolveDispute") {
    return transitionReply(lifecycle_.resolveDispute(
        caller, requireUnsigned(request, "product_id")));
  }
  if (op == "verifyUser") {
    return codec::resultToJson(
        lifecycle_.verifyUser(caller, requireString(request, "principal")));
  }
  if (op == "grantRole") {
    const Principal principal = requireString(request, "principal");
    return codec::resultToJson(
        lifecycle_.grantRole(caller, principal, requireRole(request)));
  }
  if (op == "revokeRole") {
    const Principal principal = requireString(request, "principal");
    return codec::resultToJson(
        lifecycle_.revokeRole(caller, principal, requireRole(request)));
  }

  return errorReply("unknown command: " + op);
}

// Adds the committed record to a successful transition reply.
nlohmann::json CustodyEngine::transitionReply(const TransitionResult& result) {
  nlohmann::json response = codec::resultToJson(result);
  if (result.ok()) {
    if (auto product = lifecycle_.getProduct(result.product_id)) {
      response["product"] = codec::productToJson(*product);
    }
  }
  return response;
}

}  // namespace custody
