#include "custody/network/ipc_server.hpp"

#include "custody/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace custody {

namespace {

std::string oversizeReply(std::size_t size) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["response"] = "request of " + std::to_string(size) +
                      " bytes exceeds limit of " +
                      std::to_string(IpcServer::kMaxRequestBytes);
  return reply.dump();
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind REP + PUB, then spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto commands =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto telemetry =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  commands->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  commands->set(zmq::sockopt::linger, 0);
  telemetry->set(zmq::sockopt::linger, 0);

  // A failed bind throws before any member is touched, so a retry of
  // start() begins from a clean state.
  commands->bind(cmd_endpoint_);
  telemetry->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(commands);
  pub_socket_ = std::move(telemetry);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening for commands on " << cmd_endpoint_
            << ", publishing events on " << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped after " << commands_served_.load()
            << " command(s), " << events_published_.load()
            << " event(s) published.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

std::string IpcServer::telemetryTopic(const Event& event) {
  return codec::eventTypeName(event);
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return codec::eventToJson(event).dump();
}

// -----------------------------------------------------------------------------
// run(): alternate between publishing and serving one request
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Events committed before stop() still go out.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  for (const auto& event : telemetry_queue_.drain()) {
    const std::string topic = telemetryTopic(event);
    const std::string body = formatTelemetry(event);

    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t body_frame(body.data(), body.size());
    // PUB never blocks; with no subscriber the frames are dropped.
    pub_socket_->send(topic_frame, zmq::send_flags::sndmore);
    pub_socket_->send(body_frame, zmq::send_flags::dontwait);
    events_published_.fetch_add(1);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): at most one request per call
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t received;

  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;  // rcvtimeo elapsed
  }

  std::string reply;
  if (request.size() > kMaxRequestBytes) {
    std::cerr << "[IpcServer] refusing oversized request (" << request.size()
              << " bytes).\n";
    reply = oversizeReply(request.size());
  } else {
    reply = command_handler_(request.to_string());
  }

  // REP must answer every request before it can receive the next one.
  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
  commands_served_.fetch_add(1);
}

}  // namespace custody
