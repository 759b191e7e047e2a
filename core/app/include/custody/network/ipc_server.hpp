#pragma once

#include "custody/concurrent/thread_safe_queue.hpp"
#include "custody/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace custody {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ gateway for commands and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON command requests (REP
//         socket) and broadcasts every committed lifecycle event as JSON
//         (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each received request is a JSON command object. It is forwarded to
//      the command handler (bound to CustodyEngine::executeCommand()) and
//      the JSON reply is sent back. ZMQ_RCVTIMEO keeps recv() from blocking
//      indefinitely so the thread can alternate with telemetry draining.
//
//      Requests above kMaxRequestBytes are answered with an error reply
//      and never reach the handler.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Publishes each event as two frames: the topic (the event's wire
//      type name, e.g. "product_shipped") followed by the JSON body from
//      codec::eventToJson(). Subscribers filter on the topic prefix.
//      Events arrive through a ThreadSafeQueue from the audit loop thread,
//      so serialization and socket I/O never run under the EventLog lock.
//
// Thread model:
//   Constructed and destroyed on the main thread (via CustodyEngine).
//   start() spawns the worker; stop() clears an atomic flag and joins.
//   pushTelemetry() may be called from any thread.
//   The command handler runs on the IPC worker thread.
//
// Ownership:
//   Owned by CustodyEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  command_handler  Invoked for each request on the REP socket.
  //                          Takes the raw request, returns the reply.
  // @param  cmd_endpoint     ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB telemetry socket.
  //
  // No sockets are opened and no threads are spawned here.
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds both sockets and spawns the worker thread.
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker, joins it, then closes the sockets.
  //
  // Telemetry still queued is published before the worker exits.
  // Idempotent; safe if never started.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for publication on the PUB socket. Any thread.
  void pushTelemetry(Event event);

  // Topic frame of one telemetry message.
  static std::string telemetryTopic(const Event& event);

  // Body frame of one telemetry message.
  static std::string formatTelemetry(const Event& event);

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t eventsPublished() const { return events_published_.load(); }

  static constexpr std::size_t kMaxRequestBytes = 64 * 1024;

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then poll for one command.
  void run();

  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> events_published_{0};
};

}  // namespace custody
