#pragma once

#include "custody/concurrent/thread_safe_queue.hpp"
#include "custody/eventbus/event_bus.hpp"
#include "custody/events/event.hpp"

#include <atomic>
#include <thread>

namespace custody {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on its EventBus.
//
// @details
// The CustodyEngine binds the EventLog's sink to push(), so every committed
// event reaches observers on this thread, in log order, without the caller
// of a transition ever running subscriber code. A slow observer therefore
// delays other observers but never a transition.
//
// stop() drains nothing: events still queued when stop() is called are
// discarded with the queue. They remain in the EventLog.
//
// Thread model: start()/stop() from the owning thread; push() and
// eventBus().subscribe() from any thread. Subscribers run on the worker.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Spawns the worker. No-op if already running.
  void start();

  // Clears the running flag and joins; the worker notices within one idle
  // wait. No-op if not running.
  void stop();

  // Enqueues an event for publication on the worker thread.
  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace custody
