#include "custody/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace custody {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWait = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();

  if (const auto dropped = queue_.size(); dropped > 0) {
    std::cout << "[EventLoopThread] stopped with " << dropped
              << " undelivered event(s).\n";
  }
}

// -----------------------------------------------------------------------------
// run(): wait on the queue itself, publish whatever arrives
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kIdleWait)) {
      bus_.publish(*event);
    }
  }
}

}  // namespace custody
