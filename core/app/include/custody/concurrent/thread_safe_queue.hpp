#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace custody {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded multi-producer / multi-consumer FIFO used at the
// thread boundaries of the service: committed events flow from the caller's
// thread to the audit loop, and from the audit loop to the IPC thread.
//
// FIFO order is the whole point here. The EventLog pushes under its own lock,
// so the order consumers pop in is the order the log assigned.
//
// Thread model: every method is safe from any thread. pop() blocks until an
// item is available, pop_for() blocks up to a timeout, try_pop() and drain()
// never block.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends to the back and wakes one blocked consumer.
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Removes and returns the front item, blocking while the queue is empty.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Removes and returns the front item, or std::nullopt if the queue is empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Like pop(), but gives up after `timeout` and returns std::nullopt.
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Takes everything currently queued, in FIFO order, under one lock.
  std::vector<T> drain() {
    std::vector<T> items;
    std::lock_guard lock(mutex_);
    items.reserve(queue_.size());
    for (auto& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // Signalled on push
  std::deque<T> queue_;
};

}  // namespace custody
