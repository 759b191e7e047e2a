#pragma once

#include "custody/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace custody {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe fan-out of committed domain events to
// observers (console logger, IPC telemetry bridge, tests).
//
// The bus is downstream of the EventLog: it never decides what happened, it
// only tells interested parties. Nothing in the lifecycle core depends on a
// subscriber being present.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread; in the service that
// is the audit EventLoopThread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback invoked only when the event holds EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish() already in flight may still invoke
  // the callback once; later publishes will not. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every subscriber before returning. The subscriber list is copied
  // under the lock and callbacks run without it, so a callback may publish
  // or unsubscribe without deadlocking. A callback that throws a
  // std::exception is logged and does not stop delivery to the rest.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions. Snapshot only.
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace custody
