#include "custody/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace custody {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    // Copy under the lock, dispatch without it: a subscriber added while
    // this publish is running will only see the next event.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  // A failing observer is reported and skipped; the others still see the
  // event, and the transition that produced it has already committed.
  for (const auto& [id, callback] : copy) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] subscriber " << id << " threw on event #"
                << sequenceIdOf(event) << ": " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// subscriberCount()
// -----------------------------------------------------------------------------
std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace custody
