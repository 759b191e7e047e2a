#include "custody/audit/event_log.hpp"
#include "custody/time/time_utils.hpp"

#include <utility>

namespace custody {

EventLog::EventLog(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// append(): stamp, store, forward
// -----------------------------------------------------------------------------
Event EventLog::append(Event event) {
  std::lock_guard lock(mutex_);

  // Sequence ids are dense: the n-th event ever appended carries n.
  const std::uint64_t sequence_id = events_.size() + 1;
  stampEvent(event, sequence_id, ms_to_timestamp(clock_.now_ms()));

  events_.push_back(event);

  if (sink_) {
    sink_(event);
  }
  return event;
}

void EventLog::setSink(Sink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
}

std::vector<Event> EventLog::entries() const {
  std::lock_guard lock(mutex_);
  return events_;
}

// -----------------------------------------------------------------------------
// since(): sequence ids are dense, so the suffix starts at index after_sequence
// -----------------------------------------------------------------------------
std::vector<Event> EventLog::since(std::uint64_t after_sequence) const {
  std::lock_guard lock(mutex_);
  if (after_sequence >= events_.size()) {
    return {};
  }
  return std::vector<Event>(
      events_.begin() + static_cast<std::ptrdiff_t>(after_sequence),
      events_.end());
}

std::vector<Event> EventLog::forProduct(domain::ProductId product_id) const {
  std::lock_guard lock(mutex_);
  std::vector<Event> result;
  for (const auto& event : events_) {
    if (productIdOf(event) == product_id) {
      result.push_back(event);
    }
  }
  return result;
}

std::size_t EventLog::size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

std::uint64_t EventLog::lastSequence() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

}  // namespace custody
