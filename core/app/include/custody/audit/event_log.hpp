#pragma once

#include "custody/events/event.hpp"
#include "custody/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace custody {

// -----------------------------------------------------------------------------
// EventLog: append-only audit trail of every committed transition
// -----------------------------------------------------------------------------
//
// @brief  Stores events in the order transitions complete and assigns each
//         one a strictly increasing sequence id starting at 1.
//
// @details
// The LifecycleEngine appends while it still holds the record lock of the
// product it changed. Two consequences:
//
//   - events for one product appear in the log in the order the transitions
//     were applied to it;
//   - the log order across products is the order in which transitions
//     committed.
//
// There is no removal or rewrite operation. Readers get copies.
//
// Sink:
//   An optional callback invoked with each stamped event, inside append()
//   and under the log mutex, so the sink observes exactly the log order. The
//   sink must be cheap and must not call back into the EventLog; the
//   CustodyEngine binds it to EventLoopThread::push().
//
// Thread model: every method is safe from any thread.
// -----------------------------------------------------------------------------
class EventLog {
 public:
  using Sink = std::function<void(const Event&)>;

  explicit EventLog(const ITimeProvider& clock);

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  // -------------------------------------------------------------------------
  // append(event)
  // -------------------------------------------------------------------------
  // @brief  Stamps sequence_id and timestamp, stores the event, forwards it
  //         to the sink, and returns the stamped copy.
  //
  // Any sequence_id/timestamp already present on the event is overwritten.
  // -------------------------------------------------------------------------
  Event append(Event event);

  // Replaces the sink. Pass an empty function to detach.
  void setSink(Sink sink);

  // All events in log order.
  std::vector<Event> entries() const;

  // Events whose sequence_id is strictly greater than after_sequence.
  // since(0) returns everything; since(lastSequence()) returns nothing.
  std::vector<Event> since(std::uint64_t after_sequence) const;

  // Events of one product in log order.
  std::vector<Event> forProduct(domain::ProductId product_id) const;

  std::size_t size() const;

  // Sequence id of the newest event, 0 when the log is empty.
  std::uint64_t lastSequence() const;

 private:
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::vector<Event> events_;
  Sink sink_;
};

}  // namespace custody
