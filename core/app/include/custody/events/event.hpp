#pragma once

#include "event_types.hpp"

#include <variant>

namespace custody {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for every domain event. The EventLog
// stores Event values, the EventBus delivers them, and the JSON codec
// renders them for telemetry.
//
// std::variant keeps events as values: no heap allocation per event, no
// base-class pointers, and std::visit forces every consumer to handle every
// alternative when a new event type is added.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ProductCreatedEvent,
    PaymentTransferredEvent,
    ProductShippedEvent,
    ProductReceivedEvent,
    DisputeRaisedEvent,
    DisputeResolvedEvent>;

// Product id of whichever alternative the variant holds.
inline domain::ProductId productIdOf(const Event& event) {
  return std::visit([](const auto& e) { return e.product_id; }, event);
}

inline std::uint64_t sequenceIdOf(const Event& event) {
  return std::visit([](const auto& e) { return e.sequence_id; }, event);
}

inline Timestamp timestampOf(const Event& event) {
  return std::visit([](const auto& e) { return e.timestamp; }, event);
}

// Stamps the audit fields on whichever alternative the variant holds.
inline void stampEvent(Event& event, std::uint64_t sequence_id,
                       Timestamp timestamp) {
  std::visit(
      [sequence_id, timestamp](auto& e) {
        e.sequence_id = sequence_id;
        e.timestamp = timestamp;
      },
      event);
}

}  // namespace custody
