#pragma once

#include "custody/domain/principal.hpp"
#include "custody/domain/product.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace custody {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event. Stamped by the EventLog from the
// injected ITimeProvider at the moment the transition commits.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Domain events
// -----------------------------------------------------------------------------
// One struct per successful transition. Every struct carries the product id,
// the transition-specific fields, and two audit fields filled in by the
// EventLog on append:
//
//   timestamp    when the transition committed
//   sequence_id  position in the log, strictly increasing from 1
//
// Events are plain data with value semantics. They hold no secrets and are
// readable by any observer.
// -----------------------------------------------------------------------------

// A producer registered a new good.
struct ProductCreatedEvent {
  domain::ProductId product_id{};
  domain::Principal producer;
  std::string name;
  std::string origin;
  domain::Amount price{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// The ledger moved `amount` from payer to payee (the producer).
struct PaymentTransferredEvent {
  domain::ProductId product_id{};
  domain::Principal payer;
  domain::Principal payee;
  domain::Amount amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct ProductShippedEvent {
  domain::ProductId product_id{};
  domain::Principal shipper;
  std::string location;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct ProductReceivedEvent {
  domain::ProductId product_id{};
  domain::Principal buyer;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Raised by the producer or the bound buyer.
struct DisputeRaisedEvent {
  domain::ProductId product_id{};
  domain::Principal raised_by;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Cleared by an Admin.
struct DisputeResolvedEvent {
  domain::ProductId product_id{};
  domain::Principal resolved_by;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace custody
