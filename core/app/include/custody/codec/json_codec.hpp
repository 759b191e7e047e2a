#pragma once

#include "custody/domain/product.hpp"
#include "custody/domain/transition_error.hpp"
#include "custody/events/event.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace custody {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
// Renders domain values for the command replies and the telemetry stream.
// Encoding only: commands are decoded field by field by the CustodyEngine,
// which needs to distinguish malformed requests from domain rejections.
//
// Field names are snake_case. Unset shipper/buyer render as JSON null.
// Timestamps render as epoch milliseconds.
// -----------------------------------------------------------------------------

nlohmann::json productToJson(const domain::Product& product);

// Snake-case wire name of the event alternative, e.g. "product_created".
const char* eventTypeName(const Event& event);

// {"type": ..., "sequence_id": ..., "timestamp_ms": ..., "product_id": ...,
//  <transition-specific fields>}
nlohmann::json eventToJson(const Event& event);

nlohmann::json eventsToJson(const std::vector<Event>& events);

// {"status":"ok", "product_id":...} or
// {"status":"rejected", "error":"<Kind>", "product_id":...}
nlohmann::json resultToJson(const domain::TransitionResult& result);

}  // namespace codec
}  // namespace custody
