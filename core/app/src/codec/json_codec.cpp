#include "custody/codec/json_codec.hpp"
#include "custody/time/time_utils.hpp"

#include <type_traits>

namespace custody {
namespace codec {

namespace {

nlohmann::json optionalPrincipal(const std::optional<domain::Principal>& p) {
  return p.has_value() ? nlohmann::json(*p) : nlohmann::json(nullptr);
}

// Fields every event carries, regardless of alternative.
template <typename E>
nlohmann::json envelope(const char* type, const E& e) {
  nlohmann::json j;
  j["type"] = type;
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["product_id"] = e.product_id;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// productToJson()
// -----------------------------------------------------------------------------
nlohmann::json productToJson(const domain::Product& product) {
  nlohmann::json j;
  j["id"] = product.id;
  j["name"] = product.name;
  j["origin"] = product.origin;
  j["producer"] = product.producer;
  j["shipper"] = optionalPrincipal(product.shipper);
  j["buyer"] = optionalPrincipal(product.buyer);
  j["location"] = product.location;
  j["price"] = product.price;
  j["is_paid"] = product.is_paid;
  j["is_received"] = product.is_received;
  j["is_disputed"] = product.is_disputed;
  j["stage"] = domain::stageToString(domain::stageOf(product));
  return j;
}

// -----------------------------------------------------------------------------
// eventTypeName()
// -----------------------------------------------------------------------------
const char* eventTypeName(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ProductCreatedEvent>) {
          return "product_created";
        } else if constexpr (std::is_same_v<T, PaymentTransferredEvent>) {
          return "payment_transferred";
        } else if constexpr (std::is_same_v<T, ProductShippedEvent>) {
          return "product_shipped";
        } else if constexpr (std::is_same_v<T, ProductReceivedEvent>) {
          return "product_received";
        } else if constexpr (std::is_same_v<T, DisputeRaisedEvent>) {
          return "dispute_raised";
        } else {
          static_assert(std::is_same_v<T, DisputeResolvedEvent>,
                        "unhandled Event alternative");
          return "dispute_resolved";
        }
      },
      event);
}

// -----------------------------------------------------------------------------
// eventToJson(): one formatter per alternative
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event) {
  const char* type = eventTypeName(event);

  if (const auto* e = std::get_if<ProductCreatedEvent>(&event)) {
    auto j = envelope(type, *e);
    j["producer"] = e->producer;
    j["name"] = e->name;
    j["origin"] = e->origin;
    j["price"] = e->price;
    return j;
  }
  if (const auto* e = std::get_if<PaymentTransferredEvent>(&event)) {
    auto j = envelope(type, *e);
    j["payer"] = e->payer;
    j["payee"] = e->payee;
    j["amount"] = e->amount;
    return j;
  }
  if (const auto* e = std::get_if<ProductShippedEvent>(&event)) {
    auto j = envelope(type, *e);
    j["shipper"] = e->shipper;
    j["location"] = e->location;
    return j;
  }
  if (const auto* e = std::get_if<ProductReceivedEvent>(&event)) {
    auto j = envelope(type, *e);
    j["buyer"] = e->buyer;
    return j;
  }
  if (const auto* e = std::get_if<DisputeRaisedEvent>(&event)) {
    auto j = envelope(type, *e);
    j["raised_by"] = e->raised_by;
    return j;
  }
  const auto& e = std::get<DisputeResolvedEvent>(event);
  auto j = envelope(type, e);
  j["resolved_by"] = e.resolved_by;
  return j;
}

nlohmann::json eventsToJson(const std::vector<Event>& events) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& event : events) {
    array.push_back(eventToJson(event));
  }
  return array;
}

// -----------------------------------------------------------------------------
// resultToJson()
// -----------------------------------------------------------------------------
nlohmann::json resultToJson(const domain::TransitionResult& result) {
  nlohmann::json j;
  if (result.ok()) {
    j["status"] = "ok";
  } else {
    j["status"] = "rejected";
    j["error"] = domain::errorToString(*result.error);
  }
  if (result.product_id != 0) {
    j["product_id"] = result.product_id;
  }
  return j;
}

}  // namespace codec
}  // namespace custody
