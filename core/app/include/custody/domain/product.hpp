#pragma once

#include "custody/domain/principal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace custody {
namespace domain {

// -----------------------------------------------------------------------------
// ProductId / Amount
// -----------------------------------------------------------------------------
// ProductId values are assigned by the ProductStore starting at 1 and are
// never reused. 0 is never a valid id and doubles as "no product" in results
// that do not refer to a record (e.g. verifyUser).
//
// Amount is denominated in the external ledger's smallest unit. Unsigned
// integer arithmetic keeps prices and balances exact.
// -----------------------------------------------------------------------------
using ProductId = std::uint64_t;
using Amount = std::uint64_t;

// -----------------------------------------------------------------------------
// Product
// -----------------------------------------------------------------------------
//
// @brief  One record per physical good moving through the custody chain.
//
// @details
// Plain value type. The authoritative copy lives inside the ProductStore and
// is only mutated through a locked RecordHandle by the LifecycleEngine.
// Copies handed out by ProductStore::get() and carried in replies are
// snapshots.
//
// The shipper and buyer are bound by the transition that sets them
// (shipProduct, receiveProduct) and are empty before that.
// -----------------------------------------------------------------------------
struct Product {
  ProductId id{};                   // Sequential, immutable
  std::string name;                 // Descriptive, set at creation
  std::string origin;               // Descriptive, seeds location
  Principal producer;               // Creator, immutable, never empty
  std::optional<Principal> shipper; // Bound at shipment
  std::optional<Principal> buyer;   // Bound at receipt
  std::string location;             // Mutated only by shipment
  Amount price{0};                  // In ledger units
  bool is_paid{false};
  bool is_received{false};
  bool is_disputed{false};
};

// -----------------------------------------------------------------------------
// ProductStage: position on the main lifecycle axis
// -----------------------------------------------------------------------------
// Derived from the flags for reporting; never stored. The disputed flag is
// orthogonal and not part of the stage.
//
//   Created ──pay──> Paid ──ship──> Shipped ──receive──> Received
// -----------------------------------------------------------------------------
enum class ProductStage {
  Created,
  Paid,
  Shipped,
  Received,
};

inline ProductStage stageOf(const Product& p) {
  if (p.is_received) return ProductStage::Received;
  if (p.shipper.has_value()) return ProductStage::Shipped;
  if (p.is_paid) return ProductStage::Paid;
  return ProductStage::Created;
}

inline const char* stageToString(ProductStage stage) {
  switch (stage) {
    case ProductStage::Created:  return "Created";
    case ProductStage::Paid:     return "Paid";
    case ProductStage::Shipped:  return "Shipped";
    case ProductStage::Received: return "Received";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// invariantsHold(p)
// -----------------------------------------------------------------------------
// @brief  Cross-field invariants every stored record must satisfy.
//
// @details
//   - producer is non-empty (a stored record always has a creator)
//   - is_received implies is_paid
//   - a bound shipper implies is_paid
//   - a bound buyer if and only if is_received
//
// The LifecycleEngine checks this before every commit so the rules live in
// exactly one place.
// -----------------------------------------------------------------------------
inline bool invariantsHold(const Product& p) {
  if (p.id == 0 || p.producer.empty()) {
    return false;
  }
  if (p.is_received && !p.is_paid) {
    return false;
  }
  if (p.shipper.has_value() && !p.is_paid) {
    return false;
  }
  return p.buyer.has_value() == p.is_received;
}

// -----------------------------------------------------------------------------
// isLegalSuccessor(before, after)
// -----------------------------------------------------------------------------
// @brief  True when `after` is a non-regressing update of `before`.
//
// @details
// Identity and creation fields never change. is_paid and is_received never
// revert. A bound buyer is never unbound or rebound. A shipper is never
// unbound but each shipProduct hop rebinds it to the current carrier. Only
// is_disputed may move in both directions.
// -----------------------------------------------------------------------------
inline bool isLegalSuccessor(const Product& before, const Product& after) {
  if (before.id != after.id || before.producer != after.producer ||
      before.name != after.name || before.origin != after.origin ||
      before.price != after.price) {
    return false;
  }
  if (before.is_paid && !after.is_paid) {
    return false;
  }
  if (before.is_received && !after.is_received) {
    return false;
  }
  if (before.shipper.has_value() && !after.shipper.has_value()) {
    return false;
  }
  if (before.buyer.has_value() && before.buyer != after.buyer) {
    return false;
  }
  return true;
}

}  // namespace domain
}  // namespace custody
