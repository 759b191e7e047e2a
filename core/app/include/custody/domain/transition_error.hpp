#pragma once

#include "custody/domain/product.hpp"

#include <optional>

namespace custody {
namespace domain {

// -----------------------------------------------------------------------------
// TransitionError: why a requested transition was rejected
// -----------------------------------------------------------------------------
//
// @brief  Every rejection is scoped to the single invocation that produced
//         it. None of them is fatal to the engine.
//
// @details
//   Unauthorized      caller lacks the required role (or, for raiseDispute,
//                     is neither the producer nor the bound buyer)
//   NotVerified       caller holds the role but is not verified
//   NotFound          no record exists for the product id
//   InvalidState      a state precondition is violated (already paid,
//                     already received, not yet paid, disputed, ...)
//   InsufficientFunds payer's ledger balance is below the price
//   TransferFailed    the ledger refused the transfer despite the balance
// -----------------------------------------------------------------------------
enum class TransitionError {
  Unauthorized,
  NotVerified,
  NotFound,
  InvalidState,
  InsufficientFunds,
  TransferFailed,
};

inline const char* errorToString(TransitionError error) {
  switch (error) {
    case TransitionError::Unauthorized:      return "Unauthorized";
    case TransitionError::NotVerified:       return "NotVerified";
    case TransitionError::NotFound:          return "NotFound";
    case TransitionError::InvalidState:      return "InvalidState";
    case TransitionError::InsufficientFunds: return "InsufficientFunds";
    case TransitionError::TransferFailed:    return "TransferFailed";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// TransitionResult
// -----------------------------------------------------------------------------
// Returned by every LifecycleEngine operation. On success `error` is empty
// and `product_id` names the record touched (the new id for createProduct,
// 0 for operations that do not address a product).
// -----------------------------------------------------------------------------
struct TransitionResult {
  std::optional<TransitionError> error;
  ProductId product_id{0};

  bool ok() const { return !error.has_value(); }

  static TransitionResult success(ProductId id = 0) {
    return TransitionResult{std::nullopt, id};
  }

  static TransitionResult failure(TransitionError e, ProductId id = 0) {
    return TransitionResult{e, id};
  }
};

}  // namespace domain
}  // namespace custody
