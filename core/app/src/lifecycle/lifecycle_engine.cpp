#include "custody/lifecycle/lifecycle_engine.hpp"

#include <iostream>
#include <utility>

namespace custody {

using domain::Principal;
using domain::Product;
using domain::ProductId;
using domain::Role;
using domain::TransitionError;
using domain::TransitionResult;

LifecycleEngine::LifecycleEngine(ProductStore& store, IRoleRegistry& roles,
                                 ITokenLedger& ledger, EventLog& event_log)
    : store_(store), roles_(roles), ledger_(ledger), event_log_(event_log) {}

// -----------------------------------------------------------------------------
// createProduct
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::createProduct(const Principal& caller,
                                                std::string name,
                                                std::string origin,
                                                domain::Amount price) {
  if (auto error = checkCaller(caller, Role::Producer, true)) {
    return reject("createProduct", caller, 0, *error);
  }

  Product record;
  record.name = std::move(name);
  record.origin = std::move(origin);
  record.location = record.origin;
  record.producer = caller;
  record.price = price;

  auto handle = store_.createAcquired(std::move(record));
  const Product& created = handle.current();

  ProductCreatedEvent event;
  event.product_id = created.id;
  event.producer = created.producer;
  event.name = created.name;
  event.origin = created.origin;
  event.price = created.price;

  event_log_.append(std::move(event));
  return TransitionResult::success(handle.id());
}

// -----------------------------------------------------------------------------
// payForProduct
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::payForProduct(const Principal& caller,
                                                ProductId id) {
  auto handle = store_.acquire(id);
  if (!handle.exists()) {
    return reject("payForProduct", caller, id, TransitionError::NotFound);
  }

  const Product& current = handle.current();
  if (current.is_received || current.is_paid) {
    return reject("payForProduct", caller, id, TransitionError::InvalidState);
  }

  Product updated = current;
  updated.is_paid = true;
  if (!validUpdate(current, updated)) {
    return reject("payForProduct", caller, id, TransitionError::InvalidState);
  }

  if (ledger_.balanceOf(caller) < current.price) {
    return reject("payForProduct", caller, id,
                  TransitionError::InsufficientFunds);
  }

  if (!ledger_.transfer(caller, current.producer, current.price)) {
    return reject("payForProduct", caller, id,
                  TransitionError::TransferFailed);
  }

  PaymentTransferredEvent event;
  event.product_id = id;
  event.payer = caller;
  event.payee = current.producer;
  event.amount = current.price;

  return commit(handle, std::move(updated), std::move(event));
}

// -----------------------------------------------------------------------------
// shipProduct
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::shipProduct(const Principal& caller,
                                              ProductId id,
                                              std::string location) {
  if (auto error = checkCaller(caller, Role::Shipper, true)) {
    return reject("shipProduct", caller, id, *error);
  }

  auto handle = store_.acquire(id);
  if (!handle.exists()) {
    return reject("shipProduct", caller, id, TransitionError::NotFound);
  }

  const Product& current = handle.current();
  if (current.is_received || !current.is_paid || current.is_disputed) {
    return reject("shipProduct", caller, id, TransitionError::InvalidState);
  }

  Product updated = current;
  updated.shipper = caller;
  updated.location = location;
  if (!validUpdate(current, updated)) {
    return reject("shipProduct", caller, id, TransitionError::InvalidState);
  }

  ProductShippedEvent event;
  event.product_id = id;
  event.shipper = caller;
  event.location = std::move(location);

  return commit(handle, std::move(updated), std::move(event));
}

// -----------------------------------------------------------------------------
// receiveProduct
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::receiveProduct(const Principal& caller,
                                                 ProductId id) {
  if (auto error = checkCaller(caller, Role::Buyer, true)) {
    return reject("receiveProduct", caller, id, *error);
  }

  auto handle = store_.acquire(id);
  if (!handle.exists()) {
    return reject("receiveProduct", caller, id, TransitionError::NotFound);
  }

  const Product& current = handle.current();
  if (current.is_received || !current.is_paid || current.is_disputed) {
    return reject("receiveProduct", caller, id, TransitionError::InvalidState);
  }

  Product updated = current;
  updated.buyer = caller;
  updated.is_received = true;
  if (!validUpdate(current, updated)) {
    return reject("receiveProduct", caller, id, TransitionError::InvalidState);
  }

  ProductReceivedEvent event;
  event.product_id = id;
  event.buyer = caller;

  return commit(handle, std::move(updated), std::move(event));
}

// -----------------------------------------------------------------------------
// raiseDispute
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::raiseDispute(const Principal& caller,
                                               ProductId id) {
  auto handle = store_.acquire(id);
  if (!handle.exists()) {
    return reject("raiseDispute", caller, id, TransitionError::NotFound);
  }

  const Product& current = handle.current();
  const bool is_producer = caller == current.producer;
  const bool is_buyer = current.buyer.has_value() && caller == *current.buyer;
  if (!is_producer && !is_buyer) {
    return reject("raiseDispute", caller, id, TransitionError::Unauthorized);
  }

  if (current.is_disputed) {
    return reject("raiseDispute", caller, id, TransitionError::InvalidState);
  }

  Product updated = current;
  updated.is_disputed = true;
  if (!validUpdate(current, updated)) {
    return reject("raiseDispute", caller, id, TransitionError::InvalidState);
  }

  DisputeRaisedEvent event;
  event.product_id = id;
  event.raised_by = caller;

  return commit(handle, std::move(updated), std::move(event));
}

// -----------------------------------------------------------------------------
// resolveDispute
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::resolveDispute(const Principal& caller,
                                                 ProductId id) {
  if (auto error = checkCaller(caller, Role::Admin, false)) {
    return reject("resolveDispute", caller, id, *error);
  }

  auto handle = store_.acquire(id);
  if (!handle.exists()) {
    return reject("resolveDispute", caller, id, TransitionError::NotFound);
  }

  const Product& current = handle.current();
  if (!current.is_disputed) {
    return reject("resolveDispute", caller, id, TransitionError::InvalidState);
  }

  Product updated = current;
  updated.is_disputed = false;
  if (!validUpdate(current, updated)) {
    return reject("resolveDispute", caller, id, TransitionError::InvalidState);
  }

  DisputeResolvedEvent event;
  event.product_id = id;
  event.resolved_by = caller;

  return commit(handle, std::move(updated), std::move(event));
}

// -----------------------------------------------------------------------------
// verifyUser / grantRole / revokeRole: Admin-gated registry writes
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::verifyUser(const Principal& caller,
                                             const Principal& principal) {
  if (auto error = checkCaller(caller, Role::Admin, false)) {
    return reject("verifyUser", caller, 0, *error);
  }
  if (principal.empty()) {
    return reject("verifyUser", caller, 0, TransitionError::InvalidState);
  }

  roles_.markVerified(principal);
  std::cout << "[LifecycleEngine] " << caller << " verified " << principal
            << "\n";
  return TransitionResult::success();
}

TransitionResult LifecycleEngine::grantRole(const Principal& caller,
                                            const Principal& principal,
                                            Role role) {
  if (auto error = checkCaller(caller, Role::Admin, false)) {
    return reject("grantRole", caller, 0, *error);
  }
  if (principal.empty()) {
    return reject("grantRole", caller, 0, TransitionError::InvalidState);
  }

  roles_.grantRole(principal, role);
  std::cout << "[LifecycleEngine] " << caller << " granted "
            << domain::roleToString(role) << " to " << principal << "\n";
  return TransitionResult::success();
}

TransitionResult LifecycleEngine::revokeRole(const Principal& caller,
                                             const Principal& principal,
                                             Role role) {
  if (auto error = checkCaller(caller, Role::Admin, false)) {
    return reject("revokeRole", caller, 0, *error);
  }
  if (principal.empty()) {
    return reject("revokeRole", caller, 0, TransitionError::InvalidState);
  }

  roles_.revokeRole(principal, role);
  std::cout << "[LifecycleEngine] " << caller << " revoked "
            << domain::roleToString(role) << " from " << principal << "\n";
  return TransitionResult::success();
}

std::optional<Product> LifecycleEngine::getProduct(ProductId id) const {
  return store_.get(id);
}

// -----------------------------------------------------------------------------
// checkCaller: role membership first, verification second
// -----------------------------------------------------------------------------
std::optional<TransitionError> LifecycleEngine::checkCaller(
    const Principal& caller, Role role, bool require_verified) const {
  if (!roles_.hasRole(caller, role)) {
    return TransitionError::Unauthorized;
  }
  if (require_verified && !roles_.isVerified(caller)) {
    return TransitionError::NotVerified;
  }
  return std::nullopt;
}

bool LifecycleEngine::validUpdate(const Product& before, const Product& after) {
  if (!domain::invariantsHold(after) ||
      !domain::isLegalSuccessor(before, after)) {
    std::cerr << "[LifecycleEngine] ERROR: refusing update of product "
              << before.id << " that breaks record invariants.\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// commit: write back and log while the record lock is still held
// -----------------------------------------------------------------------------
TransitionResult LifecycleEngine::commit(ProductStore::RecordHandle& handle,
                                         Product updated, Event event) {
  if (!handle.commit(std::move(updated))) {
    return TransitionResult::failure(TransitionError::NotFound, handle.id());
  }
  event_log_.append(std::move(event));
  return TransitionResult::success(handle.id());
}

TransitionResult LifecycleEngine::reject(const char* operation,
                                         const Principal& caller, ProductId id,
                                         TransitionError error) {
  std::cerr << "[LifecycleEngine] rejected " << operation << "(id=" << id
            << ") by '" << caller << "': " << domain::errorToString(error)
            << "\n";
  return TransitionResult::failure(error, id);
}

}  // namespace custody
