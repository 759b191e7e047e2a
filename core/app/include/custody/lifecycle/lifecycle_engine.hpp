#pragma once

#include "custody/audit/event_log.hpp"
#include "custody/domain/principal.hpp"
#include "custody/domain/product.hpp"
#include "custody/domain/transition_error.hpp"
#include "custody/ledger/i_token_ledger.hpp"
#include "custody/registry/i_role_registry.hpp"
#include "custody/store/product_store.hpp"

#include <optional>
#include <string>

namespace custody {

// -----------------------------------------------------------------------------
// LifecycleEngine: guarded product transitions
// -----------------------------------------------------------------------------
//
// @brief  Validates and applies every custody-chain transition against the
//         ProductStore, consulting the role registry and the token ledger,
//         and appends exactly one event per successful transition.
//
// @details
// Every product transition follows the same shape:
//
//   1. Caller checks that do not depend on the record (role, then verified).
//   2. store.acquire(id): exclusive lock on the one record touched.
//   3. Record checks, in the documented order. The first failure is returned
//      and nothing else happens.
//   4. Build the updated record and validate it with domain::invariantsHold
//      and domain::isLegalSuccessor before any side effect.
//   5. External side effect, if any (ledger transfer for payForProduct).
//   6. Commit the record and append the event, both under the record lock.
//
// Check order per operation (first failure wins):
//
//   createProduct   Producer role → verified
//   payForProduct   exists → not received → not paid → balance ≥ price
//                   → transfer succeeds
//   shipProduct     Shipper role → verified → exists → not received → paid
//                   → not disputed
//   receiveProduct  Buyer role → verified → exists → not received → paid
//                   → not disputed
//   raiseDispute    exists → caller is producer or bound buyer
//                   → not disputed
//   resolveDispute  Admin role → exists → disputed
//   verifyUser      Admin role → principal non-empty
//   grantRole       Admin role → principal non-empty
//   revokeRole      Admin role → principal non-empty
//
// Role checks come before verification checks: a verified principal without
// the role gets Unauthorized; a role holder who is not verified gets
// NotVerified. Admin actions require the role only.
//
// payForProduct has no caller gate at all. Any principal may settle the
// price; who takes custody is decided later, at receipt.
//
// Thread model:
//   All public methods are safe to call concurrently from any thread.
//   Transitions on the same product serialize on its record lock;
//   transitions on different products proceed independently. The registry
//   and ledger are re-read on every call and never cached.
//
// Ownership:
//   Holds references to the store, registry, ledger and event log. All four
//   must outlive the engine.
// -----------------------------------------------------------------------------
class LifecycleEngine {
 public:
  LifecycleEngine(ProductStore& store, IRoleRegistry& roles,
                  ITokenLedger& ledger, EventLog& event_log);

  LifecycleEngine(const LifecycleEngine&) = delete;
  LifecycleEngine& operator=(const LifecycleEngine&) = delete;
  LifecycleEngine(LifecycleEngine&&) = delete;
  LifecycleEngine& operator=(LifecycleEngine&&) = delete;

  // -------------------------------------------------------------------------
  // createProduct(caller, name, origin, price)
  // -------------------------------------------------------------------------
  // @brief  Registers a new good produced by `caller`.
  //
  // @return success with the new id; Unauthorized; NotVerified.
  //
  // @details
  // The record starts with location = origin, no shipper, no buyer and all
  // flags false. Emits ProductCreatedEvent. The new record stays locked
  // until the event is logged, so no other transition on the id can be
  // logged before its creation.
  // -------------------------------------------------------------------------
  domain::TransitionResult createProduct(const domain::Principal& caller,
                                         std::string name, std::string origin,
                                         domain::Amount price);

  // -------------------------------------------------------------------------
  // payForProduct(caller, id)
  // -------------------------------------------------------------------------
  // @brief  Moves the price from `caller` to the producer and marks the
  //         product paid.
  //
  // @return success; NotFound; InvalidState (received or already paid);
  //         InsufficientFunds; TransferFailed.
  //
  // @details
  // Not idempotent. The ledger transfer runs while the record lock is held,
  // so two concurrent payments for one product debit exactly once: the
  // second sees is_paid and is rejected with InvalidState.
  // -------------------------------------------------------------------------
  domain::TransitionResult payForProduct(const domain::Principal& caller,
                                         domain::ProductId id);

  // Binds `caller` as shipper and moves the product to `location`.
  domain::TransitionResult shipProduct(const domain::Principal& caller,
                                       domain::ProductId id,
                                       std::string location);

  // Binds `caller` as buyer and marks the product received. Shipment is not
  // a precondition; payment is.
  domain::TransitionResult receiveProduct(const domain::Principal& caller,
                                          domain::ProductId id);

  // -------------------------------------------------------------------------
  // raiseDispute(caller, id)
  // -------------------------------------------------------------------------
  // Only the producer or the currently bound buyer may raise a dispute.
  // Before receipt no buyer is bound, so a Buyer-role principal who has not
  // received the product is Unauthorized. There is no stage restriction:
  // after receipt the bound buyer (or the producer) may still dispute.
  // -------------------------------------------------------------------------
  domain::TransitionResult raiseDispute(const domain::Principal& caller,
                                        domain::ProductId id);

  domain::TransitionResult resolveDispute(const domain::Principal& caller,
                                          domain::ProductId id);

  // Admin-only. Idempotent; emits no event.
  domain::TransitionResult verifyUser(const domain::Principal& caller,
                                      const domain::Principal& principal);

  // Admin-only role administration. Idempotent; emits no event.
  domain::TransitionResult grantRole(const domain::Principal& caller,
                                     const domain::Principal& principal,
                                     domain::Role role);
  domain::TransitionResult revokeRole(const domain::Principal& caller,
                                      const domain::Principal& principal,
                                      domain::Role role);

  // Read-only snapshot. Open to everyone.
  std::optional<domain::Product> getProduct(domain::ProductId id) const;

 private:
  // Role first, then (optionally) verification.
  std::optional<domain::TransitionError> checkCaller(
      const domain::Principal& caller, domain::Role role,
      bool require_verified) const;

  // The single place where cross-flag invariants are enforced.
  static bool validUpdate(const domain::Product& before,
                          const domain::Product& after);

  // Commits the record and appends the event under the held record lock.
  domain::TransitionResult commit(ProductStore::RecordHandle& handle,
                                  domain::Product updated, Event event);

  // Logs a rejection and builds the failure result.
  static domain::TransitionResult reject(const char* operation,
                                         const domain::Principal& caller,
                                         domain::ProductId id,
                                         domain::TransitionError error);

  ProductStore& store_;
  IRoleRegistry& roles_;
  ITokenLedger& ledger_;
  EventLog& event_log_;
};

}  // namespace custody
