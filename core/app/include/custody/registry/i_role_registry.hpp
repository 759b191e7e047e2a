#pragma once

#include "custody/domain/principal.hpp"

namespace custody {

// -----------------------------------------------------------------------------
// IRoleRegistry: role membership and verification boundary
// -----------------------------------------------------------------------------
//
// @brief  The capability the LifecycleEngine queries on every call to decide
//         who may perform a transition.
//
// @details
// Two independent facts are kept per principal:
//   1. membership in each Role (Admin, Producer, Shipper, Buyer)
//   2. a verified flag
//
// The interface does NOT gate its mutators: "only an Admin may verify" is
// enforced by the LifecycleEngine before it calls markVerified(). Anything
// holding a non-const reference can administer the registry directly, which
// is how the service bootstraps from configuration and how tests arrange
// fixtures.
//
// The LifecycleEngine never caches answers; every transition re-reads.
//
// Thread model: implementations must be safe for concurrent readers and
// writers from any thread.
// -----------------------------------------------------------------------------
class IRoleRegistry {
 public:
  virtual ~IRoleRegistry() = default;

  virtual bool hasRole(const domain::Principal& principal,
                       domain::Role role) const = 0;

  virtual bool isVerified(const domain::Principal& principal) const = 0;

  // Idempotent: verifying an already verified principal is a no-op.
  virtual void markVerified(const domain::Principal& principal) = 0;

  // Idempotent membership changes.
  virtual void grantRole(const domain::Principal& principal,
                         domain::Role role) = 0;
  virtual void revokeRole(const domain::Principal& principal,
                          domain::Role role) = 0;
};

}  // namespace custody
