#pragma once

#include "custody/registry/i_role_registry.hpp"

#include <map>
#include <set>
#include <shared_mutex>
#include <unordered_set>
#include <vector>

namespace custody {

// -----------------------------------------------------------------------------
// InMemoryRoleRegistry
// -----------------------------------------------------------------------------
//
// @brief  Process-local IRoleRegistry used by the custody_node service and by
//         the test suites.
//
// @details
// The constructor bootstraps exactly one Admin. The bootstrap admin is not
// verified; Admin actions never require verification.
//
// Lookups take a shared lock and mutations a unique lock, so many concurrent
// transitions can read role state without serializing on each other.
// -----------------------------------------------------------------------------
class InMemoryRoleRegistry final : public IRoleRegistry {
 public:
  explicit InMemoryRoleRegistry(domain::Principal bootstrap_admin);

  InMemoryRoleRegistry(const InMemoryRoleRegistry&) = delete;
  InMemoryRoleRegistry& operator=(const InMemoryRoleRegistry&) = delete;

  bool hasRole(const domain::Principal& principal,
               domain::Role role) const override;
  bool isVerified(const domain::Principal& principal) const override;
  void markVerified(const domain::Principal& principal) override;
  void grantRole(const domain::Principal& principal,
                 domain::Role role) override;
  void revokeRole(const domain::Principal& principal,
                  domain::Role role) override;

  // Sorted members of a role. Snapshot for reporting.
  std::vector<domain::Principal> members(domain::Role role) const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<domain::Role, std::set<domain::Principal>> members_;
  std::unordered_set<domain::Principal> verified_;
};

}  // namespace custody
