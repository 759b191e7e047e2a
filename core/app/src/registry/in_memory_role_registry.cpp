#include "custody/registry/in_memory_role_registry.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace custody {

// -----------------------------------------------------------------------------
// Constructor: bootstrap the first Admin
// -----------------------------------------------------------------------------
InMemoryRoleRegistry::InMemoryRoleRegistry(domain::Principal bootstrap_admin) {
  if (bootstrap_admin.empty()) {
    std::cerr << "[RoleRegistry] WARNING: empty bootstrap admin; registry "
                 "starts without an Admin.\n";
    return;
  }
  members_[domain::Role::Admin].insert(std::move(bootstrap_admin));
}

bool InMemoryRoleRegistry::hasRole(const domain::Principal& principal,
                                   domain::Role role) const {
  std::shared_lock lock(mutex_);
  auto it = members_.find(role);
  return it != members_.end() && it->second.count(principal) > 0;
}

bool InMemoryRoleRegistry::isVerified(
    const domain::Principal& principal) const {
  std::shared_lock lock(mutex_);
  return verified_.count(principal) > 0;
}

void InMemoryRoleRegistry::markVerified(const domain::Principal& principal) {
  if (principal.empty()) {
    return;
  }
  std::unique_lock lock(mutex_);
  verified_.insert(principal);
}

void InMemoryRoleRegistry::grantRole(const domain::Principal& principal,
                                     domain::Role role) {
  if (principal.empty()) {
    return;
  }
  std::unique_lock lock(mutex_);
  members_[role].insert(principal);
}

void InMemoryRoleRegistry::revokeRole(const domain::Principal& principal,
                                      domain::Role role) {
  std::unique_lock lock(mutex_);
  auto it = members_.find(role);
  if (it != members_.end()) {
    it->second.erase(principal);
  }
}

// -----------------------------------------------------------------------------
// members(): sorted copy for STATUS replies
// -----------------------------------------------------------------------------
std::vector<domain::Principal> InMemoryRoleRegistry::members(
    domain::Role role) const {
  std::shared_lock lock(mutex_);
  auto it = members_.find(role);
  if (it == members_.end()) {
    return {};
  }
  return std::vector<domain::Principal>(it->second.begin(), it->second.end());
}

}  // namespace custody
