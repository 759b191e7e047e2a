#pragma once

#include <optional>
#include <string>

namespace custody {
namespace domain {

// -----------------------------------------------------------------------------
// Principal
// -----------------------------------------------------------------------------
// Responsibility: Identifies an authenticated caller (an account or address).
// The custody core never authenticates anyone itself; whoever invokes a
// transition hands over the principal it has already authenticated.
//
// A valid principal is a non-empty string. There is no "none" value: fields
// that may be unset (shipper, buyer) use std::optional<Principal> instead.
// -----------------------------------------------------------------------------
using Principal = std::string;

// -----------------------------------------------------------------------------
// Role
// -----------------------------------------------------------------------------
// Responsibility: Named capability grants held by zero or more principals.
// Membership is stored by an IRoleRegistry; the verified flag is a separate,
// independent gate and is NOT a role.
// -----------------------------------------------------------------------------
enum class Role {
  Admin,     // Administers roles, verification and dispute resolution
  Producer,  // Creates product records
  Shipper,   // Ships paid products
  Buyer,     // Takes custody of shipped products
};

inline const char* roleToString(Role role) {
  switch (role) {
    case Role::Admin:    return "Admin";
    case Role::Producer: return "Producer";
    case Role::Shipper:  return "Shipper";
    case Role::Buyer:    return "Buyer";
  }
  return "Unknown";
}

// Parses the names produced by roleToString(). Case-sensitive.
inline std::optional<Role> roleFromString(const std::string& name) {
  if (name == "Admin") return Role::Admin;
  if (name == "Producer") return Role::Producer;
  if (name == "Shipper") return Role::Shipper;
  if (name == "Buyer") return Role::Buyer;
  return std::nullopt;
}

}  // namespace domain
}  // namespace custody
