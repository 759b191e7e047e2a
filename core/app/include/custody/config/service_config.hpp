#pragma once

#include "custody/domain/principal.hpp"
#include "custody/domain/product.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace custody {

// -----------------------------------------------------------------------------
// ServiceConfig: startup configuration of the custody_node service
// -----------------------------------------------------------------------------
//
// @brief  Endpoints plus the bootstrap state of the in-memory role registry
//         and token ledger.
//
// @details
// Loaded once in main() from a JSON file and passed by value to the
// CustodyEngine. Every field has a default, so an empty object `{}` is a
// valid configuration:
//
//   {
//     "command_endpoint":   "tcp://127.0.0.1:5556",
//     "telemetry_endpoint": "tcp://127.0.0.1:5557",
//     "admin":    "admin",
//     "operator": "custody-operator",
//     "roles":      { "P": ["Producer"], "S": ["Shipper"], "C": ["Buyer"] },
//     "verified":   ["P", "S", "C"],
//     "balances":   { "B": 1000 },
//     "allowances": { "B": 1000 }
//   }
//
// An empty endpoint disables the IPC server (used by tests that drive
// executeCommand() directly).
//
// `allowances` is the amount each payer authorizes the operator to pull;
// see InMemoryTokenLedger.
// -----------------------------------------------------------------------------
struct ServiceConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  domain::Principal admin{"admin"};
  domain::Principal operator_id{"custody-operator"};

  std::map<domain::Principal, std::vector<domain::Role>> roles;
  std::vector<domain::Principal> verified;
  std::map<domain::Principal, domain::Amount> balances;
  std::map<domain::Principal, domain::Amount> allowances;
};

// -----------------------------------------------------------------------------
// parseServiceConfig(json)
// -----------------------------------------------------------------------------
// @brief  Builds a ServiceConfig from a parsed JSON object.
//
// @throws std::runtime_error when the document is not an object, a field has
//         the wrong type, a role name is unknown, or admin/operator is empty.
// -----------------------------------------------------------------------------
ServiceConfig parseServiceConfig(const nlohmann::json& document);

// -----------------------------------------------------------------------------
// loadServiceConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses a JSON configuration file.
//
// @throws std::runtime_error when the file cannot be opened, is not valid
//         JSON, or fails parseServiceConfig().
// -----------------------------------------------------------------------------
ServiceConfig loadServiceConfig(const std::string& path);

}  // namespace custody
