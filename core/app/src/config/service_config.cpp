#include "custody/config/service_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace custody {

namespace {

std::string requireString(const nlohmann::json& value, const char* field) {
  if (!value.is_string()) {
    throw std::runtime_error(std::string("config: '") + field +
                             "' must be a string");
  }
  return value.get<std::string>();
}

domain::Amount requireAmount(const nlohmann::json& value, const char* field,
                             const std::string& key) {
  const bool non_negative =
      value.is_number_unsigned() ||
      (value.is_number_integer() && value.get<std::int64_t>() >= 0);
  if (!non_negative) {
    throw std::runtime_error(std::string("config: '") + field + "." + key +
                             "' must be a non-negative integer");
  }
  return value.get<domain::Amount>();
}

std::map<domain::Principal, domain::Amount> parseAmounts(
    const nlohmann::json& value, const char* field) {
  if (!value.is_object()) {
    throw std::runtime_error(std::string("config: '") + field +
                             "' must be an object");
  }
  std::map<domain::Principal, domain::Amount> amounts;
  for (const auto& [principal, amount] : value.items()) {
    amounts[principal] = requireAmount(amount, field, principal);
  }
  return amounts;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseServiceConfig()
// -----------------------------------------------------------------------------
ServiceConfig parseServiceConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::runtime_error("config: document must be a JSON object");
  }

  ServiceConfig config;

  if (document.contains("command_endpoint")) {
    config.command_endpoint =
        requireString(document["command_endpoint"], "command_endpoint");
  }
  if (document.contains("telemetry_endpoint")) {
    config.telemetry_endpoint =
        requireString(document["telemetry_endpoint"], "telemetry_endpoint");
  }
  if (document.contains("admin")) {
    config.admin = requireString(document["admin"], "admin");
  }
  if (document.contains("operator")) {
    config.operator_id = requireString(document["operator"], "operator");
  }
  if (config.admin.empty()) {
    throw std::runtime_error("config: 'admin' must not be empty");
  }
  if (config.operator_id.empty()) {
    throw std::runtime_error("config: 'operator' must not be empty");
  }

  if (document.contains("roles")) {
    const auto& roles = document["roles"];
    if (!roles.is_object()) {
      throw std::runtime_error("config: 'roles' must be an object");
    }
    for (const auto& [principal, names] : roles.items()) {
      if (!names.is_array()) {
        throw std::runtime_error("config: 'roles." + principal +
                                 "' must be an array");
      }
      auto& granted = config.roles[principal];
      for (const auto& name : names) {
        auto role = domain::roleFromString(requireString(name, "roles"));
        if (!role) {
          throw std::runtime_error("config: unknown role '" +
                                   name.get<std::string>() + "' for " +
                                   principal);
        }
        granted.push_back(*role);
      }
    }
  }

  if (document.contains("verified")) {
    const auto& verified = document["verified"];
    if (!verified.is_array()) {
      throw std::runtime_error("config: 'verified' must be an array");
    }
    for (const auto& principal : verified) {
      config.verified.push_back(requireString(principal, "verified"));
    }
  }

  if (document.contains("balances")) {
    config.balances = parseAmounts(document["balances"], "balances");

    domain::Amount supply = 0;
    for (const auto& entry : config.balances) {
      const auto headroom = std::numeric_limits<domain::Amount>::max() - supply;
      if (entry.second > headroom) {
        throw std::runtime_error("config: 'balances' total overflows");
      }
      supply += entry.second;
    }
  }
  if (document.contains("allowances")) {
    config.allowances = parseAmounts(document["allowances"], "allowances");
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadServiceConfig()
// -----------------------------------------------------------------------------
ServiceConfig loadServiceConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open '" + path + "'");
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("config: '" + path + "' is not valid JSON: " +
                             e.what());
  }
  return parseServiceConfig(document);
}

}  // namespace custody
