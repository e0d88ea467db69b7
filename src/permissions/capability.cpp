#include "permissions/capability.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace dappvault::permissions {

namespace {

constexpr std::array<std::pair<Capability, std::string_view>, 6> kNames{{
    {Capability::kConnect, "connect"},
    {Capability::kViewKey, "viewKey"},
    {Capability::kSign, "sign"},
    {Capability::kTransaction, "transaction"},
    {Capability::kRecords, "records"},
    {Capability::kDecrypt, "decrypt"},
}};

}  // namespace

const char* CapabilityName(Capability capability) {
  for (const auto& [value, name] : kNames) {
    if (value == capability) {
      return name.data();
    }
  }
  return "unknown";
}

std::optional<Capability> ParseCapability(std::string_view name) {
  for (const auto& [value, wire] : kNames) {
    if (wire == name) {
      return value;
    }
  }
  return std::nullopt;
}

nlohmann::json CapabilitiesToJson(const CapabilitySet& capabilities) {
  nlohmann::json out = nlohmann::json::array();
  for (auto capability : capabilities) {
    out.push_back(CapabilityName(capability));
  }
  return out;
}

bool CapabilitiesFromJson(const nlohmann::json& json, CapabilitySet* out) {
  if (!json.is_array()) {
    return false;
  }
  out->clear();
  for (const auto& item : json) {
    if (!item.is_string()) {
      return false;
    }
    if (auto capability = ParseCapability(item.get<std::string>())) {
      out->insert(*capability);
    }
  }
  return true;
}

bool ContainsAll(const CapabilitySet& granted, const CapabilitySet& requested) {
  return std::includes(granted.begin(), granted.end(), requested.begin(), requested.end());
}

}  // namespace dappvault::permissions
