#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace dappvault::permissions {

enum class Capability {
  kConnect,
  kViewKey,
  kSign,
  kTransaction,
  kRecords,
  kDecrypt,
};

using CapabilitySet = std::set<Capability>;

// Wire names: connect, viewKey, sign, transaction, records, decrypt.
const char* CapabilityName(Capability capability);
std::optional<Capability> ParseCapability(std::string_view name);

nlohmann::json CapabilitiesToJson(const CapabilitySet& capabilities);
// Unknown names are skipped; returns false if `json` is not an array of
// strings.
bool CapabilitiesFromJson(const nlohmann::json& json, CapabilitySet* out);

bool ContainsAll(const CapabilitySet& granted, const CapabilitySet& requested);

}  // namespace dappvault::permissions
