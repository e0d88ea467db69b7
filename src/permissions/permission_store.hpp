#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "permissions/capability.hpp"

namespace dappvault::permissions {

struct SitePermission {
  std::string origin;
  CapabilitySet capabilities;  // never empty for a stored site
  std::string address;
  std::int64_t connected_at{0};
  std::int64_t last_accessed_at{0};
  std::optional<std::string> title;
  std::optional<std::string> favicon;
};

struct PermissionSettings {
  bool auto_approve_transactions{false};
  bool remember_permissions{true};
  std::size_t max_connected_sites{50};
};

using SiteMap = std::map<std::string, SitePermission>;

nlohmann::json SiteToJson(const SitePermission& site);
bool SiteFromJson(const nlohmann::json& json, SitePermission* site, std::string* error);
nlohmann::json SettingsToJson(const PermissionSettings& settings);
// Missing keys keep the values already in `settings`. On failure `settings`
// is left untouched.
bool SettingsFromJson(const nlohmann::json& json, PermissionSettings* settings,
                      std::string* error = nullptr);

// permissions.json: {"version":1, "sites":[...], "settings":{...}}.
class PermissionStore {
 public:
  explicit PermissionStore(std::filesystem::path path);

  // A missing file loads as empty state. Entries that fail to parse or carry
  // no capabilities are skipped.
  bool Load(SiteMap* sites, PermissionSettings* settings, std::string* error) const;
  // Throws util::StorageError on failure.
  void Save(const SiteMap& sites, const PermissionSettings& settings) const;

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace dappvault::permissions
