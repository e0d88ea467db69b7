#include "permissions/permission_store.hpp"

#include "util/atomic_file.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::permissions {

nlohmann::json SiteToJson(const SitePermission& site) {
  nlohmann::json json{
      {"origin", site.origin},
      {"permissions", CapabilitiesToJson(site.capabilities)},
      {"address", site.address},
      {"connectedAt", site.connected_at},
      {"lastAccessedAt", site.last_accessed_at},
  };
  if (site.title) {
    json["title"] = *site.title;
  }
  if (site.favicon) {
    json["favicon"] = *site.favicon;
  }
  return json;
}

bool SiteFromJson(const nlohmann::json& json, SitePermission* site, std::string* error) {
  SitePermission parsed;
  try {
    parsed.origin = json.at("origin").get<std::string>();
    if (!CapabilitiesFromJson(json.at("permissions"), &parsed.capabilities)) {
      if (error) *error = "permissions must be an array of strings";
      return false;
    }
    parsed.address = json.value("address", std::string());
    parsed.connected_at = json.value("connectedAt", std::int64_t{0});
    parsed.last_accessed_at = json.value("lastAccessedAt", parsed.connected_at);
    if (json.contains("title") && json.at("title").is_string()) {
      parsed.title = json.at("title").get<std::string>();
    }
    if (json.contains("favicon") && json.at("favicon").is_string()) {
      parsed.favicon = json.at("favicon").get<std::string>();
    }
  } catch (const nlohmann::json::exception& ex) {
    if (error) *error = ex.what();
    return false;
  }
  if (parsed.origin.empty()) {
    if (error) *error = "site origin is empty";
    return false;
  }
  *site = std::move(parsed);
  return true;
}

nlohmann::json SettingsToJson(const PermissionSettings& settings) {
  return nlohmann::json{
      {"autoApproveTransactions", settings.auto_approve_transactions},
      {"rememberPermissions", settings.remember_permissions},
      {"maxConnectedSites", settings.max_connected_sites},
  };
}

bool SettingsFromJson(const nlohmann::json& json, PermissionSettings* settings,
                      std::string* error) {
  if (!json.is_object()) {
    if (error) *error = "settings must be an object";
    return false;
  }
  PermissionSettings parsed = *settings;
  for (const auto* key : {"autoApproveTransactions", "rememberPermissions"}) {
    if (json.contains(key) && !json.at(key).is_boolean()) {
      if (error) *error = std::string(key) + " must be a boolean";
      return false;
    }
  }
  parsed.auto_approve_transactions =
      json.value("autoApproveTransactions", parsed.auto_approve_transactions);
  parsed.remember_permissions = json.value("rememberPermissions", parsed.remember_permissions);
  if (json.contains("maxConnectedSites")) {
    const auto& max_sites = json.at("maxConnectedSites");
    if (!max_sites.is_number_unsigned() || max_sites.get<std::size_t>() == 0) {
      if (error) *error = "maxConnectedSites must be at least 1";
      return false;
    }
    parsed.max_connected_sites = max_sites.get<std::size_t>();
  }
  *settings = parsed;
  return true;
}

PermissionStore::PermissionStore(std::filesystem::path path) : path_(std::move(path)) {}

bool PermissionStore::Load(SiteMap* sites, PermissionSettings* settings, std::string* error) const {
  std::string text;
  bool missing = false;
  if (!util::ReadFileText(path_, &text, error, &missing)) {
    if (missing) {
      if (error) error->clear();
      return true;
    }
    return false;
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const std::exception& ex) {
    if (error) {
      *error = "failed to parse permissions file: " + std::string(ex.what());
    }
    return false;
  }
  if (!json.is_object()) {
    if (error) {
      *error = "permissions file must contain a JSON object";
    }
    return false;
  }
  sites->clear();
  if (json.contains("sites") && json.at("sites").is_array()) {
    for (const auto& item : json.at("sites")) {
      SitePermission site;
      std::string item_error;
      if (!SiteFromJson(item, &site, &item_error)) {
        util::LogWarn("permissions", "skipping malformed site entry: " + item_error);
        continue;
      }
      if (site.capabilities.empty()) {
        continue;
      }
      (*sites)[site.origin] = std::move(site);
    }
  }
  std::string settings_error;
  if (json.contains("settings") && !SettingsFromJson(json.at("settings"), settings, &settings_error)) {
    util::LogWarn("permissions", "ignoring invalid settings: " + settings_error);
  }
  return true;
}

void PermissionStore::Save(const SiteMap& sites, const PermissionSettings& settings) const {
  nlohmann::json json{{"version", 1}, {"settings", SettingsToJson(settings)}};
  json["sites"] = nlohmann::json::array();
  for (const auto& [origin, site] : sites) {
    json["sites"].push_back(SiteToJson(site));
  }
  std::string error;
  if (!util::AtomicWriteFileText(path_, json.dump(2), &error)) {
    throw util::StorageError("failed to write " + path_.string() + ": " + error);
  }
}

}  // namespace dappvault::permissions
