#include "permissions/permission_broker.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "permissions/origin.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::permissions {

namespace {

ApprovalTicket ReadyTicket(ApprovalOutcome outcome) {
  std::promise<ApprovalOutcome> promise;
  promise.set_value(outcome);
  return ApprovalTicket(std::string(), promise.get_future().share());
}

}  // namespace

const char* ApprovalOutcomeName(ApprovalOutcome outcome) {
  switch (outcome) {
    case ApprovalOutcome::kApproved:
      return "approved";
    case ApprovalOutcome::kRejected:
      return "rejected";
    case ApprovalOutcome::kTimedOut:
      return "timed out";
  }
  return "unknown";
}

nlohmann::json ApprovalRequestToJson(const ApprovalRequestEvent& event) {
  return nlohmann::json{
      {"requestId", event.request_id},
      {"origin", event.origin},
      {"type", event.kind},
      {"permissions", CapabilitiesToJson(event.capabilities)},
      {"address", event.address},
      {"data", event.payload},
      {"requestedAt", event.requested_at},
  };
}

ApprovalTicket::ApprovalTicket(std::string request_id,
                               std::shared_future<ApprovalOutcome> outcome)
    : request_id_(std::move(request_id)), outcome_(std::move(outcome)) {}

bool ApprovalTicket::ready() const {
  return outcome_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

ApprovalOutcome ApprovalTicket::Get() const { return outcome_.get(); }

void ApprovalTicket::Wait() const {
  switch (outcome_.get()) {
    case ApprovalOutcome::kApproved:
      return;
    case ApprovalOutcome::kRejected:
      throw util::PermissionDeniedError("user rejected the request");
    case ApprovalOutcome::kTimedOut:
      throw util::TimeoutError("approval request timed out");
  }
}

PermissionBroker::PermissionBroker(PermissionStore& store, util::Scheduler& scheduler,
                                   BrokerOptions options, util::NowFn now)
    : store_(store), scheduler_(scheduler), options_(options), now_(std::move(now)) {}

PermissionBroker::~PermissionBroker() { Shutdown(); }

void PermissionBroker::Load() {
  SiteMap sites;
  PermissionSettings settings;
  std::string error;
  if (!store_.Load(&sites, &settings, &error)) {
    util::LogError("permissions", "failed to load " + store_.path().string() + ": " + error);
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sites_ = std::move(sites);
  settings_ = settings;
  util::LogInfo("permissions", "loaded " + std::to_string(sites_.size()) + " site permissions");
}

void PermissionBroker::SetApprovalChannel(ApprovalChannel* channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  channel_ = channel;
}

bool PermissionBroker::IsConnected(const std::string& origin) const {
  return HasCapability(origin, Capability::kConnect);
}

bool PermissionBroker::HasCapability(const std::string& origin, Capability capability) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sites_.find(NormalizeOrigin(origin));
  return it != sites_.end() && it->second.capabilities.count(capability) > 0;
}

ApprovalTicket PermissionBroker::RequestCapability(const std::string& origin,
                                                   const CapabilitySet& capabilities,
                                                   const std::string& address,
                                                   const std::string& kind,
                                                   nlohmann::json payload) {
  if (capabilities.empty()) {
    throw util::ValidationError("no capabilities requested");
  }
  const auto key = NormalizeOrigin(origin);
  ApprovalRequestEvent event;
  ApprovalChannel* channel = nullptr;
  std::shared_future<ApprovalOutcome> outcome;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return ReadyTicket(ApprovalOutcome::kRejected);
    }
    auto site = sites_.find(key);
    if (site != sites_.end() && ContainsAll(site->second.capabilities, capabilities)) {
      site->second.last_accessed_at = now_();
      PersistOrLogLocked();
      return ReadyTicket(ApprovalOutcome::kApproved);
    }
    if (settings_.auto_approve_transactions && site != sites_.end() &&
        site->second.capabilities.count(Capability::kConnect) > 0 &&
        capabilities == CapabilitySet{Capability::kTransaction}) {
      util::LogInfo("permissions", "auto-approved transaction for " + key);
      site->second.last_accessed_at = now_();
      PersistOrLogLocked();
      return ReadyTicket(ApprovalOutcome::kApproved);
    }

    const auto requested_at = now_();
    const auto sequence = next_sequence_++;
    event.request_id = key + "-" + std::to_string(requested_at) + "-" + std::to_string(sequence);
    event.origin = key;
    event.kind = kind;
    event.capabilities = capabilities;
    event.address = address;
    event.payload = std::move(payload);
    event.requested_at = requested_at;

    Pending pending;
    pending.event = event;
    pending.sequence = sequence;
    outcome = pending.promise.get_future().share();
    const auto id = event.request_id;
    pending.timeout_task =
        scheduler_.Schedule(options_.approval_timeout, [this, id] { OnTimeout(id); });
    pending_.emplace(id, std::move(pending));
    channel = channel_;
  }

  util::LogInfo("permissions", "approval requested " + event.request_id + " (" + event.kind + ")");
  if (channel == nullptr) {
    util::LogWarn("permissions", "no approval channel attached; " + event.request_id +
                                     " will time out unless resolved");
  } else {
    try {
      channel->OnApprovalRequested(event);
    } catch (const std::exception& ex) {
      util::LogError("permissions", "approval channel failed for " + event.request_id + ": " +
                                        ex.what());
    }
  }
  return ApprovalTicket(event.request_id, std::move(outcome));
}

void PermissionBroker::ResolveLocked(PendingMap::iterator it, bool granted,
                                     ApprovalOutcome* outcome,
                                     std::promise<ApprovalOutcome>* promise) {
  Pending entry = std::move(it->second);
  pending_.erase(it);
  if (entry.timeout_task) {
    scheduler_.Cancel(*entry.timeout_task);
  }
  *outcome = ApprovalOutcome::kRejected;
  if (granted) {
    bool applied = false;
    ApplyGrantLocked(entry.event, &applied);
    if (applied) {
      *outcome = ApprovalOutcome::kApproved;
    }
  }
  *promise = std::move(entry.promise);
}

void PermissionBroker::ApplyGrantLocked(const ApprovalRequestEvent& event, bool* applied) {
  *applied = false;
  CapabilitySet to_store = event.capabilities;
  if (!settings_.remember_permissions) {
    // One-shot approval: only the connection itself is remembered.
    to_store.clear();
    if (event.capabilities.count(Capability::kConnect) > 0) {
      to_store.insert(Capability::kConnect);
    }
  }
  const auto now = now_();
  auto it = sites_.find(event.origin);
  if (it == sites_.end()) {
    if (to_store.empty()) {
      *applied = true;
      return;
    }
    if (sites_.size() >= settings_.max_connected_sites) {
      util::LogWarn("permissions", "rejecting " + event.request_id + ": " +
                                       std::to_string(settings_.max_connected_sites) +
                                       " connected sites already");
      return;
    }
    SitePermission site;
    site.origin = event.origin;
    site.capabilities = std::move(to_store);
    site.address = event.address;
    site.connected_at = now;
    site.last_accessed_at = now;
    if (event.payload.is_object()) {
      if (event.payload.contains("title") && event.payload.at("title").is_string()) {
        site.title = event.payload.at("title").get<std::string>();
      }
      if (event.payload.contains("favicon") && event.payload.at("favicon").is_string()) {
        site.favicon = event.payload.at("favicon").get<std::string>();
      }
    }
    sites_.emplace(event.origin, std::move(site));
  } else {
    it->second.capabilities.insert(to_store.begin(), to_store.end());
    it->second.last_accessed_at = now;
    if (it->second.address.empty()) {
      it->second.address = event.address;
    }
  }
  *applied = true;
  PersistOrLogLocked();
}

bool PermissionBroker::Resolve(const std::string& request_id, bool granted) {
  ApprovalOutcome outcome{};
  std::promise<ApprovalOutcome> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
      util::LogWarn("permissions", "ignoring response for unknown or resolved request " +
                                       request_id);
      return false;
    }
    ResolveLocked(it, granted, &outcome, &promise);
  }
  promise.set_value(outcome);
  util::LogInfo("permissions", "request " + request_id + " " + ApprovalOutcomeName(outcome));
  return true;
}

bool PermissionBroker::ResolveOldestForOrigin(const std::string& origin, bool granted) {
  std::string request_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = NormalizeOrigin(origin);
    std::uint64_t best = 0;
    for (const auto& [id, entry] : pending_) {
      if (entry.event.origin == key && (best == 0 || entry.sequence < best)) {
        best = entry.sequence;
        request_id = id;
      }
    }
  }
  if (request_id.empty()) {
    util::LogWarn("permissions", "no pending request for " + origin);
    return false;
  }
  return Resolve(request_id, granted);
}

void PermissionBroker::OnTimeout(const std::string& request_id) {
  std::promise<ApprovalOutcome> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
      return;
    }
    promise = std::move(it->second.promise);
    pending_.erase(it);
  }
  promise.set_value(ApprovalOutcome::kTimedOut);
  util::LogInfo("permissions", "request " + request_id + " timed out");
}

bool PermissionBroker::Disconnect(const std::string& origin) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sites_.erase(NormalizeOrigin(origin)) == 0) {
    return false;
  }
  PersistLocked();
  util::LogInfo("permissions", "disconnected " + origin);
  return true;
}

std::size_t PermissionBroker::DisconnectAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto count = sites_.size();
  sites_.clear();
  PersistLocked();
  return count;
}

bool PermissionBroker::RevokeCapability(const std::string& origin, Capability capability) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sites_.find(NormalizeOrigin(origin));
  if (it == sites_.end() || it->second.capabilities.erase(capability) == 0) {
    return false;
  }
  if (it->second.capabilities.empty()) {
    sites_.erase(it);
  }
  PersistLocked();
  return true;
}

void PermissionBroker::Touch(const std::string& origin) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sites_.find(NormalizeOrigin(origin));
  if (it == sites_.end()) {
    return;
  }
  it->second.last_accessed_at = now_();
  PersistOrLogLocked();
}

std::optional<SitePermission> PermissionBroker::GetSite(const std::string& origin) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sites_.find(NormalizeOrigin(origin));
  if (it == sites_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<SitePermission> PermissionBroker::ListSites() const {
  std::vector<SitePermission> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(sites_.size());
    for (const auto& [origin, site] : sites_) {
      out.push_back(site);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const SitePermission& a, const SitePermission& b) {
    return a.last_accessed_at > b.last_accessed_at;
  });
  return out;
}

std::vector<ApprovalRequestEvent> PermissionBroker::PendingRequests(
    const std::optional<std::string>& origin) const {
  std::vector<std::pair<std::uint64_t, ApprovalRequestEvent>> ordered;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = origin ? std::optional<std::string>(NormalizeOrigin(*origin)) : std::nullopt;
    for (const auto& [id, entry] : pending_) {
      if (!key || entry.event.origin == *key) {
        ordered.emplace_back(entry.sequence, entry.event);
      }
    }
  }
  std::sort(ordered.begin(), ordered.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  std::vector<ApprovalRequestEvent> out;
  out.reserve(ordered.size());
  for (auto& item : ordered) {
    out.push_back(std::move(item.second));
  }
  return out;
}

std::size_t PermissionBroker::CleanupExpired(std::chrono::milliseconds max_age) {
  if (max_age.count() <= 0) {
    throw util::ValidationError("cleanup age must be positive");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto cutoff = now_() - max_age.count();
  std::size_t removed = 0;
  for (auto it = sites_.begin(); it != sites_.end();) {
    if (it->second.last_accessed_at < cutoff) {
      it = sites_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    PersistLocked();
    util::LogInfo("permissions", "removed " + std::to_string(removed) + " expired sites");
  }
  return removed;
}

std::string PermissionBroker::ExportJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json json{
      {"globalSettings", SettingsToJson(settings_)},
      {"exportedAt", now_()},
  };
  json["sites"] = nlohmann::json::array();
  for (const auto& [origin, site] : sites_) {
    json["sites"].push_back(SiteToJson(site));
  }
  return json.dump(2);
}

std::size_t PermissionBroker::ImportJson(std::string_view text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw util::ValidationError(std::string("invalid permissions export: ") + ex.what());
  }
  if (!json.is_object() || !json.contains("sites") || !json.at("sites").is_array()) {
    throw util::ValidationError("invalid permissions export: missing sites array");
  }
  std::vector<SitePermission> imported;
  for (const auto& item : json.at("sites")) {
    SitePermission site;
    std::string error;
    if (!SiteFromJson(item, &site, &error) || site.capabilities.empty()) {
      continue;
    }
    site.origin = NormalizeOrigin(site.origin);
    imported.push_back(std::move(site));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto settings = settings_;
  std::string error;
  if (json.contains("globalSettings") &&
      !SettingsFromJson(json.at("globalSettings"), &settings, &error)) {
    throw util::ValidationError("invalid permissions export: " + error);
  }
  for (auto& site : imported) {
    sites_[site.origin] = std::move(site);
  }
  settings_ = settings;
  PersistLocked();
  util::LogInfo("permissions", "imported " + std::to_string(imported.size()) + " sites");
  return imported.size();
}

PermissionSettings PermissionBroker::GetSettings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

void PermissionBroker::UpdateSettings(const PermissionSettings& settings) {
  if (settings.max_connected_sites == 0) {
    throw util::ValidationError("maxConnectedSites must be at least 1");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  settings_ = settings;
  PersistLocked();
}

void PermissionBroker::Shutdown() {
  std::vector<std::promise<ApprovalOutcome>> promises;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    channel_ = nullptr;
    for (auto& [id, entry] : pending_) {
      if (entry.timeout_task) {
        scheduler_.Cancel(*entry.timeout_task);
      }
      promises.push_back(std::move(entry.promise));
    }
    pending_.clear();
  }
  for (auto& promise : promises) {
    promise.set_value(ApprovalOutcome::kRejected);
  }
  if (!promises.empty()) {
    util::LogInfo("permissions",
                  "rejected " + std::to_string(promises.size()) + " pending requests at shutdown");
  }
}

void PermissionBroker::PersistLocked() const { store_.Save(sites_, settings_); }

void PermissionBroker::PersistOrLogLocked() const {
  try {
    PersistLocked();
  } catch (const util::StorageError& ex) {
    util::LogError("permissions", ex.what());
  }
}

}  // namespace dappvault::permissions
