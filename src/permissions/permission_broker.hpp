#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"
#include "permissions/capability.hpp"
#include "permissions/permission_store.hpp"
#include "util/scheduler.hpp"
#include "util/time.hpp"

namespace dappvault::permissions {

enum class ApprovalOutcome { kApproved, kRejected, kTimedOut };

const char* ApprovalOutcomeName(ApprovalOutcome outcome);

struct ApprovalRequestEvent {
  std::string request_id;
  std::string origin;
  std::string kind;
  CapabilitySet capabilities;
  std::string address;
  nlohmann::json payload;
  std::int64_t requested_at{0};
};

nlohmann::json ApprovalRequestToJson(const ApprovalRequestEvent& event);

// UI side of an approval negotiation. Called without any broker lock held;
// the answer comes back later through PermissionBroker::Resolve().
class ApprovalChannel {
 public:
  virtual ~ApprovalChannel() = default;
  virtual void OnApprovalRequested(const ApprovalRequestEvent& event) = 0;
};

// Handle returned to the suspended caller. Copyable; every copy observes the
// same single outcome.
class ApprovalTicket {
 public:
  ApprovalTicket(std::string request_id, std::shared_future<ApprovalOutcome> outcome);

  // Empty when the request was satisfied by existing grants.
  const std::string& request_id() const noexcept { return request_id_; }
  bool ready() const;
  ApprovalOutcome Get() const;

  // Blocks until resolved. Returns on approval; throws
  // util::PermissionDeniedError on rejection and util::TimeoutError when the
  // approval window elapsed.
  void Wait() const;

 private:
  std::string request_id_;
  std::shared_future<ApprovalOutcome> outcome_;
};

struct BrokerOptions {
  std::chrono::milliseconds approval_timeout{std::chrono::minutes(5)};
};

// Per-origin capability grants plus the set of in-flight approval requests.
//
// A pending request is a promise keyed by id. Resolve(), the timeout task and
// Shutdown() race to erase the entry; whichever erases it completes the
// promise, so each request resolves exactly once. Requests for the same or
// different origins are independent.
class PermissionBroker {
 public:
  PermissionBroker(PermissionStore& store, util::Scheduler& scheduler, BrokerOptions options = {},
                   util::NowFn now = util::UnixTimeMillis);
  ~PermissionBroker();

  PermissionBroker(const PermissionBroker&) = delete;
  PermissionBroker& operator=(const PermissionBroker&) = delete;

  // Reads persisted grants. A corrupt file is logged and treated as empty.
  void Load();

  // Not owned; must outlive the broker or be reset to nullptr first.
  void SetApprovalChannel(ApprovalChannel* channel);

  bool IsConnected(const std::string& origin) const;
  bool HasCapability(const std::string& origin, Capability capability) const;

  ApprovalTicket RequestCapability(const std::string& origin, const CapabilitySet& capabilities,
                                   const std::string& address, const std::string& kind,
                                   nlohmann::json payload = nlohmann::json::object());

  // Unknown or already-resolved ids log a warning and return false.
  bool Resolve(const std::string& request_id, bool granted);
  // FIFO: resolves the oldest pending request of `origin`.
  bool ResolveOldestForOrigin(const std::string& origin, bool granted);

  bool Disconnect(const std::string& origin);
  std::size_t DisconnectAll();
  // Deletes the site when its last capability is revoked.
  bool RevokeCapability(const std::string& origin, Capability capability);
  void Touch(const std::string& origin);

  std::optional<SitePermission> GetSite(const std::string& origin) const;
  // Most recently accessed first.
  std::vector<SitePermission> ListSites() const;
  std::vector<ApprovalRequestEvent> PendingRequests(
      const std::optional<std::string>& origin = std::nullopt) const;

  std::size_t CleanupExpired(std::chrono::milliseconds max_age = std::chrono::hours(24 * 30));

  std::string ExportJson() const;
  // Merges by origin; entries with no capabilities are skipped. Returns the
  // number of sites written. Throws util::ValidationError on malformed input.
  std::size_t ImportJson(std::string_view text);

  PermissionSettings GetSettings() const;
  void UpdateSettings(const PermissionSettings& settings);

  // Rejects every in-flight request and refuses new ones. Idempotent.
  void Shutdown();

 private:
  struct Pending {
    ApprovalRequestEvent event;
    std::uint64_t sequence{0};
    std::promise<ApprovalOutcome> promise;
    std::optional<util::Scheduler::TaskId> timeout_task;
  };

  using PendingMap = std::map<std::string, Pending>;

  void OnTimeout(const std::string& request_id);
  void ResolveLocked(PendingMap::iterator it, bool granted, ApprovalOutcome* outcome,
                     std::promise<ApprovalOutcome>* promise);
  void ApplyGrantLocked(const ApprovalRequestEvent& event, bool* applied);
  void PersistLocked() const;
  void PersistOrLogLocked() const;

  PermissionStore& store_;
  util::Scheduler& scheduler_;
  BrokerOptions options_;
  util::NowFn now_;

  mutable std::mutex mutex_;
  SiteMap sites_;
  PermissionSettings settings_;
  PendingMap pending_;
  std::uint64_t next_sequence_{1};
  ApprovalChannel* channel_{nullptr};
  bool shut_down_{false};
};

}  // namespace dappvault::permissions
