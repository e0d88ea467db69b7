#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/secret_cipher.hpp"
#include "gateway/blockchain_gateway.hpp"
#include "util/scheduler.hpp"
#include "util/secure_wipe.hpp"
#include "util/time.hpp"
#include "wallet/wallet_record.hpp"

namespace dappvault::wallet {

constexpr std::size_t kMinPasswordLength = 8;

enum class LockReason { kExplicit, kAutoLock, kDeleted };

const char* LockReasonName(LockReason reason);

struct WalletState {
  bool has_wallet{false};
  bool unlocked{false};
  std::optional<std::string> address;
  std::optional<std::int64_t> unlocked_at;
  std::optional<std::int64_t> auto_lock_deadline;
};

struct CreateResult {
  std::string address;
  // Returned once; never persisted.
  std::optional<util::SecretBuffer> recovery_phrase;
};

// Borrowed views into the unlocked key bundle. Valid only for the duration of
// the WithSecrets callback.
struct SecretView {
  std::string_view address;
  std::string_view private_key;
  std::string_view view_key;
};

struct SessionOptions {
  std::chrono::milliseconds auto_lock_after{std::chrono::minutes(15)};
  util::Argon2idParams kdf{util::DefaultArgon2idParams()};
};

// Owns the wallet session state machine:
//
//   Locked --create/import/unlock--> Unlocked --lock/auto-lock/delete--> Locked
//
// Secret material exists only while unlocked and is overwritten in place before
// it is released. Every authenticated operation rearms a single inactivity
// timer on the shared scheduler; when it fires the session locks.
//
// All public entry points are serialised on one mutex. Gateway calls run
// outside it on copies of the key material, so a slow chain client never
// holds up locking, state queries or the auto-lock timer.
class WalletSessionManager {
 public:
  using LockObserver = std::function<void(LockReason)>;

  WalletSessionManager(WalletRecordStore& store, gateway::BlockchainGateway& gateway,
                       util::Scheduler& scheduler, SessionOptions options = {},
                       util::NowFn now = util::UnixTimeMillis);
  ~WalletSessionManager();

  WalletSessionManager(const WalletSessionManager&) = delete;
  WalletSessionManager& operator=(const WalletSessionManager&) = delete;

  CreateResult Create(std::string_view password);
  std::string ImportFromKey(std::string_view private_key, std::string_view password);
  std::string ImportFromSeed(std::string_view phrase, std::string_view password);
  void Unlock(std::string_view password);
  void Lock();
  void DeleteWallet();

  bool HasWallet() const;
  bool IsUnlocked() const;
  WalletState GetState() const;

  // Authenticated operations: throw util::WalletLockedError while locked,
  // otherwise reset the auto-lock deadline.
  std::string GetAddress();
  util::SecretBuffer ExportPrivateKey();
  util::SecretBuffer ExportViewKey();
  std::string SignMessage(std::string_view message);
  // Checks against `address`, or the unlocked wallet's own address when absent.
  bool VerifySignature(std::string_view message, std::string_view signature,
                       const std::optional<std::string>& address = std::nullopt);
  std::string Send(const std::string& to, std::int64_t amount, std::int64_t fee);
  std::string ExecuteProgram(const std::string& program_id, const std::string& function_name,
                             const std::vector<std::string>& inputs, std::int64_t fee);
  std::string DecryptRecord(std::string_view ciphertext);
  nlohmann::json ListRecords(const std::optional<std::string>& program_id);
  // A gateway NetworkError degrades to a zero balance.
  gateway::Balance GetBalance();

  template <typename Fn>
  auto WithSecrets(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& secrets = RequireUnlockedLocked();
    const SecretView view{secrets.address, secrets.private_key.view(), secrets.view_key.view()};
    return fn(view);
  }

  void SetAutoLockTimeout(std::chrono::milliseconds timeout);
  std::chrono::milliseconds AutoLockTimeout() const;
  void SetLockObserver(LockObserver observer);

 private:
  friend class WalletSessionManagerTestHelper;

  struct Secrets {
    std::string address;
    util::SecretBuffer private_key;
    util::SecretBuffer view_key;
  };

  enum class KeyKind { kNone, kPrivate, kView };
  // Owned copies taken under the lock so gateway calls run without it. The
  // key buffer wipes itself when the copy goes out of scope.
  struct KeyCopy {
    std::string address;
    util::SecretBuffer key;
  };
  KeyCopy CopyKey(KeyKind kind);

  void EnsureCanCreateLocked(std::string_view password) const;
  std::string PersistAndUnlockLocked(std::string_view password, std::string address,
                                     util::SecretBuffer private_key, util::SecretBuffer view_key);
  void InstallSecretsLocked(std::unique_ptr<Secrets> secrets);
  // Returns true if a session was actually wiped.
  bool LockLocked();
  const Secrets& RequireUnlockedLocked();
  void ArmAutoLockLocked();
  void CancelAutoLockLocked();
  void OnAutoLockTimer(std::uint64_t generation);
  void NotifyLocked(LockReason reason);

  WalletRecordStore& store_;
  gateway::BlockchainGateway& gateway_;
  util::Scheduler& scheduler_;
  crypto::SecretCipher cipher_;
  util::NowFn now_;

  mutable std::mutex mutex_;
  std::unique_ptr<Secrets> secrets_;
  std::optional<std::int64_t> unlocked_at_;
  std::optional<std::int64_t> auto_lock_deadline_;
  std::chrono::milliseconds auto_lock_after_;
  std::optional<util::Scheduler::TaskId> auto_lock_task_;
  std::uint64_t auto_lock_generation_{0};
  LockObserver lock_observer_;
  // Test hook: observes the wiped secrets right before they are freed.
  std::function<void(const Secrets&)> wipe_probe_;
};

}  // namespace dappvault::wallet
