#include "wallet/session_manager.hpp"

#include <stdexcept>
#include <utility>

#include "gateway/key_format.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::wallet {

namespace {

constexpr std::string_view kPayloadMagic = "dappvault-wallet-v1";

// Sealed plaintext: magic '\n' address '\n' private key '\n' view key. None
// of the fields can contain a newline.
util::SecretBuffer EncodePayload(std::string_view address, std::string_view private_key,
                                 std::string_view view_key) {
  std::string joined;
  joined.reserve(kPayloadMagic.size() + address.size() + private_key.size() + view_key.size() + 3);
  joined.append(kPayloadMagic).append("\n");
  joined.append(address).append("\n");
  joined.append(private_key).append("\n");
  joined.append(view_key);
  util::SecretBuffer out(joined);
  util::SecureWipe(joined);
  return out;
}

bool DecodePayload(std::string_view text, std::string* address, util::SecretBuffer* private_key,
                   util::SecretBuffer* view_key) {
  std::string_view parts[4];
  for (int i = 0; i < 3; ++i) {
    const auto newline = text.find('\n');
    if (newline == std::string_view::npos) {
      return false;
    }
    parts[i] = text.substr(0, newline);
    text.remove_prefix(newline + 1);
  }
  parts[3] = text;
  if (parts[0] != kPayloadMagic || parts[1].empty() || parts[2].empty() || parts[3].empty()) {
    return false;
  }
  *address = std::string(parts[1]);
  *private_key = util::SecretBuffer(parts[2]);
  *view_key = util::SecretBuffer(parts[3]);
  return true;
}

}  // namespace

const char* LockReasonName(LockReason reason) {
  switch (reason) {
    case LockReason::kExplicit:
      return "explicit";
    case LockReason::kAutoLock:
      return "auto-lock";
    case LockReason::kDeleted:
      return "deleted";
  }
  return "unknown";
}

WalletSessionManager::WalletSessionManager(WalletRecordStore& store,
                                           gateway::BlockchainGateway& gateway,
                                           util::Scheduler& scheduler, SessionOptions options,
                                           util::NowFn now)
    : store_(store),
      gateway_(gateway),
      scheduler_(scheduler),
      cipher_(options.kdf),
      now_(std::move(now)),
      auto_lock_after_(options.auto_lock_after) {
  if (auto_lock_after_.count() <= 0) {
    throw std::invalid_argument("auto-lock timeout must be positive");
  }
}

WalletSessionManager::~WalletSessionManager() {
  std::lock_guard<std::mutex> lock(mutex_);
  CancelAutoLockLocked();
  LockLocked();
}

void WalletSessionManager::EnsureCanCreateLocked(std::string_view password) const {
  if (password.size() < kMinPasswordLength) {
    throw util::ValidationError("password must be at least " +
                                std::to_string(kMinPasswordLength) + " characters");
  }
  if (store_.Exists()) {
    throw util::WalletExistsError();
  }
}

CreateResult WalletSessionManager::Create(std::string_view password) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureCanCreateLocked(password);
  auto material = gateway_.GenerateKeyMaterial();
  CreateResult result;
  result.address = PersistAndUnlockLocked(password, std::move(material.address),
                                          std::move(material.private_key),
                                          std::move(material.view_key));
  result.recovery_phrase = std::move(material.seed_phrase);
  util::LogInfo("wallet", "created wallet " + result.address);
  return result;
}

std::string WalletSessionManager::ImportFromKey(std::string_view private_key,
                                                std::string_view password) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!gateway::IsValidPrivateKey(private_key)) {
    throw util::InvalidKeyFormatError(
        "invalid private key format: must start with \"APrivateKey1\" and be 59 characters");
  }
  EnsureCanCreateLocked(password);
  auto imported = gateway_.ImportKeyMaterial(private_key);
  auto address = PersistAndUnlockLocked(password, std::move(imported.address),
                                        util::SecretBuffer(private_key),
                                        std::move(imported.view_key));
  util::LogInfo("wallet", "imported wallet " + address + " from private key");
  return address;
}

std::string WalletSessionManager::ImportFromSeed(std::string_view phrase,
                                                 std::string_view password) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!gateway::IsValidSeedPhrase(phrase)) {
    throw util::InvalidKeyFormatError(
        "invalid recovery phrase: expected 12, 15, 18, 21 or 24 lowercase words");
  }
  EnsureCanCreateLocked(password);
  auto material = gateway_.KeyMaterialFromSeed(phrase);
  auto address = PersistAndUnlockLocked(password, std::move(material.address),
                                        std::move(material.private_key),
                                        std::move(material.view_key));
  util::LogInfo("wallet", "imported wallet " + address + " from recovery phrase");
  return address;
}

std::string WalletSessionManager::PersistAndUnlockLocked(std::string_view password,
                                                         std::string address,
                                                         util::SecretBuffer private_key,
                                                         util::SecretBuffer view_key) {
  if (!gateway::IsValidPrivateKey(private_key.view())) {
    throw util::InvalidKeyFormatError("chain client returned a malformed private key");
  }
  const auto payload = EncodePayload(address, private_key.view(), view_key.view());
  EncryptedWalletRecord record;
  record.sealed = cipher_.Seal(payload.bytes(), password);
  record.password_hash = crypto::PasswordCheckHash(password, record.sealed.salt);
  record.kdf = cipher_.params();
  record.created_at = now_();
  record.last_accessed_at = record.created_at;
  store_.Save(record);

  auto secrets = std::make_unique<Secrets>();
  secrets->address = address;
  secrets->private_key = std::move(private_key);
  secrets->view_key = std::move(view_key);
  InstallSecretsLocked(std::move(secrets));
  return address;
}

void WalletSessionManager::InstallSecretsLocked(std::unique_ptr<Secrets> secrets) {
  LockLocked();
  secrets_ = std::move(secrets);
  unlocked_at_ = now_();
  ArmAutoLockLocked();
}

void WalletSessionManager::Unlock(std::string_view password) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!store_.Exists()) {
    throw util::NoWalletError();
  }
  auto record = store_.Load();
  if (!crypto::VerifyPasswordCheckHash(password, record.sealed.salt, record.password_hash)) {
    util::LogWarn("wallet", "unlock rejected: password check failed");
    throw util::InvalidPasswordError();
  }
  util::SecretBuffer plaintext;
  try {
    plaintext = crypto::SecretCipher::Open(record.sealed, password, record.kdf);
  } catch (const util::AuthenticationError& ex) {
    util::LogWarn("wallet", std::string("unlock rejected: ") + ex.what());
    throw util::InvalidPasswordError();
  }
  auto secrets = std::make_unique<Secrets>();
  if (!DecodePayload(plaintext.view(), &secrets->address, &secrets->private_key,
                     &secrets->view_key)) {
    throw util::StorageError("wallet payload is corrupt");
  }
  plaintext.Wipe();
  InstallSecretsLocked(std::move(secrets));

  record.last_accessed_at = *unlocked_at_;
  try {
    store_.Save(record);
  } catch (const util::StorageError& ex) {
    util::LogWarn("wallet", std::string("could not refresh lastAccessedAt: ") + ex.what());
  }
  util::LogInfo("wallet", "wallet unlocked");
}

void WalletSessionManager::Lock() {
  bool wiped = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wiped = LockLocked();
  }
  if (wiped) {
    util::LogInfo("wallet", "wallet locked");
    NotifyLocked(LockReason::kExplicit);
  }
}

void WalletSessionManager::DeleteWallet() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    LockLocked();
    store_.Remove();
  }
  util::LogInfo("wallet", "wallet deleted");
  NotifyLocked(LockReason::kDeleted);
}

bool WalletSessionManager::LockLocked() {
  CancelAutoLockLocked();
  auto_lock_deadline_.reset();
  unlocked_at_.reset();
  if (!secrets_) {
    return false;
  }
  secrets_->private_key.Wipe();
  secrets_->view_key.Wipe();
  util::SecureWipe(secrets_->address);
  if (wipe_probe_) {
    wipe_probe_(*secrets_);
  }
  secrets_.reset();
  return true;
}

const WalletSessionManager::Secrets& WalletSessionManager::RequireUnlockedLocked() {
  if (!secrets_) {
    throw util::WalletLockedError();
  }
  ArmAutoLockLocked();
  return *secrets_;
}

void WalletSessionManager::ArmAutoLockLocked() {
  CancelAutoLockLocked();
  const auto generation = ++auto_lock_generation_;
  auto_lock_deadline_ = now_() + auto_lock_after_.count();
  auto_lock_task_ = scheduler_.Schedule(auto_lock_after_,
                                        [this, generation] { OnAutoLockTimer(generation); });
}

void WalletSessionManager::CancelAutoLockLocked() {
  if (auto_lock_task_) {
    scheduler_.Cancel(*auto_lock_task_);
    auto_lock_task_.reset();
  }
  ++auto_lock_generation_;
}

void WalletSessionManager::OnAutoLockTimer(std::uint64_t generation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // A rearm or lock since this timer was scheduled supersedes it.
    if (generation != auto_lock_generation_) {
      return;
    }
    auto_lock_task_.reset();
    if (!LockLocked()) {
      return;
    }
  }
  util::LogInfo("wallet", "wallet auto-locked after inactivity");
  NotifyLocked(LockReason::kAutoLock);
}

void WalletSessionManager::NotifyLocked(LockReason reason) {
  LockObserver observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = lock_observer_;
  }
  if (observer) {
    observer(reason);
  }
}

bool WalletSessionManager::HasWallet() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.Exists();
}

bool WalletSessionManager::IsUnlocked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return secrets_ != nullptr;
}

WalletState WalletSessionManager::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  WalletState state;
  state.has_wallet = store_.Exists();
  state.unlocked = secrets_ != nullptr;
  if (secrets_) {
    state.address = secrets_->address;
  }
  state.unlocked_at = unlocked_at_;
  state.auto_lock_deadline = auto_lock_deadline_;
  return state;
}

std::string WalletSessionManager::GetAddress() {
  std::lock_guard<std::mutex> lock(mutex_);
  return RequireUnlockedLocked().address;
}

util::SecretBuffer WalletSessionManager::ExportPrivateKey() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& secrets = RequireUnlockedLocked();
  util::LogWarn("wallet", "private key exported");
  return util::SecretBuffer(secrets.private_key.bytes());
}

util::SecretBuffer WalletSessionManager::ExportViewKey() {
  std::lock_guard<std::mutex> lock(mutex_);
  return util::SecretBuffer(RequireUnlockedLocked().view_key.bytes());
}

WalletSessionManager::KeyCopy WalletSessionManager::CopyKey(KeyKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& secrets = RequireUnlockedLocked();
  KeyCopy copy;
  copy.address = secrets.address;
  if (kind == KeyKind::kPrivate) {
    copy.key = util::SecretBuffer(secrets.private_key.bytes());
  } else if (kind == KeyKind::kView) {
    copy.key = util::SecretBuffer(secrets.view_key.bytes());
  }
  return copy;
}

std::string WalletSessionManager::SignMessage(std::string_view message) {
  const auto copy = CopyKey(KeyKind::kPrivate);
  return gateway_.SignMessage(copy.key.view(), message);
}

bool WalletSessionManager::VerifySignature(std::string_view message, std::string_view signature,
                                           const std::optional<std::string>& address) {
  if (signature.empty()) {
    throw util::ValidationError("signature is required");
  }
  std::string signer;
  if (address) {
    if (!gateway::IsValidAddress(*address)) {
      throw util::ValidationError("invalid address");
    }
    signer = *address;
  } else {
    signer = CopyKey(KeyKind::kNone).address;
  }
  return gateway_.VerifySignature(signer, message, signature);
}

std::string WalletSessionManager::Send(const std::string& to, std::int64_t amount,
                                       std::int64_t fee) {
  if (!gateway::IsValidAddress(to)) {
    throw util::ValidationError(
        "invalid recipient address: must start with \"aleo1\" and be 63 characters");
  }
  if (amount <= 0) {
    throw util::ValidationError("amount must be positive");
  }
  if (fee < 0) {
    throw util::ValidationError("fee must not be negative");
  }
  const auto copy = CopyKey(KeyKind::kPrivate);
  const auto balance = gateway_.GetBalance(copy.address);
  if (balance.public_balance < amount || balance.public_balance - amount < fee) {
    throw util::ValidationError("insufficient balance");
  }
  auto tx_id = gateway_.SubmitTransfer(copy.key.view(), to, amount, fee);
  util::LogInfo("wallet", "submitted transfer " + tx_id);
  return tx_id;
}

std::string WalletSessionManager::ExecuteProgram(const std::string& program_id,
                                                 const std::string& function_name,
                                                 const std::vector<std::string>& inputs,
                                                 std::int64_t fee) {
  if (program_id.empty() || function_name.empty()) {
    throw util::ValidationError("program id and function name are required");
  }
  if (fee < 0) {
    throw util::ValidationError("fee must not be negative");
  }
  const auto copy = CopyKey(KeyKind::kPrivate);
  auto tx_id =
      gateway_.SubmitProgramExecution(copy.key.view(), program_id, function_name, inputs, fee);
  util::LogInfo("wallet", "submitted execution " + program_id + "/" + function_name + " " + tx_id);
  return tx_id;
}

std::string WalletSessionManager::DecryptRecord(std::string_view ciphertext) {
  const auto copy = CopyKey(KeyKind::kView);
  return gateway_.DecryptRecord(copy.key.view(), ciphertext);
}

nlohmann::json WalletSessionManager::ListRecords(const std::optional<std::string>& program_id) {
  const auto copy = CopyKey(KeyKind::kView);
  return gateway_.ListRecords(copy.key.view(), program_id);
}

gateway::Balance WalletSessionManager::GetBalance() {
  const auto address = CopyKey(KeyKind::kNone).address;
  try {
    return gateway_.GetBalance(address);
  } catch (const util::NetworkError& ex) {
    util::LogWarn("wallet", std::string("balance unavailable, reporting zero: ") + ex.what());
    return gateway::Balance{};
  }
}

void WalletSessionManager::SetAutoLockTimeout(std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    throw util::ValidationError("auto-lock timeout must be positive");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto_lock_after_ = timeout;
  if (secrets_) {
    ArmAutoLockLocked();
  }
}

std::chrono::milliseconds WalletSessionManager::AutoLockTimeout() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return auto_lock_after_;
}

void WalletSessionManager::SetLockObserver(LockObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  lock_observer_ = std::move(observer);
}

}  // namespace dappvault::wallet
