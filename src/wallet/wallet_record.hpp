#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "crypto/secret_cipher.hpp"
#include "nlohmann/json.hpp"
#include "util/argon2_kdf.hpp"

namespace dappvault::wallet {

constexpr int kWalletRecordVersion = 1;

// The single persisted wallet. Binary fields are lowercase hex in JSON.
struct EncryptedWalletRecord {
  int version{kWalletRecordVersion};
  crypto::SealedPayload sealed;
  std::vector<std::uint8_t> password_hash;
  util::Argon2idParams kdf{util::DefaultArgon2idParams()};
  std::int64_t created_at{0};
  std::int64_t last_accessed_at{0};
};

nlohmann::json WalletRecordToJson(const EncryptedWalletRecord& record);

// Rejects unknown versions, bad hex, wrong field sizes and Argon2 parameters
// outside the load caps.
bool WalletRecordFromJson(const nlohmann::json& json, EncryptedWalletRecord* record,
                          std::string* error);

// wallet.json on disk, written atomically with owner-only permissions.
class WalletRecordStore {
 public:
  explicit WalletRecordStore(std::filesystem::path path);

  bool Exists() const;
  // Throws util::StorageError when the file is unreadable or malformed.
  EncryptedWalletRecord Load() const;
  // Throws util::StorageError when the write fails.
  void Save(const EncryptedWalletRecord& record);
  // Throws util::StorageError when an existing file cannot be removed.
  void Remove();

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace dappvault::wallet
