#include "wallet/wallet_record.hpp"

#include <system_error>

#include "util/atomic_file.hpp"
#include "util/errors.hpp"
#include "util/hex.hpp"

namespace dappvault::wallet {

namespace {

bool ReadHexField(const nlohmann::json& json, const char* key, std::size_t expected_size,
                  std::vector<std::uint8_t>* out, std::string* error) {
  if (!json.contains(key) || !json.at(key).is_string() ||
      !util::HexDecode(json.at(key).get<std::string>(), out)) {
    if (error) {
      *error = std::string("wallet record field '") + key + "' is missing or not hex";
    }
    return false;
  }
  if (expected_size != 0 && out->size() != expected_size) {
    if (error) {
      *error = std::string("wallet record field '") + key + "' has the wrong length";
    }
    return false;
  }
  return true;
}

}  // namespace

nlohmann::json WalletRecordToJson(const EncryptedWalletRecord& record) {
  return nlohmann::json{
      {"version", record.version},
      {"ciphertext", util::HexEncode(record.sealed.ciphertext)},
      {"iv", util::HexEncode(record.sealed.iv)},
      {"authTag", util::HexEncode(record.sealed.auth_tag)},
      {"salt", util::HexEncode(record.sealed.salt)},
      {"passwordHash", util::HexEncode(record.password_hash)},
      {"kdf",
       {{"tCost", record.kdf.t_cost},
        {"mCostKib", record.kdf.m_cost_kib},
        {"parallelism", record.kdf.parallelism}}},
      {"createdAt", record.created_at},
      {"lastAccessedAt", record.last_accessed_at},
  };
}

bool WalletRecordFromJson(const nlohmann::json& json, EncryptedWalletRecord* record,
                          std::string* error) {
  if (!json.is_object()) {
    if (error) *error = "wallet record is not a JSON object";
    return false;
  }
  EncryptedWalletRecord parsed;
  try {
    parsed.version = json.value("version", 0);
    if (parsed.version != kWalletRecordVersion) {
      if (error) *error = "unsupported wallet record version " + std::to_string(parsed.version);
      return false;
    }
    if (!ReadHexField(json, "ciphertext", 0, &parsed.sealed.ciphertext, error) ||
        !ReadHexField(json, "iv", crypto::kSealIvSize, &parsed.sealed.iv, error) ||
        !ReadHexField(json, "authTag", crypto::kSealTagSize, &parsed.sealed.auth_tag, error) ||
        !ReadHexField(json, "salt", crypto::kSealSaltSize, &parsed.sealed.salt, error) ||
        !ReadHexField(json, "passwordHash", 32, &parsed.password_hash, error)) {
      return false;
    }
    const auto& kdf = json.at("kdf");
    parsed.kdf.t_cost = kdf.at("tCost").get<std::uint32_t>();
    parsed.kdf.m_cost_kib = kdf.at("mCostKib").get<std::uint32_t>();
    parsed.kdf.parallelism = kdf.at("parallelism").get<std::uint32_t>();
    if (!util::ValidateArgon2idParams(parsed.kdf, error)) {
      return false;
    }
    parsed.created_at = json.at("createdAt").get<std::int64_t>();
    parsed.last_accessed_at = json.value("lastAccessedAt", parsed.created_at);
  } catch (const nlohmann::json::exception& ex) {
    if (error) *error = std::string("malformed wallet record: ") + ex.what();
    return false;
  }
  *record = std::move(parsed);
  return true;
}

WalletRecordStore::WalletRecordStore(std::filesystem::path path) : path_(std::move(path)) {}

bool WalletRecordStore::Exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

EncryptedWalletRecord WalletRecordStore::Load() const {
  std::string text;
  std::string error;
  if (!util::ReadFileText(path_, &text, &error)) {
    throw util::StorageError(error);
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw util::StorageError(std::string("wallet file is not valid JSON: ") + ex.what());
  }
  EncryptedWalletRecord record;
  if (!WalletRecordFromJson(json, &record, &error)) {
    throw util::StorageError(error);
  }
  return record;
}

void WalletRecordStore::Save(const EncryptedWalletRecord& record) {
  std::string error;
  if (!util::AtomicWriteFileText(path_, WalletRecordToJson(record).dump(2), &error,
                                 /*owner_only=*/true)) {
    throw util::StorageError("failed to write " + path_.string() + ": " + error);
  }
}

void WalletRecordStore::Remove() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    throw util::StorageError("failed to remove " + path_.string() + ": " + ec.message());
  }
}

}  // namespace dappvault::wallet
