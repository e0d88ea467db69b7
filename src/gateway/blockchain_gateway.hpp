#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"
#include "util/secure_wipe.hpp"

namespace dappvault::gateway {

struct KeyMaterial {
  std::string address;
  util::SecretBuffer private_key;
  util::SecretBuffer view_key;
  // Present when the client generated or was given a recovery phrase.
  std::optional<util::SecretBuffer> seed_phrase;
};

struct ImportedKey {
  std::string address;
  util::SecretBuffer view_key;
};

struct TransactionStatus {
  bool found{false};
  std::string status;
  std::optional<std::uint64_t> block_height;
  std::optional<std::uint64_t> confirmations;
  std::optional<std::int64_t> fee;  // microcredits
};

struct Balance {
  std::int64_t public_balance{0};   // microcredits
  std::int64_t private_balance{0};  // microcredits
};

// Contract expected from the external chain client. Key derivation, signing,
// proving and submission all live behind it.
//
// Transport failures throw util::NetworkError. A request the client rejects
// throws util::ValidationError carrying the client's message.
class BlockchainGateway {
 public:
  virtual ~BlockchainGateway() = default;

  virtual KeyMaterial GenerateKeyMaterial() = 0;
  virtual KeyMaterial KeyMaterialFromSeed(std::string_view phrase) = 0;
  virtual ImportedKey ImportKeyMaterial(std::string_view private_key) = 0;

  virtual std::string SubmitTransfer(std::string_view private_key, const std::string& to,
                                     std::int64_t amount, std::int64_t fee) = 0;
  virtual std::string SubmitProgramExecution(std::string_view private_key,
                                             const std::string& program_id,
                                             const std::string& function_name,
                                             const std::vector<std::string>& inputs,
                                             std::int64_t fee) = 0;

  virtual TransactionStatus GetTransactionStatus(const std::string& tx_id) = 0;
  virtual Balance GetBalance(const std::string& address) = 0;
  virtual std::uint64_t GetLatestBlockHeight() = 0;

  virtual std::string SignMessage(std::string_view private_key, std::string_view message) = 0;
  virtual bool VerifySignature(const std::string& address, std::string_view message,
                               std::string_view signature) = 0;
  virtual std::string DecryptRecord(std::string_view view_key, std::string_view ciphertext) = 0;
  // Returns a JSON array of record objects as the client reports them.
  virtual nlohmann::json ListRecords(std::string_view view_key,
                                     const std::optional<std::string>& program_id) = 0;
};

}  // namespace dappvault::gateway
