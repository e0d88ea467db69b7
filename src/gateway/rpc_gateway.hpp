#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "gateway/blockchain_gateway.hpp"

namespace dappvault::gateway {

struct RpcGatewayOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{3030};
  std::string user;
  std::string password;
  int timeout_ms{15000};
  std::size_t max_response_bytes{8 * 1024 * 1024};
};

// BlockchainGateway over JSON-RPC 2.0 / HTTP 1.1 POST. One connection per
// call, closed after the response. Amounts travel as integer microcredits.
class RpcGateway : public BlockchainGateway {
 public:
  // JSON-RPC error code the client uses for an unknown transaction id.
  static constexpr int kNotFoundCode = -32004;

  explicit RpcGateway(RpcGatewayOptions options);

  KeyMaterial GenerateKeyMaterial() override;
  KeyMaterial KeyMaterialFromSeed(std::string_view phrase) override;
  ImportedKey ImportKeyMaterial(std::string_view private_key) override;
  std::string SubmitTransfer(std::string_view private_key, const std::string& to,
                             std::int64_t amount, std::int64_t fee) override;
  std::string SubmitProgramExecution(std::string_view private_key, const std::string& program_id,
                                     const std::string& function_name,
                                     const std::vector<std::string>& inputs,
                                     std::int64_t fee) override;
  TransactionStatus GetTransactionStatus(const std::string& tx_id) override;
  Balance GetBalance(const std::string& address) override;
  std::uint64_t GetLatestBlockHeight() override;
  std::string SignMessage(std::string_view private_key, std::string_view message) override;
  bool VerifySignature(const std::string& address, std::string_view message,
                       std::string_view signature) override;
  std::string DecryptRecord(std::string_view view_key, std::string_view ciphertext) override;
  nlohmann::json ListRecords(std::string_view view_key,
                             const std::optional<std::string>& program_id) override;

 private:
  // Returns the full JSON-RPC response object. Throws util::NetworkError on
  // transport or framing failure.
  nlohmann::json Exchange(const std::string& method, nlohmann::json params);
  // Exchange() plus error mapping: a JSON-RPC error becomes
  // util::ValidationError.
  nlohmann::json Call(const std::string& method, nlohmann::json params);

  RpcGatewayOptions options_;
  std::string basic_auth_;
  std::atomic<std::uint64_t> next_id_{1};
};

// Exposed for tests: parse a raw HTTP response and return its body. Returns
// false if the header block is incomplete or malformed.
bool ExtractHttpBody(const std::string& response, std::string* body, int* status_code);

}  // namespace dappvault::gateway
