#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gateway/blockchain_gateway.hpp"
#include "ledger/transaction_ledger.hpp"
#include "nlohmann/json.hpp"
#include "permissions/permission_broker.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/session_manager.hpp"

namespace dappvault::node {

// 0.1 credits.
inline constexpr std::int64_t kDefaultDappFee = 100000;

struct DappConnectRequest {
  permissions::CapabilitySet capabilities{permissions::Capability::kConnect};
  std::optional<std::string> title;
  std::optional<std::string> favicon;
};

struct DappTransactionRequest {
  std::string program_id;
  std::string function_name;
  std::vector<std::string> inputs;
  std::int64_t fee{kDefaultDappFee};
};

// Control flow for requests coming from web content. Each call names the
// requesting origin; missing grants open an approval negotiation and the
// calling thread blocks until the user answers or the window elapses.
//
// Errors: util::NotConnectedError when the origin has no connection,
// util::WalletLockedError when the wallet is locked, util::PermissionDeniedError
// on rejection and util::TimeoutError when nobody answered.
class DappBridge {
 public:
  DappBridge(wallet::WalletSessionManager& wallet, permissions::PermissionBroker& broker,
             ledger::TransactionLedger& ledger, gateway::BlockchainGateway& gateway,
             std::string network);

  // Returns the wallet address shared with the site.
  std::string Connect(const std::string& origin, const DappConnectRequest& request = {});
  bool Disconnect(const std::string& origin);
  bool IsConnected(const std::string& origin) const;
  std::string GetAccount(const std::string& origin);
  const std::string& GetNetwork() const noexcept { return network_; }

  // Returns the chain transaction id. The submission is recorded in the ledger.
  std::string RequestTransaction(const std::string& origin, const DappTransactionRequest& request);
  std::string SignMessage(const std::string& origin, const std::string& message);
  util::SecretBuffer RequestViewKey(const std::string& origin);
  nlohmann::json RequestRecords(const std::string& origin,
                                const std::optional<std::string>& program_id);
  // Requires a standing Decrypt grant; never prompts.
  std::string Decrypt(const std::string& origin, const std::string& ciphertext);
  gateway::Balance GetBalance(const std::string& origin);
  // Transport failures degrade to {found=false, status="unknown"}.
  gateway::TransactionStatus GetTransactionStatus(const std::string& tx_id);
  // Zero when the chain client cannot be reached.
  std::uint64_t GetBlockHeight();

 private:
  void RequireConnected(const std::string& origin) const;
  void Approve(const std::string& origin, permissions::Capability capability,
               const std::string& address, const std::string& kind, nlohmann::json payload);

  wallet::WalletSessionManager& wallet_;
  permissions::PermissionBroker& broker_;
  ledger::TransactionLedger& ledger_;
  gateway::BlockchainGateway& gateway_;
  std::string network_;
};

}  // namespace dappvault::node
