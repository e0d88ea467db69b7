#include "node/dapp_bridge.hpp"

#include <utility>

#include "permissions/origin.hpp"
#include "util/amount.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::node {

using permissions::Capability;
using permissions::CapabilitySet;

DappBridge::DappBridge(wallet::WalletSessionManager& wallet,
                       permissions::PermissionBroker& broker, ledger::TransactionLedger& ledger,
                       gateway::BlockchainGateway& gateway, std::string network)
    : wallet_(wallet),
      broker_(broker),
      ledger_(ledger),
      gateway_(gateway),
      network_(std::move(network)) {}

void DappBridge::RequireConnected(const std::string& origin) const {
  if (!broker_.IsConnected(origin)) {
    throw util::NotConnectedError(permissions::NormalizeOrigin(origin));
  }
}

void DappBridge::Approve(const std::string& origin, Capability capability,
                         const std::string& address, const std::string& kind,
                         nlohmann::json payload) {
  auto ticket = broker_.RequestCapability(origin, CapabilitySet{capability}, address, kind,
                                          std::move(payload));
  ticket.Wait();
}

std::string DappBridge::Connect(const std::string& origin, const DappConnectRequest& request) {
  CapabilitySet wanted = request.capabilities;
  wanted.insert(Capability::kConnect);
  if (broker_.IsConnected(origin)) {
    auto site = broker_.GetSite(origin);
    if (site && permissions::ContainsAll(site->capabilities, wanted)) {
      broker_.Touch(origin);
      return site->address;
    }
  }
  // Throws WalletLockedError; sites only ever see an unlocked wallet's address.
  const auto address = wallet_.GetAddress();
  nlohmann::json payload = nlohmann::json::object();
  if (request.title) {
    payload["title"] = *request.title;
  }
  if (request.favicon) {
    payload["favicon"] = *request.favicon;
  }
  auto ticket = broker_.RequestCapability(origin, wanted, address, "connect", std::move(payload));
  ticket.Wait();
  util::LogInfo("dapp", "connected " + permissions::NormalizeOrigin(origin));
  return address;
}

bool DappBridge::Disconnect(const std::string& origin) { return broker_.Disconnect(origin); }

bool DappBridge::IsConnected(const std::string& origin) const {
  return broker_.IsConnected(origin);
}

std::string DappBridge::GetAccount(const std::string& origin) {
  RequireConnected(origin);
  broker_.Touch(origin);
  auto site = broker_.GetSite(origin);
  if (!site) {
    throw util::NotConnectedError(permissions::NormalizeOrigin(origin));
  }
  return site->address;
}

std::string DappBridge::RequestTransaction(const std::string& origin,
                                           const DappTransactionRequest& request) {
  RequireConnected(origin);
  if (request.program_id.empty() || request.function_name.empty()) {
    throw util::ValidationError("programId and functionName are required");
  }
  if (request.fee < 0) {
    throw util::ValidationError("fee must not be negative");
  }
  const auto address = wallet_.GetAddress();
  nlohmann::json payload{{"programId", request.program_id},
                         {"functionName", request.function_name},
                         {"inputs", request.inputs},
                         {"fee", util::FormatCredits(request.fee)}};
  Approve(origin, Capability::kTransaction, address, "transaction", std::move(payload));

  const auto tx_id = wallet_.ExecuteProgram(request.program_id, request.function_name,
                                            request.inputs, request.fee);
  try {
    ledger_.RecordExecution(tx_id, request.program_id, request.function_name, request.fee);
  } catch (const util::StorageError& ex) {
    // The transaction is already on its way; the caller still needs its id.
    util::LogError("dapp", "submitted " + tx_id + " but could not record it: " + ex.what());
  }
  return tx_id;
}

std::string DappBridge::SignMessage(const std::string& origin, const std::string& message) {
  RequireConnected(origin);
  const auto address = wallet_.GetAddress();
  Approve(origin, Capability::kSign, address, "sign", nlohmann::json{{"message", message}});
  return wallet_.SignMessage(message);
}

util::SecretBuffer DappBridge::RequestViewKey(const std::string& origin) {
  RequireConnected(origin);
  const auto address = wallet_.GetAddress();
  Approve(origin, Capability::kViewKey, address, "viewKey",
          nlohmann::json{{"warning",
                          "This will share your view key, allowing the site to view your "
                          "transaction history."}});
  return wallet_.ExportViewKey();
}

nlohmann::json DappBridge::RequestRecords(const std::string& origin,
                                          const std::optional<std::string>& program_id) {
  RequireConnected(origin);
  const auto address = wallet_.GetAddress();
  nlohmann::json payload = nlohmann::json::object();
  if (program_id) {
    payload["programId"] = *program_id;
  }
  Approve(origin, Capability::kRecords, address, "records", std::move(payload));
  return wallet_.ListRecords(program_id);
}

std::string DappBridge::Decrypt(const std::string& origin, const std::string& ciphertext) {
  if (!broker_.HasCapability(origin, Capability::kDecrypt)) {
    throw util::PermissionDeniedError("decrypt permission not granted");
  }
  broker_.Touch(origin);
  return wallet_.DecryptRecord(ciphertext);
}

gateway::Balance DappBridge::GetBalance(const std::string& origin) {
  RequireConnected(origin);
  broker_.Touch(origin);
  return wallet_.GetBalance();
}

gateway::TransactionStatus DappBridge::GetTransactionStatus(const std::string& tx_id) {
  if (tx_id.empty()) {
    throw util::ValidationError("transactionId is required");
  }
  try {
    return gateway_.GetTransactionStatus(tx_id);
  } catch (const util::NetworkError& ex) {
    util::LogWarn("dapp", "status lookup for " + tx_id + " failed: " + ex.what());
    gateway::TransactionStatus unknown;
    unknown.status = "unknown";
    return unknown;
  }
}

std::uint64_t DappBridge::GetBlockHeight() {
  try {
    return gateway_.GetLatestBlockHeight();
  } catch (const util::NetworkError& ex) {
    util::LogWarn("dapp", std::string("block height lookup failed: ") + ex.what());
    return 0;
  }
}

}  // namespace dappvault::node
