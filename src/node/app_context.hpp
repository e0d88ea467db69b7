#pragma once

#include <memory>
#include <string>

#include "config/app_config.hpp"
#include "gateway/blockchain_gateway.hpp"
#include "ledger/transaction_ledger.hpp"
#include "ledger/transaction_store.hpp"
#include "node/dapp_bridge.hpp"
#include "permissions/permission_broker.hpp"
#include "permissions/permission_store.hpp"
#include "util/scheduler.hpp"
#include "util/time.hpp"
#include "wallet/session_manager.hpp"
#include "wallet/wallet_record.hpp"

namespace dappvault::node {

// Composition root. Builds every service once, in dependency order, over the
// data directory named by the config. The scheduler is stopped before any
// service is torn down so no timer fires into a half-destroyed object.
class AppContext {
 public:
  AppContext(const config::AppConfig& config, std::unique_ptr<gateway::BlockchainGateway> gateway,
             util::NowFn now = util::UnixTimeMillis);
  ~AppContext();

  AppContext(const AppContext&) = delete;
  AppContext& operator=(const AppContext&) = delete;

  // Loads persisted grants and history and starts reconciliation.
  void Start();
  // Rejects pending approvals, stops timers and locks the wallet. Idempotent.
  void Shutdown();

  // Points the ledger at the unlocked wallet's address.
  void SyncLedgerOwner();

  const config::AppConfig& config() const noexcept { return config_; }
  util::Scheduler& scheduler() noexcept { return scheduler_; }
  gateway::BlockchainGateway& gateway() noexcept { return *gateway_; }
  wallet::WalletSessionManager& wallet() noexcept { return wallet_; }
  permissions::PermissionBroker& permissions() noexcept { return broker_; }
  ledger::TransactionLedger& ledger() noexcept { return ledger_; }
  DappBridge& dapp() noexcept { return bridge_; }

 private:
  config::AppConfig config_;
  util::Scheduler scheduler_;
  std::unique_ptr<gateway::BlockchainGateway> gateway_;
  wallet::WalletRecordStore wallet_store_;
  wallet::WalletSessionManager wallet_;
  permissions::PermissionStore permission_store_;
  permissions::PermissionBroker broker_;
  ledger::TransactionStore tx_store_;
  ledger::TransactionLedger ledger_;
  DappBridge bridge_;
  bool shut_down_{false};
};

}  // namespace dappvault::node
