#include "node/app_context.hpp"

#include <chrono>
#include <filesystem>
#include <utility>

#include "util/logging.hpp"

namespace dappvault::node {

namespace {

wallet::SessionOptions SessionOptionsFor(const config::AppConfig& config) {
  wallet::SessionOptions options;
  options.auto_lock_after = std::chrono::minutes(config.auto_lock_minutes);
  options.kdf.t_cost = config.kdf_t_cost;
  options.kdf.m_cost_kib = config.kdf_m_cost_kib;
  options.kdf.parallelism = config.kdf_parallelism;
  return options;
}

permissions::BrokerOptions BrokerOptionsFor(const config::AppConfig& config) {
  permissions::BrokerOptions options;
  options.approval_timeout = std::chrono::seconds(config.approval_timeout_seconds);
  return options;
}

ledger::LedgerOptions LedgerOptionsFor(const config::AppConfig& config) {
  ledger::LedgerOptions options;
  options.reconcile_interval = std::chrono::seconds(config.reconcile_interval_seconds);
  options.not_found_grace = std::chrono::seconds(config.not_found_grace_seconds);
  options.testnet_explorer = config::ConfigFor(config::NetworkType::kTestnet).explorer_url;
  options.mainnet_explorer = config::ConfigFor(config::NetworkType::kMainnet).explorer_url;
  return options;
}

}  // namespace

AppContext::AppContext(const config::AppConfig& config,
                       std::unique_ptr<gateway::BlockchainGateway> gateway, util::NowFn now)
    : config_(config),
      gateway_(std::move(gateway)),
      wallet_store_(config::WalletPath(config_)),
      wallet_(wallet_store_, *gateway_, scheduler_, SessionOptionsFor(config_), now),
      permission_store_(config::PermissionsPath(config_)),
      broker_(permission_store_, scheduler_, BrokerOptionsFor(config_), now),
      tx_store_(config::TransactionsPath(config_)),
      ledger_(tx_store_, *gateway_, scheduler_, LedgerOptionsFor(config_), now),
      bridge_(wallet_, broker_, ledger_, *gateway_,
              std::string(config::NetworkName(config::SelectedNetwork(config_)))) {}

AppContext::~AppContext() { Shutdown(); }

void AppContext::Start() {
  const bool fresh_permissions = !std::filesystem::exists(permission_store_.path());
  broker_.Load();
  if (fresh_permissions) {
    auto settings = broker_.GetSettings();
    settings.max_connected_sites = config_.max_connected_sites;
    broker_.UpdateSettings(settings);
  }
  ledger_.Load();
  ledger_.SetOwner({}, bridge_.GetNetwork());
  ledger_.StartReconciliation();
  util::LogInfo("node", "services started (network " + bridge_.GetNetwork() + ", data " +
                            config_.data_dir + ")");
}

void AppContext::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  broker_.Shutdown();
  ledger_.StopReconciliation();
  scheduler_.Stop();
  wallet_.Lock();
  util::LogInfo("node", "services stopped");
}

void AppContext::SyncLedgerOwner() {
  const auto state = wallet_.GetState();
  if (state.address) {
    ledger_.SetOwner(*state.address, bridge_.GetNetwork());
  }
}

}  // namespace dappvault::node
