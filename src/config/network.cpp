#include "config/network.hpp"

namespace dappvault::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string explorer_url) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.explorer_url = std::move(explorer_url);
  return cfg;
}

}  // namespace

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig testnet =
      BuildConfig(NetworkType::kTestnet, "testnet", "https://explorer.aleo.org/transaction");
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", "https://explorer.aleo.org/transaction");
  switch (type) {
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kMainnet:
      return mainnet;
  }
  return testnet;
}

bool ParseNetwork(std::string_view name, NetworkType* out) {
  if (name == "testnet" || name == "test") {
    *out = NetworkType::kTestnet;
    return true;
  }
  if (name == "mainnet" || name == "main") {
    *out = NetworkType::kMainnet;
    return true;
  }
  return false;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kMainnet:
      return "mainnet";
  }
  return "testnet";
}

}  // namespace dappvault::config
