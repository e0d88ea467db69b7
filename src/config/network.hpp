#pragma once

#include <string>
#include <string_view>

namespace dappvault::config {

enum class NetworkType {
  kTestnet,
  kMainnet,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kTestnet};
  std::string network_id{"testnet"};
  // Transaction links are <explorer_url>/<txId>.
  std::string explorer_url;
};

const NetworkConfig& ConfigFor(NetworkType type);
// Accepts "testnet"/"test" and "mainnet"/"main". Returns false otherwise.
bool ParseNetwork(std::string_view name, NetworkType* out);
std::string_view NetworkName(NetworkType type);

}  // namespace dappvault::config
