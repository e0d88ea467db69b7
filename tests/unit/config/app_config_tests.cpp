#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../support/temp_dir.hpp"
#include "config/app_config.hpp"
#include "config/network.hpp"

using dappvault::config::AppConfig;
using dappvault::config::ParseAppConfig;

namespace {

bool ExpectFailure(const std::vector<std::string>& args, const std::string& needle) {
  try {
    (void)ParseAppConfig(args);
  } catch (const std::runtime_error& ex) {
    if (std::string(ex.what()).find(needle) == std::string::npos) {
      std::cerr << "app_config_tests: error \"" << ex.what() << "\" lacks \"" << needle << "\"\n";
      return false;
    }
    return true;
  }
  std::cerr << "app_config_tests: expected failure containing \"" << needle << "\"\n";
  return false;
}

bool TestDefaultsAndFlags(const std::string& data_dir) {
  const auto defaults = ParseAppConfig({"--no-conf", "--data-dir", data_dir});
  if (defaults.network != "testnet" || defaults.auto_lock_minutes != 15 ||
      defaults.approval_timeout_seconds != 300 || defaults.reconcile_interval_seconds != 30 ||
      defaults.rpc_port != 3030 || defaults.max_connected_sites != 50 ||
      defaults.data_dir != data_dir) {
    std::cerr << "app_config_tests: unexpected defaults\n";
    return false;
  }
  if (dappvault::config::WalletPath(defaults) !=
          std::filesystem::path(data_dir) / "wallet.json" ||
      dappvault::config::TransactionsPath(defaults).filename() != "transactions.json" ||
      dappvault::config::PermissionsPath(defaults).filename() != "permissions.json") {
    std::cerr << "app_config_tests: state file paths wrong\n";
    return false;
  }

  const auto cfg = ParseAppConfig({"--no-conf", "--data-dir=" + data_dir, "--network=main",
                                   "--rpc-port", "8080", "--auto-lock-minutes", "30",
                                   "--log-level", "WARN", "--print-to-console", "0"});
  if (cfg.network != "main" || cfg.rpc_port != 8080 || cfg.auto_lock_minutes != 30 ||
      cfg.print_to_console ||
      dappvault::config::SelectedNetwork(cfg) != dappvault::config::NetworkType::kMainnet) {
    std::cerr << "app_config_tests: flags not applied\n";
    return false;
  }

  const auto help = ParseAppConfig({"--bogus", "--help"});
  if (!help.show_help) {
    std::cerr << "app_config_tests: --help must short-circuit parsing\n";
    return false;
  }
  return true;
}

bool TestRejections(const std::string& data_dir) {
  const std::vector<std::string> base = {"--no-conf", "--data-dir", data_dir};
  auto with = [&](std::vector<std::string> extra) {
    auto args = base;
    args.insert(args.end(), extra.begin(), extra.end());
    return args;
  };
  return ExpectFailure(with({"--frobnicate", "1"}), "unknown option") &&
         ExpectFailure(with({"stray"}), "unexpected argument") &&
         ExpectFailure(with({"--rpc-port"}), "missing value") &&
         ExpectFailure(with({"--rpc-port", "70000"}), "1-65535") &&
         ExpectFailure(with({"--auto-lock-minutes", "0"}), "between 1 and 120") &&
         ExpectFailure(with({"--auto-lock-minutes", "121"}), "between 1 and 120") &&
         ExpectFailure(with({"--auto-lock-minutes", "-5"}), "non-negative") &&
         ExpectFailure(with({"--approval-timeout-seconds", "10s"}), "trailing") &&
         ExpectFailure(with({"--network", "devnet"}), "invalid network") &&
         ExpectFailure(with({"--rpc-user", "alice"}), "rpc-pass") &&
         ExpectFailure(with({"--log-level", "loud"}), "") &&
         ExpectFailure(with({"--kdf-m-cost-kib", "4"}), "m_cost");
}

bool TestConfigFileAndEnvironment(const dappvault::test::ScopedTempDir& dir) {
  const auto conf = dir.path() / "dappvault.conf";
  {
    std::ofstream out(conf);
    out << "# dappvault settings\n"
        << "network=mainnet\n"
        << "rpc_port = 4040\n"
        << "Auto-Lock-Minutes 45   # trailing comment\n"
        << "rpc-host=10.0.0.1\n"
        << "some-future-key=1\n";
  }
  const std::string data_dir = (dir.path() / "data").string();
  const auto from_file = ParseAppConfig({"--conf", conf.string(), "--data-dir", data_dir});
  if (from_file.network != "mainnet" || from_file.rpc_port != 4040 ||
      from_file.auto_lock_minutes != 45 || from_file.rpc_host != "10.0.0.1") {
    std::cerr << "app_config_tests: config file not applied\n";
    return false;
  }

#ifndef _WIN32
  ::setenv("DAPPVAULT_RPC_HOST", "10.0.0.2", 1);
  ::setenv("DAPPVAULT_TEST_RPC_SECRET", "s3cret", 1);
  const auto layered = ParseAppConfig({"--conf", conf.string(), "--data-dir", data_dir,
                                       "--rpc-port", "5050", "--rpc-user", "alice",
                                       "--rpc-pass-env", "DAPPVAULT_TEST_RPC_SECRET"});
  ::unsetenv("DAPPVAULT_RPC_HOST");
  ::unsetenv("DAPPVAULT_TEST_RPC_SECRET");
  if (layered.rpc_host != "10.0.0.2" || layered.rpc_port != 5050 ||
      layered.rpc_pass != "s3cret") {
    std::cerr << "app_config_tests: precedence should be file < env < flags\n";
    return false;
  }

  ::setenv("DAPPVAULT_RPC_PORT", "zero", 1);
  const bool env_error = ExpectFailure({"--no-conf", "--data-dir", data_dir}, "DAPPVAULT_RPC_PORT");
  ::unsetenv("DAPPVAULT_RPC_PORT");
  if (!env_error) {
    return false;
  }
#endif

  {
    std::ofstream out(conf, std::ios::trunc);
    out << "network=testnet\n"
        << "rpc-timeout-ms=abc\n";
  }
  return ExpectFailure({"--conf", conf.string(), "--data-dir", data_dir}, ":2:");
}

bool TestNetworks() {
  dappvault::config::NetworkType type{};
  if (!dappvault::config::ParseNetwork("test", &type) ||
      type != dappvault::config::NetworkType::kTestnet ||
      !dappvault::config::ParseNetwork("mainnet", &type) ||
      type != dappvault::config::NetworkType::kMainnet ||
      dappvault::config::ParseNetwork("canary", &type)) {
    std::cerr << "app_config_tests: network parsing wrong\n";
    return false;
  }
  if (dappvault::config::NetworkName(dappvault::config::NetworkType::kMainnet) != "mainnet" ||
      dappvault::config::ConfigFor(dappvault::config::NetworkType::kTestnet).explorer_url.empty()) {
    std::cerr << "app_config_tests: network table wrong\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    dappvault::test::ScopedTempDir dir("app_config");
    const std::string data_dir = (dir.path() / "data").string();
    if (!TestDefaultsAndFlags(data_dir)) {
      return EXIT_FAILURE;
    }
    if (!TestRejections(data_dir)) {
      return EXIT_FAILURE;
    }
    if (!TestConfigFileAndEnvironment(dir)) {
      return EXIT_FAILURE;
    }
    if (!TestNetworks()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "app_config_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
