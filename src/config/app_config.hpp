#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config/network.hpp"

namespace dappvault::config {

inline constexpr std::uint32_t kMinAutoLockMinutes = 1;
inline constexpr std::uint32_t kMaxAutoLockMinutes = 120;

struct AppConfig {
  std::string network{"testnet"};
  std::string data_dir;
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};

  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  bool print_to_console{true};

  std::uint32_t auto_lock_minutes{15};
  std::uint64_t approval_timeout_seconds{300};
  std::uint64_t reconcile_interval_seconds{30};
  std::uint64_t not_found_grace_seconds{600};
  std::size_t max_connected_sites{50};

  std::uint32_t kdf_t_cost{3};
  std::uint32_t kdf_m_cost_kib{64 * 1024};
  std::uint32_t kdf_parallelism{1};

  std::string rpc_host{"127.0.0.1"};
  std::uint16_t rpc_port{3030};
  std::string rpc_user;
  std::string rpc_pass;
  std::string rpc_pass_env;
  int rpc_timeout_ms{15000};
};

std::string UsageText();

// key=value lines, '#' comments. Keys ignore case, '-' and '_'. Unknown keys
// are logged and skipped; malformed values throw std::runtime_error carrying
// the file position. A missing file is not an error.
void LoadConfigFile(const std::filesystem::path& path, AppConfig* cfg);
void ApplyConfigOption(const std::string& raw_key, const std::string& value, AppConfig* cfg);

// DAPPVAULT_* variables, applied after the config file and before flags.
void ApplyEnvironmentOverrides(AppConfig* cfg);

// Defaults, then config file, then environment, then flags. Fills in the data
// directory and validates the result. Throws std::runtime_error.
AppConfig ParseAppConfig(const std::vector<std::string>& args);
AppConfig ParseAppConfig(int argc, char** argv);

void ValidateAppConfig(const AppConfig& cfg);

NetworkType SelectedNetwork(const AppConfig& cfg);
std::filesystem::path DefaultDataDir(std::string_view network);
std::filesystem::path WalletPath(const AppConfig& cfg);
std::filesystem::path PermissionsPath(const AppConfig& cfg);
std::filesystem::path TransactionsPath(const AppConfig& cfg);

}  // namespace dappvault::config
