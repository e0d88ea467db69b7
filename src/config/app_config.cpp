#include "config/app_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "util/argon2_kdf.hpp"
#include "util/logging.hpp"

namespace dappvault::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::uint64_t ParseUnsigned(const std::string& name, const std::string& value) {
  if (value.empty() || value.front() == '-' || value.front() == '+') {
    throw std::runtime_error("invalid " + name + " (expected a non-negative integer)");
  }
  std::size_t consumed = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + name + " (expected a non-negative integer)");
  }
  if (consumed != value.size()) {
    throw std::runtime_error("invalid " + name + " (trailing characters)");
  }
  return static_cast<std::uint64_t>(parsed);
}

std::uint16_t ParsePort(const std::string& name, const std::string& value) {
  const auto parsed = ParseUnsigned(name, value);
  if (parsed == 0 || parsed > 65535) {
    throw std::runtime_error("invalid " + name + " (expected 1-65535)");
  }
  return static_cast<std::uint16_t>(parsed);
}

std::uint32_t ParseU32(const std::string& name, const std::string& value) {
  const auto parsed = ParseUnsigned(name, value);
  if (parsed > 0xFFFFFFFFULL) {
    throw std::runtime_error("invalid " + name + " (out of range)");
  }
  return static_cast<std::uint32_t>(parsed);
}

int ParseTimeoutMs(const std::string& name, const std::string& value) {
  const auto parsed = ParseUnsigned(name, value);
  if (parsed == 0 || parsed > 600000) {
    throw std::runtime_error("invalid " + name + " (expected 1-600000 ms)");
  }
  return static_cast<int>(parsed);
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

std::string UsageText() {
  return "Usage: dappvaultd [options]\n"
         "  --network <net>                   testnet or mainnet (default: testnet)\n"
         "  --data-dir <path>                 State directory (default: ~/.dappvault/<network>)\n"
         "  --auto-lock-minutes <n>           Lock the wallet after <n> idle minutes (1-120, default: 15)\n"
         "  --approval-timeout-seconds <sec>  Reject unanswered dApp requests after <sec> (default: 300)\n"
         "  --reconcile-interval-seconds <sec> Poll pending transactions every <sec> (default: 30)\n"
         "  --not-found-grace-seconds <sec>   Fail unknown transactions after <sec> (default: 600)\n"
         "  --max-connected-sites <n>         Initial limit on connected sites (default: 50)\n"
         "  --kdf-t-cost <n>                  Argon2id iterations for new wallets (default: 3)\n"
         "  --kdf-m-cost-kib <kib>            Argon2id memory for new wallets (default: 65536)\n"
         "  --kdf-parallelism <n>             Argon2id lanes for new wallets (default: 1)\n"
         "  --rpc-host <addr>                 Blockchain client host (default: 127.0.0.1)\n"
         "  --rpc-port <port>                 Blockchain client port (default: 3030)\n"
         "  --rpc-user <name>                 Blockchain client basic auth user\n"
         "  --rpc-pass <secret>               Blockchain client basic auth password\n"
         "  --rpc-pass-env <name>             Env var containing the client password\n"
         "  --rpc-timeout-ms <ms>             Per-call client timeout (default: 15000)\n"
         "  --debug-log <path>                Append structured logs to the given file\n"
         "  --log-level <lvl>                 debug, info, warn, error (default: info)\n"
         "  --log-max-size-mb <mb>            Rotate the debug log after <mb> megabytes (0=disable)\n"
         "  --log-max-files <n>               Rotated debug log files to keep (default: 0)\n"
         "  --print-to-console <0|1>          Mirror log lines to stderr (default: 1)\n"
         "  --conf <path>                     Load options from dappvault.conf (default: ./dappvault.conf)\n"
         "  --no-conf                         Disable config file loading\n";
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, AppConfig* cfg) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    cfg->network = value;
  } else if (key == "datadir") {
    cfg->data_dir = value;
  } else if (key == "autolockminutes") {
    cfg->auto_lock_minutes = ParseU32(raw_key, value);
  } else if (key == "approvaltimeoutseconds") {
    cfg->approval_timeout_seconds = ParseUnsigned(raw_key, value);
  } else if (key == "reconcileintervalseconds") {
    cfg->reconcile_interval_seconds = ParseUnsigned(raw_key, value);
  } else if (key == "notfoundgraceseconds") {
    cfg->not_found_grace_seconds = ParseUnsigned(raw_key, value);
  } else if (key == "maxconnectedsites") {
    cfg->max_connected_sites = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "kdftcost") {
    cfg->kdf_t_cost = ParseU32(raw_key, value);
  } else if (key == "kdfmcostkib") {
    cfg->kdf_m_cost_kib = ParseU32(raw_key, value);
  } else if (key == "kdfparallelism") {
    cfg->kdf_parallelism = ParseU32(raw_key, value);
  } else if (key == "rpchost") {
    cfg->rpc_host = value;
  } else if (key == "rpcport") {
    cfg->rpc_port = ParsePort(raw_key, value);
  } else if (key == "rpcuser") {
    cfg->rpc_user = value;
  } else if (key == "rpcpassword" || key == "rpcpass") {
    cfg->rpc_pass = value;
  } else if (key == "rpcpassenv") {
    cfg->rpc_pass_env = value;
  } else if (key == "rpctimeoutms") {
    cfg->rpc_timeout_ms = ParseTimeoutMs(raw_key, value);
  } else if (key == "debuglog") {
    cfg->debug_log_path = value;
  } else if (key == "loglevel") {
    cfg->log_level = value;
  } else if (key == "logmaxsizemb") {
    cfg->log_max_size_mb = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else if (key == "printtoconsole") {
    cfg->print_to_console = ParseBool(value);
  } else if (key == "logmaxfiles") {
    cfg->log_max_files = static_cast<std::size_t>(ParseUnsigned(raw_key, value));
  } else {
    util::LogWarn("config", "unknown config key '" + raw_key + "'");
  }
}

void LoadConfigFile(const std::filesystem::path& path, AppConfig* cfg) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, cfg);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(AppConfig* cfg) {
  static constexpr std::string_view kVariables[][2] = {
      {"DAPPVAULT_NETWORK", "network"},
      {"DAPPVAULT_DATA_DIR", "data-dir"},
      {"DAPPVAULT_AUTO_LOCK_MINUTES", "auto-lock-minutes"},
      {"DAPPVAULT_APPROVAL_TIMEOUT_SECONDS", "approval-timeout-seconds"},
      {"DAPPVAULT_RECONCILE_INTERVAL_SECONDS", "reconcile-interval-seconds"},
      {"DAPPVAULT_NOT_FOUND_GRACE_SECONDS", "not-found-grace-seconds"},
      {"DAPPVAULT_MAX_CONNECTED_SITES", "max-connected-sites"},
      {"DAPPVAULT_KDF_T_COST", "kdf-t-cost"},
      {"DAPPVAULT_KDF_M_COST_KIB", "kdf-m-cost-kib"},
      {"DAPPVAULT_KDF_PARALLELISM", "kdf-parallelism"},
      {"DAPPVAULT_RPC_HOST", "rpc-host"},
      {"DAPPVAULT_RPC_PORT", "rpc-port"},
      {"DAPPVAULT_RPC_USER", "rpc-user"},
      {"DAPPVAULT_RPC_PASS", "rpc-pass"},
      {"DAPPVAULT_RPC_PASS_ENV", "rpc-pass-env"},
      {"DAPPVAULT_RPC_TIMEOUT_MS", "rpc-timeout-ms"},
      {"DAPPVAULT_DEBUG_LOG", "debug-log"},
      {"DAPPVAULT_LOG_LEVEL", "log-level"},
      {"DAPPVAULT_LOG_MAX_SIZE_MB", "log-max-size-mb"},
      {"DAPPVAULT_LOG_MAX_FILES", "log-max-files"},
      {"DAPPVAULT_PRINT_TO_CONSOLE", "print-to-console"},
  };
  for (const auto& entry : kVariables) {
    if (auto value = GetEnvValue(entry[0])) {
      try {
        ApplyConfigOption(std::string(entry[1]), *value, cfg);
      } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(entry[0]) + ": " + ex.what());
      }
    }
  }
}

AppConfig ParseAppConfig(const std::vector<std::string>& argv_tokens) {
  AppConfig cfg;
  std::vector<std::string> args;
  args.reserve(argv_tokens.size());
  for (const auto& token : argv_tokens) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
      return cfg;
    }
    if (arg == "--conf") {
      cfg.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      cfg.disable_config_file = true;
    }
  }

  if (!cfg.disable_config_file) {
    const std::filesystem::path config_path =
        cfg.config_path.empty() ? std::filesystem::path("dappvault.conf")
                                : std::filesystem::path(cfg.config_path);
    LoadConfigFile(config_path, &cfg);
  }

  ApplyEnvironmentOverrides(&cfg);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--conf") {
      ++i;
      continue;
    }
    if (arg == "--no-conf") {
      continue;
    }
    if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
      throw std::runtime_error("unexpected argument: " + arg);
    }
    static const std::vector<std::string> kValueFlags = {
        "network", "data-dir", "auto-lock-minutes", "approval-timeout-seconds",
        "reconcile-interval-seconds", "not-found-grace-seconds", "max-connected-sites",
        "kdf-t-cost", "kdf-m-cost-kib", "kdf-parallelism", "rpc-host", "rpc-port",
        "rpc-user", "rpc-pass", "rpc-pass-env", "rpc-timeout-ms", "debug-log", "log-level",
        "log-max-size-mb", "log-max-files", "print-to-console"};
    const std::string name = arg.substr(2);
    bool known = false;
    for (const auto& flag : kValueFlags) {
      if (flag == name) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw std::runtime_error("unknown option: " + arg);
    }
    ApplyConfigOption(name, ensure_value(i), &cfg);
  }

  if (cfg.data_dir.empty()) {
    cfg.data_dir = DefaultDataDir(cfg.network).string();
  }
  if (cfg.rpc_pass.empty() && !cfg.rpc_pass_env.empty()) {
    if (auto env = GetEnvValue(cfg.rpc_pass_env)) {
      cfg.rpc_pass = std::move(*env);
    }
  }
  ValidateAppConfig(cfg);
  return cfg;
}

AppConfig ParseAppConfig(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return ParseAppConfig(args);
}

void ValidateAppConfig(const AppConfig& cfg) {
  NetworkType type;
  if (!ParseNetwork(cfg.network, &type)) {
    throw std::runtime_error("invalid network '" + cfg.network + "' (expected testnet or mainnet)");
  }
  if (cfg.auto_lock_minutes < kMinAutoLockMinutes || cfg.auto_lock_minutes > kMaxAutoLockMinutes) {
    throw std::runtime_error("auto-lock-minutes must be between 1 and 120");
  }
  if (cfg.approval_timeout_seconds == 0) {
    throw std::runtime_error("approval-timeout-seconds must be positive");
  }
  if (cfg.reconcile_interval_seconds == 0) {
    throw std::runtime_error("reconcile-interval-seconds must be positive");
  }
  if (cfg.max_connected_sites == 0) {
    throw std::runtime_error("max-connected-sites must be positive");
  }
  std::string kdf_error;
  if (!util::ValidateArgon2idParams({cfg.kdf_t_cost, cfg.kdf_m_cost_kib, cfg.kdf_parallelism},
                                    &kdf_error)) {
    throw std::runtime_error(kdf_error);
  }
  if (!cfg.rpc_user.empty() && cfg.rpc_pass.empty()) {
    throw std::runtime_error("rpc-user and rpc-pass must be set together");
  }
  // Surfaces an unknown level here rather than at logger setup.
  (void)util::ParseLogLevelString(cfg.log_level);
}

NetworkType SelectedNetwork(const AppConfig& cfg) {
  NetworkType type = NetworkType::kTestnet;
  if (!ParseNetwork(cfg.network, &type)) {
    throw std::runtime_error("invalid network '" + cfg.network + "'");
  }
  return type;
}

std::filesystem::path DefaultDataDir(std::string_view network) {
  const std::string net(network);
#ifdef _WIN32
  if (const char* appdata = std::getenv("APPDATA")) {
    return std::filesystem::path(appdata) / "DappVault" / net;
  }
#else
  if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
    return std::filesystem::path(xdg_data) / "dappvault" / net;
  }
  if (const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".dappvault" / net;
  }
#endif
  return std::filesystem::path("data") / net;
}

std::filesystem::path WalletPath(const AppConfig& cfg) {
  return std::filesystem::path(cfg.data_dir) / "wallet.json";
}

std::filesystem::path PermissionsPath(const AppConfig& cfg) {
  return std::filesystem::path(cfg.data_dir) / "permissions.json";
}

std::filesystem::path TransactionsPath(const AppConfig& cfg) {
  return std::filesystem::path(cfg.data_dir) / "transactions.json";
}

}  // namespace dappvault::config
