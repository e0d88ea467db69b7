#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

#include "config/app_config.hpp"
#include "gateway/rpc_gateway.hpp"
#include "net/socket.hpp"
#include "nlohmann/json.hpp"
#include "node/app_context.hpp"
#include "node/command_server.hpp"
#include "permissions/permission_broker.hpp"
#include "util/logging.hpp"

namespace {

using dappvault::util::LogError;
using dappvault::util::LogInfo;
using dappvault::util::LogWarn;

std::atomic<bool> g_shutdown_requested{false};

bool ShutdownRequested() { return g_shutdown_requested.load(); }

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

// stdout carries responses and events, one JSON document per line.
class OutputChannel {
 public:
  void Write(const nlohmann::json& message) {
    const auto line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << '\n';
    std::cout.flush();
  }

 private:
  std::mutex mutex_;
};

class StdoutApprovalChannel : public dappvault::permissions::ApprovalChannel {
 public:
  explicit StdoutApprovalChannel(OutputChannel& out) : out_(out) {}

  void OnApprovalRequested(const dappvault::permissions::ApprovalRequestEvent& event) override {
    auto message = dappvault::permissions::ApprovalRequestToJson(event);
    message["event"] = "permission:request";
    out_.Write(message);
  }

 private:
  OutputChannel& out_;
};

// Waits up to `timeout` for stdin to become readable so the loop can notice
// a shutdown signal between lines.
bool WaitForInput(std::chrono::milliseconds timeout) {
  if (std::cin.rdbuf()->in_avail() > 0) {
    return true;
  }
#ifndef _WIN32
  std::string error;
  const bool ready =
      dappvault::net::WaitReadable(STDIN_FILENO, static_cast<int>(timeout.count()), &error);
  if (!error.empty()) {
    LogWarn("node", "stdin " + error);
  }
  return ready;
#else
  (void)timeout;
  return true;
#endif
}

void ConfigureLogging(const dappvault::config::AppConfig& cfg) {
  auto& logger = dappvault::util::GlobalLogger();
  const auto level = dappvault::util::ParseLogLevelString(cfg.log_level);
  logger.SetConsoleLevel(level);
  logger.SetConsoleEnabled(cfg.print_to_console);
  if (!cfg.debug_log_path.empty()) {
    std::uintmax_t max_bytes = 0;
    if (cfg.log_max_size_mb > 0) {
      max_bytes = static_cast<std::uintmax_t>(cfg.log_max_size_mb) * 1024ULL * 1024ULL;
    }
    logger.Configure(level, max_bytes, cfg.log_max_files);
    logger.EnableFile(cfg.debug_log_path);
    dappvault::util::LogDebug("node", "debug log enabled at " + cfg.debug_log_path);
  }
}

std::unique_ptr<dappvault::gateway::BlockchainGateway> MakeGateway(
    const dappvault::config::AppConfig& cfg) {
  dappvault::gateway::RpcGatewayOptions options;
  options.host = cfg.rpc_host;
  options.port = cfg.rpc_port;
  options.user = cfg.rpc_user;
  options.password = cfg.rpc_pass;
  options.timeout_ms = cfg.rpc_timeout_ms;
  return std::make_unique<dappvault::gateway::RpcGateway>(std::move(options));
}

int RunCommandLoop(dappvault::node::AppContext& context, OutputChannel& out) {
  dappvault::node::CommandServer server(context);
  std::vector<std::future<void>> workers;

  auto prune = [&workers] {
    std::erase_if(workers, [](std::future<void>& f) {
      return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
  };

  std::string line;
  while (!ShutdownRequested()) {
    if (!WaitForInput(std::chrono::milliseconds(200))) {
      prune();
      continue;
    }
    if (!std::getline(std::cin, line)) {
      LogInfo("node", "command channel closed");
      break;
    }
    if (line.empty() || line == "\r") {
      continue;
    }
    nlohmann::json request;
    try {
      request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
      out.Write({{"id", nullptr},
                 {"error",
                  {{"code", dappvault::node::kInvalidRequestCode},
                   {"message", std::string("parse error: ") + ex.what()}}}});
      continue;
    }
    const bool async = request.is_object() && request.contains("method") &&
                       request.at("method").is_string() &&
                       dappvault::node::CommandServer::IsAsyncMethod(
                           request.at("method").get<std::string>());
    if (async) {
      prune();
      workers.push_back(std::async(std::launch::async, [&server, &out, request] {
        out.Write(server.Handle(request));
      }));
    } else {
      out.Write(server.Handle(request));
    }
  }

  // Rejects outstanding approvals so suspended dApp calls return.
  context.Shutdown();
  for (auto& worker : workers) {
    worker.wait();
  }
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  try {
    auto cfg = dappvault::config::ParseAppConfig(argc, argv);
    if (cfg.show_help) {
      std::cout << dappvault::config::UsageText();
      return EXIT_SUCCESS;
    }
    ConfigureLogging(cfg);
    InstallSignalHandlers();
    if (!dappvault::net::InitializeSockets()) {
      LogError("node", "socket initialisation failed");
      return EXIT_FAILURE;
    }
    LogInfo("node", "dappvaultd starting on network=" + cfg.network + ", data_dir=" +
                        cfg.data_dir + ", client=" + cfg.rpc_host + ":" +
                        std::to_string(cfg.rpc_port));

    OutputChannel out;
    StdoutApprovalChannel approvals(out);
    dappvault::node::AppContext context(cfg, MakeGateway(cfg));
    context.permissions().SetApprovalChannel(&approvals);
    context.wallet().SetLockObserver([&out](dappvault::wallet::LockReason reason) {
      out.Write({{"event", "wallet:locked"},
                 {"reason", dappvault::wallet::LockReasonName(reason)}});
    });
    context.Start();

    const int rc = RunCommandLoop(context, out);
    context.wallet().SetLockObserver(nullptr);
    context.permissions().SetApprovalChannel(nullptr);
    LogInfo("node", "dappvaultd stopped");
    return rc;
  } catch (const std::exception& ex) {
    std::cerr << "[dappvaultd] fatal: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
