#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "node/app_context.hpp"

namespace dappvault::node {

// Command channel codes outside the service error range.
inline constexpr int kInvalidRequestCode = -32600;
inline constexpr int kMethodNotFoundCode = -32601;
inline constexpr int kInvalidParamsCode = -32602;
inline constexpr int kInternalErrorCode = -32603;

// Maps {"id","method","params"} requests onto the services. Responses are
// {"id","result"} or {"id","error":{"code","message"}} where service failures
// carry their util::ErrorCode. Amounts cross the channel as decimal credits.
//
// Handle() is safe to call from several threads; blocking dApp methods are
// expected to run off the reader thread (see IsAsyncMethod).
class CommandServer {
 public:
  explicit CommandServer(AppContext& context);

  nlohmann::json Handle(const nlohmann::json& request);

  // Methods that may block on user approval or the chain client.
  static bool IsAsyncMethod(const std::string& method);

 private:
  nlohmann::json Dispatch(const std::string& method, const nlohmann::json& params);

  nlohmann::json HandleWallet(const std::string& name, const nlohmann::json& params);
  nlohmann::json HandleDapp(const std::string& name, const nlohmann::json& params);
  nlohmann::json HandlePermissions(const std::string& name, const nlohmann::json& params);
  nlohmann::json HandleLedger(const std::string& name, const nlohmann::json& params);

  AppContext& context_;
};

}  // namespace dappvault::node
