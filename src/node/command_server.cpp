#include "node/command_server.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "permissions/capability.hpp"
#include "util/amount.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::node {

namespace {

constexpr std::size_t kDefaultCleanupAgeDays = 30;
constexpr std::size_t kMaxCleanupAgeDays = 36500;

struct CommandError : public std::runtime_error {
  int code;
  CommandError(int c, const std::string& msg) : std::runtime_error(msg), code(c) {}
};

[[noreturn]] void ThrowCommandError(int code, const std::string& msg) {
  throw CommandError(code, msg);
}

std::string RequireString(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || !params.at(key).is_string()) {
    throw util::ValidationError(std::string("missing string parameter '") + key + "'");
  }
  return params.at(key).get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || params.at(key).is_null()) {
    return std::nullopt;
  }
  if (!params.at(key).is_string()) {
    throw util::ValidationError(std::string("parameter '") + key + "' must be a string");
  }
  return params.at(key).get<std::string>();
}

bool RequireBool(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || !params.at(key).is_boolean()) {
    throw util::ValidationError(std::string("missing boolean parameter '") + key + "'");
  }
  return params.at(key).get<bool>();
}

std::size_t OptionalCount(const nlohmann::json& params, const char* key, std::size_t fallback) {
  if (!params.contains(key) || params.at(key).is_null()) {
    return fallback;
  }
  if (!params.at(key).is_number_unsigned()) {
    throw util::ValidationError(std::string("parameter '") + key +
                                "' must be a non-negative integer");
  }
  return params.at(key).get<std::size_t>();
}

// Accepts a JSON number or a decimal string of credits.
std::optional<std::int64_t> OptionalCredits(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || params.at(key).is_null()) {
    return std::nullopt;
  }
  const auto& value = params.at(key);
  std::int64_t microcredits = 0;
  bool ok = false;
  if (value.is_string()) {
    ok = util::ParseCredits(value.get<std::string>(), &microcredits);
  } else if (value.is_number()) {
    ok = util::CreditsFromDouble(value.get<double>(), &microcredits);
  }
  if (!ok) {
    throw util::ValidationError(std::string("parameter '") + key + "' is not a valid amount");
  }
  return microcredits;
}

std::int64_t RequireCredits(const nlohmann::json& params, const char* key) {
  auto value = OptionalCredits(params, key);
  if (!value) {
    throw util::ValidationError(std::string("missing amount parameter '") + key + "'");
  }
  return *value;
}

std::vector<std::string> OptionalStringList(const nlohmann::json& params, const char* key) {
  std::vector<std::string> out;
  if (!params.contains(key) || params.at(key).is_null()) {
    return out;
  }
  if (!params.at(key).is_array()) {
    throw util::ValidationError(std::string("parameter '") + key + "' must be an array");
  }
  for (const auto& item : params.at(key)) {
    if (!item.is_string()) {
      throw util::ValidationError(std::string("parameter '") + key + "' must hold strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

permissions::Capability RequireCapability(const nlohmann::json& params, const char* key) {
  const auto name = RequireString(params, key);
  auto capability = permissions::ParseCapability(name);
  if (!capability) {
    throw util::ValidationError("unknown permission '" + name + "'");
  }
  return *capability;
}

// Import payloads arrive either as the exported object or as its text.
std::string DocumentText(const nlohmann::json& params) {
  if (!params.contains("data")) {
    throw util::ValidationError("missing parameter 'data'");
  }
  const auto& data = params.at("data");
  return data.is_string() ? data.get<std::string>() : data.dump();
}

nlohmann::json CreditsJson(std::int64_t microcredits) {
  return util::CreditsToDouble(microcredits);
}

nlohmann::json BalanceJson(const gateway::Balance& balance) {
  return nlohmann::json{{"public", CreditsJson(balance.public_balance)},
                        {"private", CreditsJson(balance.private_balance)}};
}

nlohmann::json RecordWire(const ledger::TransactionRecord& record) {
  auto json = ledger::RecordToJson(record);
  if (record.amount) {
    json["amount"] = CreditsJson(*record.amount);
  }
  if (record.fee) {
    json["fee"] = CreditsJson(*record.fee);
  }
  return json;
}

nlohmann::json RecordsWire(const std::vector<ledger::TransactionRecord>& records) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& record : records) {
    out.push_back(RecordWire(record));
  }
  return out;
}

nlohmann::json StateJson(const wallet::WalletState& state) {
  nlohmann::json json{{"hasWallet", state.has_wallet}, {"unlocked", state.unlocked}};
  json["address"] = state.address ? nlohmann::json(*state.address) : nlohmann::json(nullptr);
  json["unlockedAt"] =
      state.unlocked_at ? nlohmann::json(*state.unlocked_at) : nlohmann::json(nullptr);
  json["autoLockDeadline"] = state.auto_lock_deadline
                                 ? nlohmann::json(*state.auto_lock_deadline)
                                 : nlohmann::json(nullptr);
  return json;
}

std::pair<std::string, std::string> SplitMethod(const std::string& method) {
  const auto dot = method.find('.');
  if (dot == std::string::npos) {
    return {method, {}};
  }
  return {method.substr(0, dot), method.substr(dot + 1)};
}

}  // namespace

CommandServer::CommandServer(AppContext& context) : context_(context) {}

bool CommandServer::IsAsyncMethod(const std::string& method) {
  return method.rfind("dapp.", 0) == 0 || method == "ledger.reconcile" ||
         method == "wallet.balance" || method == "wallet.send" ||
         method == "wallet.verify";
}

nlohmann::json CommandServer::Handle(const nlohmann::json& request) {
  nlohmann::json response;
  response["id"] = request.is_object() && request.contains("id") ? request.at("id")
                                                                 : nlohmann::json(nullptr);
  try {
    if (!request.is_object() || !request.contains("method") ||
        !request.at("method").is_string()) {
      ThrowCommandError(kInvalidRequestCode, "invalid request");
    }
    const auto method = request.at("method").get<std::string>();
    const nlohmann::json params =
        request.contains("params") && !request.at("params").is_null() ? request.at("params")
                                                                       : nlohmann::json::object();
    if (!params.is_object()) {
      ThrowCommandError(kInvalidParamsCode, "params must be an object");
    }
    response["result"] = Dispatch(method, params);
  } catch (const CommandError& ex) {
    response["error"] = {{"code", ex.code}, {"message", ex.what()}};
  } catch (const util::Error& ex) {
    response["error"] = {{"code", static_cast<int>(ex.code())}, {"message", ex.what()}};
  } catch (const nlohmann::json::exception& ex) {
    response["error"] = {{"code", kInvalidParamsCode}, {"message", ex.what()}};
  } catch (const std::exception& ex) {
    util::LogError("command", std::string("internal error: ") + ex.what());
    response["error"] = {{"code", kInternalErrorCode}, {"message", ex.what()}};
  }
  return response;
}

nlohmann::json CommandServer::Dispatch(const std::string& method, const nlohmann::json& params) {
  const auto [area, name] = SplitMethod(method);
  if (area == "wallet") {
    return HandleWallet(name, params);
  }
  if (area == "dapp") {
    return HandleDapp(name, params);
  }
  if (area == "permissions") {
    return HandlePermissions(name, params);
  }
  if (area == "ledger") {
    return HandleLedger(name, params);
  }
  ThrowCommandError(kMethodNotFoundCode, "unknown method: " + method);
}

nlohmann::json CommandServer::HandleWallet(const std::string& name, const nlohmann::json& params) {
  auto& wallet = context_.wallet();
  if (name == "create") {
    auto created = wallet.Create(RequireString(params, "password"));
    context_.SyncLedgerOwner();
    nlohmann::json result{{"address", created.address}};
    if (created.recovery_phrase) {
      result["recoveryPhrase"] = std::string(created.recovery_phrase->view());
    }
    return result;
  }
  if (name == "importKey") {
    auto address = wallet.ImportFromKey(RequireString(params, "privateKey"),
                                        RequireString(params, "password"));
    context_.SyncLedgerOwner();
    return nlohmann::json{{"address", address}};
  }
  if (name == "importSeed") {
    auto address = wallet.ImportFromSeed(RequireString(params, "phrase"),
                                         RequireString(params, "password"));
    context_.SyncLedgerOwner();
    return nlohmann::json{{"address", address}};
  }
  if (name == "unlock") {
    wallet.Unlock(RequireString(params, "password"));
    context_.SyncLedgerOwner();
    return StateJson(wallet.GetState());
  }
  if (name == "lock") {
    wallet.Lock();
    return nlohmann::json{{"locked", true}};
  }
  if (name == "delete") {
    wallet.DeleteWallet();
    return nlohmann::json{{"deleted", true}};
  }
  if (name == "state") {
    return StateJson(wallet.GetState());
  }
  if (name == "address") {
    return nlohmann::json{{"address", wallet.GetAddress()}};
  }
  if (name == "exportPrivateKey") {
    auto key = wallet.ExportPrivateKey();
    return nlohmann::json{{"privateKey", std::string(key.view())}};
  }
  if (name == "exportViewKey") {
    auto key = wallet.ExportViewKey();
    return nlohmann::json{{"viewKey", std::string(key.view())}};
  }
  if (name == "balance") {
    return BalanceJson(wallet.GetBalance());
  }
  if (name == "send") {
    const auto to = RequireString(params, "to");
    const auto amount = RequireCredits(params, "amount");
    const auto fee = OptionalCredits(params, "fee").value_or(0);
    const auto memo = OptionalString(params, "memo");
    const auto tx_id = wallet.Send(to, amount, fee);
    nlohmann::json result{{"txId", tx_id}, {"transaction", nullptr}};
    try {
      result["transaction"] = RecordWire(context_.ledger().RecordSend(tx_id, to, amount, fee, memo));
    } catch (const util::StorageError& ex) {
      // The transfer is already on chain; the caller still needs its id.
      util::LogError("command", "sent " + tx_id + " but could not record it: " + ex.what());
    }
    return result;
  }
  if (name == "sign") {
    return nlohmann::json{{"signature", wallet.SignMessage(RequireString(params, "message"))}};
  }
  if (name == "verify") {
    return nlohmann::json{{"valid", wallet.VerifySignature(RequireString(params, "message"),
                                                           RequireString(params, "signature"),
                                                           OptionalString(params, "address"))}};
  }
  if (name == "setAutoLock") {
    const auto minutes = OptionalCount(params, "minutes", 0);
    if (minutes < config::kMinAutoLockMinutes || minutes > config::kMaxAutoLockMinutes) {
      throw util::ValidationError("minutes must be between 1 and 120");
    }
    wallet.SetAutoLockTimeout(std::chrono::minutes(minutes));
    return nlohmann::json{{"minutes", minutes}};
  }
  ThrowCommandError(kMethodNotFoundCode, "unknown method: wallet." + name);
}

nlohmann::json CommandServer::HandleDapp(const std::string& name, const nlohmann::json& params) {
  auto& dapp = context_.dapp();
  if (name == "getNetwork") {
    return nlohmann::json{{"network", dapp.GetNetwork()}};
  }
  if (name == "getBlockHeight") {
    return nlohmann::json{{"height", dapp.GetBlockHeight()}};
  }
  if (name == "getTransactionStatus") {
    const auto status = dapp.GetTransactionStatus(RequireString(params, "transactionId"));
    nlohmann::json result{{"found", status.found}, {"status", status.status}};
    if (status.block_height) {
      result["blockHeight"] = *status.block_height;
    }
    if (status.confirmations) {
      result["confirmations"] = *status.confirmations;
    }
    if (status.fee) {
      result["fee"] = CreditsJson(*status.fee);
    }
    return result;
  }

  const auto origin = RequireString(params, "origin");
  if (name == "connect") {
    DappConnectRequest request;
    if (params.contains("permissions")) {
      if (!permissions::CapabilitiesFromJson(params.at("permissions"), &request.capabilities)) {
        throw util::ValidationError("permissions must be an array of names");
      }
    }
    request.title = OptionalString(params, "title");
    request.favicon = OptionalString(params, "favicon");
    return nlohmann::json{{"address", dapp.Connect(origin, request)}};
  }
  if (name == "disconnect") {
    return nlohmann::json{{"disconnected", dapp.Disconnect(origin)}};
  }
  if (name == "isConnected") {
    return nlohmann::json{{"connected", dapp.IsConnected(origin)}};
  }
  if (name == "getAccount") {
    return nlohmann::json{{"address", dapp.GetAccount(origin)}};
  }
  if (name == "requestTransaction") {
    DappTransactionRequest request;
    request.program_id = RequireString(params, "programId");
    request.function_name = RequireString(params, "functionName");
    request.inputs = OptionalStringList(params, "inputs");
    request.fee = OptionalCredits(params, "fee").value_or(kDefaultDappFee);
    return nlohmann::json{{"transactionId", dapp.RequestTransaction(origin, request)}};
  }
  if (name == "signMessage") {
    return nlohmann::json{{"signature", dapp.SignMessage(origin, RequireString(params, "message"))}};
  }
  if (name == "requestViewKey") {
    auto key = dapp.RequestViewKey(origin);
    return nlohmann::json{{"viewKey", std::string(key.view())}};
  }
  if (name == "requestRecords") {
    return nlohmann::json{
        {"records", dapp.RequestRecords(origin, OptionalString(params, "programId"))}};
  }
  if (name == "decrypt") {
    return nlohmann::json{{"plaintext", dapp.Decrypt(origin, RequireString(params, "ciphertext"))}};
  }
  if (name == "getBalance") {
    return BalanceJson(dapp.GetBalance(origin));
  }
  ThrowCommandError(kMethodNotFoundCode, "unknown method: dapp." + name);
}

nlohmann::json CommandServer::HandlePermissions(const std::string& name,
                                                const nlohmann::json& params) {
  auto& broker = context_.permissions();
  if (name == "list") {
    nlohmann::json sites = nlohmann::json::array();
    for (const auto& site : broker.ListSites()) {
      sites.push_back(permissions::SiteToJson(site));
    }
    return nlohmann::json{{"sites", sites}};
  }
  if (name == "disconnect") {
    return nlohmann::json{{"disconnected", broker.Disconnect(RequireString(params, "origin"))}};
  }
  if (name == "disconnectAll") {
    return nlohmann::json{{"disconnected", broker.DisconnectAll()}};
  }
  if (name == "revoke") {
    const auto origin = RequireString(params, "origin");
    return nlohmann::json{
        {"revoked", broker.RevokeCapability(origin, RequireCapability(params, "permission"))}};
  }
  if (name == "resolve") {
    return nlohmann::json{{"resolved", broker.Resolve(RequireString(params, "requestId"),
                                                      RequireBool(params, "granted"))}};
  }
  if (name == "respond") {
    return nlohmann::json{{"resolved", broker.ResolveOldestForOrigin(
                                           RequireString(params, "origin"),
                                           RequireBool(params, "granted"))}};
  }
  if (name == "pending") {
    nlohmann::json requests = nlohmann::json::array();
    for (const auto& event : broker.PendingRequests(OptionalString(params, "origin"))) {
      requests.push_back(permissions::ApprovalRequestToJson(event));
    }
    return nlohmann::json{{"requests", requests}};
  }
  if (name == "cleanup") {
    const auto days = OptionalCount(params, "maxAgeDays", kDefaultCleanupAgeDays);
    if (days < 1 || days > kMaxCleanupAgeDays) {
      throw util::ValidationError("maxAgeDays must be between 1 and " +
                                  std::to_string(kMaxCleanupAgeDays));
    }
    const auto removed = broker.CleanupExpired(std::chrono::hours(24 * days));
    return nlohmann::json{{"removed", removed}};
  }
  if (name == "export") {
    return nlohmann::json::parse(broker.ExportJson());
  }
  if (name == "import") {
    return nlohmann::json{{"imported", broker.ImportJson(DocumentText(params))}};
  }
  if (name == "settings") {
    if (!params.empty()) {
      auto settings = broker.GetSettings();
      std::string error;
      if (!permissions::SettingsFromJson(params, &settings, &error)) {
        throw util::ValidationError(error);
      }
      broker.UpdateSettings(settings);
    }
    return permissions::SettingsToJson(broker.GetSettings());
  }
  ThrowCommandError(kMethodNotFoundCode, "unknown method: permissions." + name);
}

nlohmann::json CommandServer::HandleLedger(const std::string& name, const nlohmann::json& params) {
  auto& ledger = context_.ledger();
  if (name == "list") {
    ledger::TransactionQuery query;
    if (auto type = OptionalString(params, "type")) {
      query.kind = ledger::ParseTxKind(*type);
      if (!query.kind) {
        throw util::ValidationError("unknown transaction type '" + *type + "'");
      }
    }
    if (auto status = OptionalString(params, "status")) {
      query.status = ledger::ParseTxStatus(*status);
      if (!query.status) {
        throw util::ValidationError("unknown transaction status '" + *status + "'");
      }
    }
    query.offset = OptionalCount(params, "offset", query.offset);
    query.limit = OptionalCount(params, "limit", query.limit);
    const auto result = ledger.Query(query);
    return nlohmann::json{{"transactions", RecordsWire(result.records)},
                          {"total", result.total},
                          {"hasMore", result.has_more}};
  }
  if (name == "get") {
    auto record = ledger.Get(RequireString(params, "id"));
    return record ? RecordWire(*record) : nlohmann::json(nullptr);
  }
  if (name == "recent") {
    return RecordsWire(ledger.Recent(OptionalCount(params, "count", 10)));
  }
  if (name == "stats") {
    const auto stats = ledger.Stats();
    return nlohmann::json{{"total", stats.total},
                          {"pending", stats.pending},
                          {"confirmed", stats.confirmed},
                          {"failed", stats.failed},
                          {"totalSent", CreditsJson(stats.total_sent)},
                          {"totalReceived", CreditsJson(stats.total_received)},
                          {"totalFees", CreditsJson(stats.total_fees)}};
  }
  if (name == "delete") {
    return nlohmann::json{{"deleted", ledger.Delete(RequireString(params, "id"))}};
  }
  if (name == "clear") {
    ledger.Clear();
    return nlohmann::json{{"cleared", true}};
  }
  if (name == "export") {
    return nlohmann::json::parse(ledger.ExportJson());
  }
  if (name == "import") {
    return nlohmann::json{{"imported", ledger.ImportJson(DocumentText(params))}};
  }
  if (name == "reconcile") {
    if (auto tx_id = OptionalString(params, "txId")) {
      auto record = ledger.Reconcile(*tx_id);
      return record ? RecordWire(*record) : nlohmann::json(nullptr);
    }
    return nlohmann::json{{"changed", ledger.ReconcilePending()}};
  }
  ThrowCommandError(kMethodNotFoundCode, "unknown method: ledger." + name);
}

}  // namespace dappvault::node
