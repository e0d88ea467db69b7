#include "ledger/transaction_record.hpp"

#include <algorithm>
#include <cctype>

namespace dappvault::ledger {

namespace {

template <typename T>
void PutOptional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
  if (value) {
    json[key] = *value;
  }
}

template <typename T>
std::optional<T> GetOptional(const nlohmann::json& json, const char* key) {
  if (!json.contains(key) || json.at(key).is_null()) {
    return std::nullopt;
  }
  return json.at(key).get<T>();
}

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

const char* TxKindName(TxKind kind) {
  switch (kind) {
    case TxKind::kSend:
      return "send";
    case TxKind::kReceive:
      return "receive";
    case TxKind::kExecute:
      return "execute";
    case TxKind::kDeploy:
      return "deploy";
  }
  return "unknown";
}

std::optional<TxKind> ParseTxKind(std::string_view name) {
  if (name == "send") return TxKind::kSend;
  if (name == "receive") return TxKind::kReceive;
  if (name == "execute") return TxKind::kExecute;
  if (name == "deploy") return TxKind::kDeploy;
  return std::nullopt;
}

const char* TxStatusName(TxStatus status) {
  switch (status) {
    case TxStatus::kPending:
      return "pending";
    case TxStatus::kConfirmed:
      return "confirmed";
    case TxStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<TxStatus> ParseTxStatus(std::string_view name) {
  if (name == "pending") return TxStatus::kPending;
  if (name == "confirmed") return TxStatus::kConfirmed;
  if (name == "failed") return TxStatus::kFailed;
  return std::nullopt;
}

TxStatus ClassifyChainStatus(std::string_view status) {
  std::string lower(status);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (Contains(lower, "accept") || Contains(lower, "confirmed") || Contains(lower, "finalized")) {
    return TxStatus::kConfirmed;
  }
  if (Contains(lower, "reject") || Contains(lower, "failed") || Contains(lower, "aborted")) {
    return TxStatus::kFailed;
  }
  return TxStatus::kPending;
}

nlohmann::json RecordToJson(const TransactionRecord& record) {
  nlohmann::json json{
      {"id", record.id},
      {"txId", record.tx_id},
      {"type", TxKindName(record.kind)},
      {"status", TxStatusName(record.status)},
      {"timestamp", record.timestamp},
      {"explorerUrl", record.explorer_url},
  };
  PutOptional(json, "programId", record.program_id);
  PutOptional(json, "functionName", record.function_name);
  PutOptional(json, "from", record.from);
  PutOptional(json, "to", record.to);
  PutOptional(json, "amount", record.amount);
  PutOptional(json, "fee", record.fee);
  PutOptional(json, "blockHeight", record.block_height);
  PutOptional(json, "confirmations", record.confirmations);
  PutOptional(json, "memo", record.memo);
  PutOptional(json, "error", record.error);
  return json;
}

bool RecordFromJson(const nlohmann::json& json, TransactionRecord* record, std::string* error) {
  TransactionRecord parsed;
  try {
    parsed.id = json.at("id").get<std::string>();
    parsed.tx_id = json.at("txId").get<std::string>();
    const auto kind = ParseTxKind(json.at("type").get<std::string>());
    const auto status = ParseTxStatus(json.at("status").get<std::string>());
    if (!kind || !status) {
      if (error) *error = "unknown type or status";
      return false;
    }
    parsed.kind = *kind;
    parsed.status = *status;
    parsed.timestamp = json.at("timestamp").get<std::int64_t>();
    parsed.explorer_url = json.value("explorerUrl", std::string());
    parsed.program_id = GetOptional<std::string>(json, "programId");
    parsed.function_name = GetOptional<std::string>(json, "functionName");
    parsed.from = GetOptional<std::string>(json, "from");
    parsed.to = GetOptional<std::string>(json, "to");
    parsed.amount = GetOptional<std::int64_t>(json, "amount");
    parsed.fee = GetOptional<std::int64_t>(json, "fee");
    parsed.block_height = GetOptional<std::uint64_t>(json, "blockHeight");
    parsed.confirmations = GetOptional<std::uint64_t>(json, "confirmations");
    parsed.memo = GetOptional<std::string>(json, "memo");
    parsed.error = GetOptional<std::string>(json, "error");
  } catch (const nlohmann::json::exception& ex) {
    if (error) *error = ex.what();
    return false;
  }
  if (parsed.id.empty() || parsed.tx_id.empty()) {
    if (error) *error = "record is missing id or txId";
    return false;
  }
  *record = std::move(parsed);
  return true;
}

}  // namespace dappvault::ledger
