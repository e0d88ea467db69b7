#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace dappvault::ledger {

enum class TxKind { kSend, kReceive, kExecute, kDeploy };
enum class TxStatus { kPending, kConfirmed, kFailed };

const char* TxKindName(TxKind kind);
std::optional<TxKind> ParseTxKind(std::string_view name);
const char* TxStatusName(TxStatus status);
std::optional<TxStatus> ParseTxStatus(std::string_view name);

// Maps the chain client's free-form status text: anything mentioning
// accept/confirmed/finalized is Confirmed, reject/failed/aborted is Failed,
// everything else stays Pending. Case-insensitive.
TxStatus ClassifyChainStatus(std::string_view status);

struct TransactionRecord {
  std::string id;
  std::string tx_id;
  TxKind kind{TxKind::kSend};
  std::optional<std::string> program_id;
  std::optional<std::string> function_name;
  std::optional<std::string> from;
  std::optional<std::string> to;
  std::optional<std::int64_t> amount;  // microcredits
  std::optional<std::int64_t> fee;     // microcredits
  TxStatus status{TxStatus::kPending};
  std::int64_t timestamp{0};
  std::optional<std::uint64_t> block_height;
  std::optional<std::uint64_t> confirmations;
  std::optional<std::string> memo;
  std::string explorer_url;
  std::optional<std::string> error;
};

// Persisted form; amounts stay integer microcredits.
nlohmann::json RecordToJson(const TransactionRecord& record);
bool RecordFromJson(const nlohmann::json& json, TransactionRecord* record, std::string* error);

}  // namespace dappvault::ledger
