#include "ledger/transaction_store.hpp"

#include "util/atomic_file.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::ledger {

TransactionStore::TransactionStore(std::filesystem::path path) : path_(std::move(path)) {}

bool TransactionStore::Load(LedgerSnapshot* snapshot, std::string* error) const {
  std::string text;
  bool missing = false;
  if (!util::ReadFileText(path_, &text, error, &missing)) {
    if (missing) {
      if (error) error->clear();
      *snapshot = LedgerSnapshot{};
      return true;
    }
    return false;
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const std::exception& ex) {
    if (error) {
      *error = "failed to parse transactions file: " + std::string(ex.what());
    }
    return false;
  }
  if (!json.is_object()) {
    if (error) {
      *error = "transactions file must contain a JSON object";
    }
    return false;
  }
  LedgerSnapshot loaded;
  loaded.network = json.value("network", loaded.network);
  loaded.last_synced_block_height = json.value("lastSyncedBlockHeight", std::uint64_t{0});
  if (json.contains("transactions") && json.at("transactions").is_array()) {
    for (const auto& item : json.at("transactions")) {
      TransactionRecord record;
      std::string item_error;
      if (!RecordFromJson(item, &record, &item_error)) {
        util::LogWarn("ledger", "skipping malformed transaction entry: " + item_error);
        continue;
      }
      loaded.records.push_back(std::move(record));
    }
  }
  *snapshot = std::move(loaded);
  return true;
}

void TransactionStore::Save(const LedgerSnapshot& snapshot) const {
  nlohmann::json json{
      {"version", 1},
      {"network", snapshot.network},
      {"lastSyncedBlockHeight", snapshot.last_synced_block_height},
  };
  json["transactions"] = nlohmann::json::array();
  for (const auto& record : snapshot.records) {
    json["transactions"].push_back(RecordToJson(record));
  }
  std::string error;
  if (!util::AtomicWriteFileText(path_, json.dump(2), &error)) {
    throw util::StorageError("failed to write " + path_.string() + ": " + error);
  }
}

}  // namespace dappvault::ledger
