#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "ledger/transaction_record.hpp"

namespace dappvault::ledger {

struct LedgerSnapshot {
  std::vector<TransactionRecord> records;  // most recent first
  std::string network{"testnet"};
  std::uint64_t last_synced_block_height{0};
};

// transactions.json: {"version":1, "network", "lastSyncedBlockHeight",
// "transactions":[...]}.
class TransactionStore {
 public:
  explicit TransactionStore(std::filesystem::path path);

  // A missing file yields an empty snapshot. Malformed entries are skipped.
  bool Load(LedgerSnapshot* snapshot, std::string* error) const;
  // Throws util::StorageError on failure.
  void Save(const LedgerSnapshot& snapshot) const;

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace dappvault::ledger
