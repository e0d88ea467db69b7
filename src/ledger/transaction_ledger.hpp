#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gateway/blockchain_gateway.hpp"
#include "ledger/transaction_record.hpp"
#include "ledger/transaction_store.hpp"
#include "util/scheduler.hpp"
#include "util/time.hpp"

namespace dappvault::ledger {

struct LedgerOptions {
  std::chrono::milliseconds reconcile_interval{std::chrono::seconds(30)};
  // How long an unknown txId is tolerated before the record is failed.
  std::chrono::milliseconds not_found_grace{std::chrono::minutes(10)};
  // Concurrent status queries per sweep. Zero is treated as one.
  std::size_t reconcile_workers{4};
  std::string testnet_explorer{"https://explorer.aleo.org/transaction"};
  std::string mainnet_explorer{"https://explorer.aleo.org/transaction"};
};

struct TransactionSubmission {
  std::string tx_id;
  TxKind kind{TxKind::kSend};
  std::optional<std::string> program_id;
  std::optional<std::string> function_name;
  std::optional<std::string> from;
  std::optional<std::string> to;
  std::optional<std::int64_t> amount;
  std::optional<std::int64_t> fee;
  std::optional<std::string> memo;
};

struct TransactionQuery {
  std::optional<TxKind> kind;
  std::optional<TxStatus> status;
  std::size_t offset{0};
  std::size_t limit{20};
};

struct QueryResult {
  std::vector<TransactionRecord> records;
  std::size_t total{0};
  bool has_more{false};
};

struct TransactionStats {
  std::size_t total{0};
  std::size_t pending{0};
  std::size_t confirmed{0};
  std::size_t failed{0};
  // Sums over confirmed records only, in microcredits.
  std::int64_t total_sent{0};
  std::int64_t total_received{0};
  std::int64_t total_fees{0};
};

// Log of submitted transactions, newest first, with a periodic reconciliation
// loop against the chain client. Every mutation is written through to the
// store before the call returns.
//
// A sweep reconciles each pending record on its own task; gateway calls are
// made without the ledger lock, and results are applied under it only if the
// record still exists and is still pending.
class TransactionLedger {
 public:
  TransactionLedger(TransactionStore& store, gateway::BlockchainGateway& gateway,
                    util::Scheduler& scheduler, LedgerOptions options = {},
                    util::NowFn now = util::UnixTimeMillis);
  ~TransactionLedger();

  TransactionLedger(const TransactionLedger&) = delete;
  TransactionLedger& operator=(const TransactionLedger&) = delete;

  // Reads persisted records. A corrupt file is logged and treated as empty.
  void Load();

  // Back-fills `from` on send/execute records and selects the explorer base.
  void SetOwner(const std::string& address, const std::string& network);

  TransactionRecord RecordSubmission(TransactionSubmission submission);
  TransactionRecord RecordSend(const std::string& tx_id, const std::string& to,
                               std::int64_t amount, std::int64_t fee,
                               std::optional<std::string> memo = std::nullopt);
  TransactionRecord RecordExecution(const std::string& tx_id, const std::string& program_id,
                                    const std::string& function_name, std::int64_t fee);

  // Queries the chain client for one transaction and applies the result.
  // Returns the record afterwards, or nullopt if it is unknown. Network
  // failures leave the record untouched.
  std::optional<TransactionRecord> Reconcile(const std::string& tx_id);
  // One blocking sweep over every pending record, concurrently. Returns the
  // number of records whose status changed.
  std::size_t ReconcilePending();

  // Runs an immediate sweep, then one every reconcile_interval. Calling it
  // again re-arms the loop instead of stacking a second one.
  void StartReconciliation();
  void StopReconciliation();
  bool IsReconciling() const;

  TransactionStats Stats() const;
  std::vector<TransactionRecord> All() const;
  QueryResult Query(const TransactionQuery& query) const;
  // Looks up by internal id or chain txId.
  std::optional<TransactionRecord> Get(const std::string& id_or_tx_id) const;
  std::optional<TransactionRecord> GetByTxId(const std::string& tx_id) const;
  std::vector<TransactionRecord> Recent(std::size_t count = 10) const;
  std::size_t PendingCount() const;

  bool Delete(const std::string& id_or_tx_id);
  void Clear();

  std::string ExportJson() const;
  // Adds records whose txId is not yet known and re-sorts newest first.
  // Returns the number added. Throws util::ValidationError on malformed input.
  std::size_t ImportJson(std::string_view text);

 private:
  enum class ReconcileResult { kUnchanged, kChanged, kMissing };

  ReconcileResult ReconcileOne(const std::string& tx_id);
  void LaunchSweepLocked();
  void OnTick(std::uint64_t generation);
  std::string ExplorerUrlLocked(const std::string& tx_id) const;
  void SortLocked();
  void PersistLocked() const;

  TransactionStore& store_;
  gateway::BlockchainGateway& gateway_;
  util::Scheduler& scheduler_;
  LedgerOptions options_;
  util::NowFn now_;

  mutable std::mutex mutex_;
  LedgerSnapshot snapshot_;
  std::string owner_address_;
  bool reconciling_{false};
  std::uint64_t tick_generation_{0};
  std::optional<util::Scheduler::TaskId> tick_task_;
  std::future<void> sweep_;
};

}  // namespace dappvault::ledger
