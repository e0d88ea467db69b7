#include "ledger/transaction_ledger.hpp"

#include <algorithm>
#include <atomic>
#include <unordered_set>
#include <utility>

#include "util/csprng.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace dappvault::ledger {

namespace {

constexpr std::string_view kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr const char* kNotFoundMessage = "Transaction not found on chain";

bool Matches(const TransactionRecord& record, const std::string& id_or_tx_id) {
  return record.id == id_or_tx_id || record.tx_id == id_or_tx_id;
}

bool OwnedKind(TxKind kind) { return kind == TxKind::kSend || kind == TxKind::kExecute; }

}  // namespace

TransactionLedger::TransactionLedger(TransactionStore& store, gateway::BlockchainGateway& gateway,
                                     util::Scheduler& scheduler, LedgerOptions options,
                                     util::NowFn now)
    : store_(store),
      gateway_(gateway),
      scheduler_(scheduler),
      options_(std::move(options)),
      now_(std::move(now)) {}

TransactionLedger::~TransactionLedger() {
  StopReconciliation();
  std::future<void> sweep;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep = std::move(sweep_);
  }
  if (sweep.valid()) {
    sweep.wait();
  }
}

void TransactionLedger::Load() {
  LedgerSnapshot snapshot;
  std::string error;
  if (!store_.Load(&snapshot, &error)) {
    util::LogError("ledger", "failed to load " + store_.path().string() + ": " + error);
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = std::move(snapshot);
  SortLocked();
  util::LogInfo("ledger", "loaded " + std::to_string(snapshot_.records.size()) + " transactions");
}

void TransactionLedger::SetOwner(const std::string& address, const std::string& network) {
  std::lock_guard<std::mutex> lock(mutex_);
  owner_address_ = address;
  bool changed = snapshot_.network != network;
  snapshot_.network = network;
  for (auto& record : snapshot_.records) {
    if (!record.from && OwnedKind(record.kind) && !address.empty()) {
      record.from = address;
      changed = true;
    }
  }
  if (changed) {
    PersistLocked();
  }
}

std::string TransactionLedger::ExplorerUrlLocked(const std::string& tx_id) const {
  const auto& base =
      snapshot_.network == "mainnet" ? options_.mainnet_explorer : options_.testnet_explorer;
  return base + "/" + tx_id;
}

TransactionRecord TransactionLedger::RecordSubmission(TransactionSubmission submission) {
  if (submission.tx_id.empty()) {
    throw util::ValidationError("transaction id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& existing : snapshot_.records) {
    if (existing.tx_id == submission.tx_id) {
      util::LogWarn("ledger", "transaction " + submission.tx_id + " already recorded");
      return existing;
    }
  }
  TransactionRecord record;
  record.timestamp = now_();
  record.id = "tx_" + std::to_string(record.timestamp) + "_" + util::SecureRandomString(9, kBase36);
  record.tx_id = std::move(submission.tx_id);
  record.kind = submission.kind;
  record.program_id = std::move(submission.program_id);
  record.function_name = std::move(submission.function_name);
  record.from = std::move(submission.from);
  if (!record.from && OwnedKind(record.kind) && !owner_address_.empty()) {
    record.from = owner_address_;
  }
  record.to = std::move(submission.to);
  record.amount = submission.amount;
  record.fee = submission.fee;
  record.memo = std::move(submission.memo);
  record.status = TxStatus::kPending;
  record.explorer_url = ExplorerUrlLocked(record.tx_id);

  snapshot_.records.insert(snapshot_.records.begin(), record);
  PersistLocked();
  util::LogInfo("ledger", std::string("recorded ") + TxKindName(record.kind) + " " + record.tx_id);
  return record;
}

TransactionRecord TransactionLedger::RecordSend(const std::string& tx_id, const std::string& to,
                                                std::int64_t amount, std::int64_t fee,
                                                std::optional<std::string> memo) {
  TransactionSubmission submission;
  submission.tx_id = tx_id;
  submission.kind = TxKind::kSend;
  submission.to = to;
  submission.amount = amount;
  submission.fee = fee;
  submission.memo = std::move(memo);
  return RecordSubmission(std::move(submission));
}

TransactionRecord TransactionLedger::RecordExecution(const std::string& tx_id,
                                                     const std::string& program_id,
                                                     const std::string& function_name,
                                                     std::int64_t fee) {
  TransactionSubmission submission;
  submission.tx_id = tx_id;
  submission.kind = TxKind::kExecute;
  submission.program_id = program_id;
  submission.function_name = function_name;
  submission.fee = fee;
  return RecordSubmission(std::move(submission));
}

TransactionLedger::ReconcileResult TransactionLedger::ReconcileOne(const std::string& tx_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(snapshot_.records.begin(), snapshot_.records.end(),
                                 [&](const auto& r) { return r.tx_id == tx_id; });
    if (it == snapshot_.records.end()) {
      return ReconcileResult::kMissing;
    }
    if (it->status != TxStatus::kPending) {
      return ReconcileResult::kUnchanged;
    }
  }

  gateway::TransactionStatus status;
  try {
    status = gateway_.GetTransactionStatus(tx_id);
  } catch (const util::NetworkError& ex) {
    util::LogDebug("ledger", "status check for " + tx_id + " deferred: " + ex.what());
    return ReconcileResult::kUnchanged;
  } catch (const util::Error& ex) {
    util::LogWarn("ledger", "status check for " + tx_id + " failed: " + ex.what());
    return ReconcileResult::kUnchanged;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(snapshot_.records.begin(), snapshot_.records.end(),
                         [&](const auto& r) { return r.tx_id == tx_id; });
  if (it == snapshot_.records.end()) {
    return ReconcileResult::kMissing;
  }
  auto& record = *it;
  if (record.status != TxStatus::kPending) {
    return ReconcileResult::kUnchanged;
  }
  if (!status.found) {
    if (now_() - record.timestamp > options_.not_found_grace.count()) {
      record.status = TxStatus::kFailed;
      record.error = kNotFoundMessage;
      PersistLocked();
      util::LogInfo("ledger", "transaction " + tx_id + " failed: not found on chain");
      return ReconcileResult::kChanged;
    }
    return ReconcileResult::kUnchanged;
  }

  bool changed = false;
  const auto next = ClassifyChainStatus(status.status);
  if (next != record.status) {
    record.status = next;
    if (next == TxStatus::kFailed) {
      record.error = "Transaction " + status.status;
    }
    changed = true;
  }
  if (status.block_height && record.block_height != status.block_height) {
    record.block_height = status.block_height;
    snapshot_.last_synced_block_height =
        std::max(snapshot_.last_synced_block_height, *status.block_height);
    changed = true;
  }
  if (status.confirmations && record.confirmations != status.confirmations) {
    record.confirmations = status.confirmations;
    changed = true;
  }
  if (status.fee && record.fee != status.fee) {
    record.fee = status.fee;
    changed = true;
  }
  if (changed) {
    PersistLocked();
    util::LogInfo("ledger", "transaction " + tx_id + " is " + TxStatusName(record.status));
  }
  return changed ? ReconcileResult::kChanged : ReconcileResult::kUnchanged;
}

std::optional<TransactionRecord> TransactionLedger::Reconcile(const std::string& tx_id) {
  if (ReconcileOne(tx_id) == ReconcileResult::kMissing) {
    return std::nullopt;
  }
  return GetByTxId(tx_id);
}

std::size_t TransactionLedger::ReconcilePending() {
  std::vector<std::string> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : snapshot_.records) {
      if (record.status == TxStatus::kPending) {
        pending.push_back(record.tx_id);
      }
    }
  }
  // A fixed set of workers drains the list; a slow query holds up only its own worker.
  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> changed{0};
  const auto drain = [this, &pending, &next, &changed] {
    for (auto i = next.fetch_add(1); i < pending.size(); i = next.fetch_add(1)) {
      try {
        if (ReconcileOne(pending[i]) == ReconcileResult::kChanged) {
          ++changed;
        }
      } catch (const std::exception& ex) {
        util::LogError("ledger", "reconciliation of " + pending[i] + " failed: " + ex.what());
      }
    }
  };
  const auto worker_count =
      std::min(pending.size(), std::max<std::size_t>(options_.reconcile_workers, 1));
  std::vector<std::future<void>> workers;
  workers.reserve(worker_count);
  for (std::size_t w = 0; w < worker_count; ++w) {
    workers.push_back(std::async(std::launch::async, drain));
  }
  for (auto& worker : workers) {
    worker.get();
  }
  return changed.load();
}

void TransactionLedger::LaunchSweepLocked() {
  if (sweep_.valid() &&
      sweep_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    util::LogDebug("ledger", "previous sweep still running; skipping tick");
    return;
  }
  sweep_ = std::async(std::launch::async, [this] {
    try {
      ReconcilePending();
    } catch (const std::exception& ex) {
      util::LogError("ledger", std::string("sweep failed: ") + ex.what());
    }
  });
}

void TransactionLedger::StartReconciliation() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (tick_task_) {
    scheduler_.Cancel(*tick_task_);
  }
  reconciling_ = true;
  const auto generation = ++tick_generation_;
  LaunchSweepLocked();
  tick_task_ = scheduler_.Schedule(options_.reconcile_interval,
                                   [this, generation] { OnTick(generation); });
}

void TransactionLedger::StopReconciliation() {
  std::lock_guard<std::mutex> lock(mutex_);
  reconciling_ = false;
  ++tick_generation_;
  if (tick_task_) {
    scheduler_.Cancel(*tick_task_);
    tick_task_.reset();
  }
}

bool TransactionLedger::IsReconciling() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reconciling_;
}

void TransactionLedger::OnTick(std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reconciling_ || generation != tick_generation_) {
    return;
  }
  LaunchSweepLocked();
  tick_task_ = scheduler_.Schedule(options_.reconcile_interval,
                                   [this, generation] { OnTick(generation); });
}

TransactionStats TransactionLedger::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  TransactionStats stats;
  stats.total = snapshot_.records.size();
  for (const auto& record : snapshot_.records) {
    switch (record.status) {
      case TxStatus::kPending:
        ++stats.pending;
        break;
      case TxStatus::kConfirmed:
        ++stats.confirmed;
        break;
      case TxStatus::kFailed:
        ++stats.failed;
        break;
    }
    if (record.status != TxStatus::kConfirmed) {
      continue;
    }
    if (record.amount) {
      if (record.kind == TxKind::kSend) {
        stats.total_sent += *record.amount;
      } else if (record.kind == TxKind::kReceive) {
        stats.total_received += *record.amount;
      }
    }
    if (record.fee) {
      stats.total_fees += *record.fee;
    }
  }
  return stats;
}

std::vector<TransactionRecord> TransactionLedger::All() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_.records;
}

QueryResult TransactionLedger::Query(const TransactionQuery& query) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const TransactionRecord*> filtered;
  for (const auto& record : snapshot_.records) {
    if (query.kind && record.kind != *query.kind) continue;
    if (query.status && record.status != *query.status) continue;
    filtered.push_back(&record);
  }
  QueryResult result;
  result.total = filtered.size();
  for (std::size_t i = query.offset; i < filtered.size() && i - query.offset < query.limit; ++i) {
    result.records.push_back(*filtered[i]);
  }
  result.has_more =
      query.offset < result.total && result.total - query.offset > query.limit;
  return result;
}

std::optional<TransactionRecord> TransactionLedger::Get(const std::string& id_or_tx_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& record : snapshot_.records) {
    if (Matches(record, id_or_tx_id)) {
      return record;
    }
  }
  return std::nullopt;
}

std::optional<TransactionRecord> TransactionLedger::GetByTxId(const std::string& tx_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& record : snapshot_.records) {
    if (record.tx_id == tx_id) {
      return record;
    }
  }
  return std::nullopt;
}

std::vector<TransactionRecord> TransactionLedger::Recent(std::size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto n = std::min(count, snapshot_.records.size());
  return std::vector<TransactionRecord>(snapshot_.records.begin(),
                                        snapshot_.records.begin() + static_cast<std::ptrdiff_t>(n));
}

std::size_t TransactionLedger::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(snapshot_.records.begin(), snapshot_.records.end(),
                    [](const auto& r) { return r.status == TxStatus::kPending; }));
}

bool TransactionLedger::Delete(const std::string& id_or_tx_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(snapshot_.records.begin(), snapshot_.records.end(),
                         [&](const auto& r) { return Matches(r, id_or_tx_id); });
  if (it == snapshot_.records.end()) {
    return false;
  }
  snapshot_.records.erase(it);
  PersistLocked();
  return true;
}

void TransactionLedger::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_.records.clear();
  PersistLocked();
  util::LogInfo("ledger", "transaction history cleared");
}

std::string TransactionLedger::ExportJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json json{{"network", snapshot_.network}, {"exportedAt", now_()}};
  json["transactions"] = nlohmann::json::array();
  for (const auto& record : snapshot_.records) {
    json["transactions"].push_back(RecordToJson(record));
  }
  return json.dump(2);
}

std::size_t TransactionLedger::ImportJson(std::string_view text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw util::ValidationError(std::string("invalid transaction export: ") + ex.what());
  }
  const nlohmann::json* items = &json;
  if (json.is_object() && json.contains("transactions")) {
    items = &json.at("transactions");
  }
  if (!items->is_array()) {
    throw util::ValidationError("invalid transaction export: expected a transactions array");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_set<std::string> known;
  for (const auto& record : snapshot_.records) {
    known.insert(record.tx_id);
  }
  std::size_t added = 0;
  for (const auto& item : *items) {
    TransactionRecord record;
    std::string error;
    if (!RecordFromJson(item, &record, &error)) {
      util::LogWarn("ledger", "skipping imported entry: " + error);
      continue;
    }
    if (!known.insert(record.tx_id).second) {
      continue;
    }
    if (record.explorer_url.empty()) {
      record.explorer_url = ExplorerUrlLocked(record.tx_id);
    }
    snapshot_.records.push_back(std::move(record));
    ++added;
  }
  if (added > 0) {
    SortLocked();
    PersistLocked();
  }
  util::LogInfo("ledger", "imported " + std::to_string(added) + " transactions");
  return added;
}

void TransactionLedger::SortLocked() {
  std::stable_sort(snapshot_.records.begin(), snapshot_.records.end(),
                   [](const auto& a, const auto& b) { return a.timestamp > b.timestamp; });
}

void TransactionLedger::PersistLocked() const { store_.Save(snapshot_); }

}  // namespace dappvault::ledger
