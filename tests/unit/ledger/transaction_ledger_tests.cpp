#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "../support/fake_gateway.hpp"
#include "../support/temp_dir.hpp"
#include "ledger/transaction_ledger.hpp"
#include "ledger/transaction_store.hpp"
#include "util/errors.hpp"
#include "util/scheduler.hpp"

using namespace std::chrono_literals;
using dappvault::ledger::LedgerOptions;
using dappvault::ledger::TransactionLedger;
using dappvault::ledger::TransactionQuery;
using dappvault::ledger::TransactionStore;
using dappvault::ledger::TxKind;
using dappvault::ledger::TxStatus;
using dappvault::test::FakeGateway;
using dappvault::test::ScopedTempDir;
using dappvault::test::kFakeAddress;
using dappvault::test::kRecipient;

namespace {

constexpr std::int64_t kStart = 1700000000000;
constexpr std::int64_t kMinute = 60 * 1000;

struct Harness {
  explicit Harness(const std::string& tag, LedgerOptions options = {})
      : dir(tag),
        store(dir.path() / "transactions.json"),
        ledger(store, gateway, scheduler, options, [this] { return clock.load(); }) {}
  // Timer callbacks must not outlive the ledger they point at.
  ~Harness() { scheduler.Stop(); }

  ScopedTempDir dir;
  std::atomic<std::int64_t> clock{kStart};
  dappvault::util::Scheduler scheduler;
  FakeGateway gateway;
  TransactionStore store;
  TransactionLedger ledger;
};

dappvault::gateway::TransactionStatus ChainStatus(const std::string& status,
                                                  std::optional<std::uint64_t> height = {}) {
  dappvault::gateway::TransactionStatus out;
  out.found = true;
  out.status = status;
  out.block_height = height;
  return out;
}

bool TestRecordSubmission() {
  Harness h("ledger_record");
  h.ledger.SetOwner(kFakeAddress, "testnet");
  const auto record = h.ledger.RecordSend("at1abc", kRecipient, 10 * 1000000, 100000, "rent");
  if (record.status != TxStatus::kPending || record.kind != TxKind::kSend ||
      record.from != kFakeAddress || record.to != kRecipient || record.memo != "rent" ||
      record.timestamp != kStart ||
      record.explorer_url != "https://explorer.aleo.org/transaction/at1abc") {
    std::cerr << "transaction_ledger_tests: recorded send has wrong fields\n";
    return false;
  }
  const std::string prefix = "tx_" + std::to_string(kStart) + "_";
  if (record.id.rfind(prefix, 0) != 0 || record.id.size() != prefix.size() + 9) {
    std::cerr << "transaction_ledger_tests: unexpected record id " << record.id << "\n";
    return false;
  }
  const auto duplicate = h.ledger.RecordSend("at1abc", kRecipient, 1, 1);
  if (duplicate.id != record.id || h.ledger.All().size() != 1) {
    std::cerr << "transaction_ledger_tests: duplicate txId must not add a record\n";
    return false;
  }
  try {
    h.ledger.RecordSend("", kRecipient, 1, 1);
    std::cerr << "transaction_ledger_tests: empty txId accepted\n";
    return false;
  } catch (const dappvault::util::ValidationError&) {
  }

  h.clock += 1000;
  const auto exec = h.ledger.RecordExecution("at1def", "token.aleo", "mint", 250000);
  if (h.ledger.Recent(1).front().id != exec.id || exec.program_id != "token.aleo") {
    std::cerr << "transaction_ledger_tests: newest record should come first\n";
    return false;
  }

  TransactionStore reopened_store(h.store.path());
  TransactionLedger reopened(reopened_store, h.gateway, h.scheduler);
  reopened.Load();
  if (reopened.All().size() != 2 || !reopened.GetByTxId("at1abc") || !reopened.Get(exec.id)) {
    std::cerr << "transaction_ledger_tests: records not persisted\n";
    return false;
  }
  return true;
}

bool TestOwnerBackfill() {
  Harness h("ledger_owner");
  h.ledger.RecordExecution("at1early", "token.aleo", "mint", 0);
  if (h.ledger.GetByTxId("at1early")->from) {
    std::cerr << "transaction_ledger_tests: no owner known yet\n";
    return false;
  }
  h.ledger.SetOwner(kFakeAddress, "mainnet");
  const auto record = h.ledger.GetByTxId("at1early");
  if (record->from != kFakeAddress) {
    std::cerr << "transaction_ledger_tests: owner not back-filled\n";
    return false;
  }
  if (h.ledger.RecordSend("at1late", kRecipient, 1, 0).explorer_url !=
      "https://explorer.aleo.org/transaction/at1late") {
    std::cerr << "transaction_ledger_tests: mainnet explorer url wrong\n";
    return false;
  }
  return true;
}

bool TestReconcileConfirmsAndStats() {
  Harness h("ledger_confirm");
  h.ledger.RecordSend("at1ok", kRecipient, 10 * 1000000, 100000);
  h.ledger.RecordSend("at1bad", kRecipient, 3 * 1000000, 100000);
  h.gateway.SetStatus("at1ok", ChainStatus("Accepted", 4242));
  h.gateway.SetStatus("at1bad", ChainStatus("rejected"));

  const auto ok = h.ledger.Reconcile("at1ok");
  if (!ok || ok->status != TxStatus::kConfirmed || ok->block_height != 4242u) {
    std::cerr << "transaction_ledger_tests: accepted transaction not confirmed\n";
    return false;
  }
  const auto bad = h.ledger.Reconcile("at1bad");
  if (!bad || bad->status != TxStatus::kFailed || bad->error != "Transaction rejected") {
    std::cerr << "transaction_ledger_tests: rejected transaction not failed\n";
    return false;
  }
  const auto queries = h.gateway.status_queries.load();
  h.ledger.Reconcile("at1ok");
  if (h.gateway.status_queries != queries) {
    std::cerr << "transaction_ledger_tests: settled records must not be re-queried\n";
    return false;
  }
  if (h.ledger.Reconcile("at1unknown")) {
    std::cerr << "transaction_ledger_tests: unknown txId should yield nullopt\n";
    return false;
  }

  const auto stats = h.ledger.Stats();
  if (stats.total != 2 || stats.confirmed != 1 || stats.failed != 1 || stats.pending != 0 ||
      stats.total_sent != 10 * 1000000 || stats.total_fees != 100000 ||
      stats.total_received != 0) {
    std::cerr << "transaction_ledger_tests: stats should count confirmed records only\n";
    return false;
  }
  return true;
}

bool TestNotFoundGrace() {
  Harness h("ledger_not_found");
  h.ledger.RecordSend("at1ghost", kRecipient, 1000000, 0);
  h.clock = kStart + 5 * kMinute;
  if (h.ledger.Reconcile("at1ghost")->status != TxStatus::kPending) {
    std::cerr << "transaction_ledger_tests: unknown tx failed inside the grace period\n";
    return false;
  }
  h.gateway.unreachable.insert("at1ghost");
  h.clock = kStart + 11 * kMinute;
  if (h.ledger.Reconcile("at1ghost")->status != TxStatus::kPending) {
    std::cerr << "transaction_ledger_tests: network failure must leave the record pending\n";
    return false;
  }
  h.gateway.unreachable.clear();
  const auto record = h.ledger.Reconcile("at1ghost");
  if (record->status != TxStatus::kFailed || record->error != "Transaction not found on chain") {
    std::cerr << "transaction_ledger_tests: unknown tx should fail after the grace period\n";
    return false;
  }
  return true;
}

bool TestSweepAndLoop() {
  LedgerOptions options;
  options.reconcile_interval = 30ms;
  Harness h("ledger_sweep", options);
  h.ledger.RecordSend("at1a", kRecipient, 1, 0);
  h.ledger.RecordSend("at1b", kRecipient, 1, 0);
  h.ledger.RecordSend("at1c", kRecipient, 1, 0);
  h.gateway.SetStatus("at1a", ChainStatus("finalized", 10));
  h.gateway.SetStatus("at1b", ChainStatus("aborted"));
  if (h.ledger.ReconcilePending() != 2 || h.ledger.PendingCount() != 1) {
    std::cerr << "transaction_ledger_tests: sweep should settle two records\n";
    return false;
  }

  h.ledger.StartReconciliation();
  h.ledger.StartReconciliation();
  h.gateway.SetStatus("at1c", ChainStatus("confirmed", 11));
  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (h.ledger.PendingCount() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  if (h.ledger.PendingCount() != 0 || !h.ledger.IsReconciling()) {
    std::cerr << "transaction_ledger_tests: reconciliation loop did not settle the record\n";
    return false;
  }
  h.ledger.StopReconciliation();
  if (h.ledger.IsReconciling()) {
    std::cerr << "transaction_ledger_tests: loop still marked running after stop\n";
    return false;
  }
  return true;
}

bool TestSweepBoundsConcurrency() {
  LedgerOptions options;
  options.reconcile_workers = 4;
  Harness h("ledger_sweep_pool", options);
  for (int i = 0; i < 40; ++i) {
    const auto tx_id = "at1pool" + std::to_string(i);
    h.ledger.RecordSend(tx_id, kRecipient, 1, 0);
    h.gateway.SetStatus(tx_id, ChainStatus("accepted", 5));
  }
  h.gateway.status_delay = 20ms;
  if (h.ledger.ReconcilePending() != 40 || h.ledger.PendingCount() != 0) {
    std::cerr << "transaction_ledger_tests: pooled sweep should settle every record\n";
    return false;
  }
  if (h.gateway.peak_status_in_flight > 4 || h.gateway.peak_status_in_flight < 2) {
    std::cerr << "transaction_ledger_tests: sweep ran " << h.gateway.peak_status_in_flight
              << " status queries at once, expected at most 4\n";
    return false;
  }
  return true;
}

bool TestQueryDeleteClear() {
  Harness h("ledger_query");
  for (int i = 0; i < 5; ++i) {
    h.clock += 1000;
    h.ledger.RecordSend("at1s" + std::to_string(i), kRecipient, 1, 0);
  }
  h.clock += 1000;
  h.ledger.RecordExecution("at1x", "token.aleo", "mint", 0);

  TransactionQuery query;
  query.kind = TxKind::kSend;
  query.limit = 2;
  auto page = h.ledger.Query(query);
  if (page.total != 5 || page.records.size() != 2 || !page.has_more ||
      page.records[0].tx_id != "at1s4") {
    std::cerr << "transaction_ledger_tests: first page wrong\n";
    return false;
  }
  query.offset = 4;
  page = h.ledger.Query(query);
  if (page.records.size() != 1 || page.has_more || page.records[0].tx_id != "at1s0") {
    std::cerr << "transaction_ledger_tests: last page wrong\n";
    return false;
  }
  query.offset = 1;
  query.limit = SIZE_MAX;
  page = h.ledger.Query(query);
  if (page.records.size() != 4 || page.has_more) {
    std::cerr << "transaction_ledger_tests: unbounded page must not report more\n";
    return false;
  }
  TransactionQuery by_status;
  by_status.status = TxStatus::kConfirmed;
  if (h.ledger.Query(by_status).total != 0) {
    std::cerr << "transaction_ledger_tests: status filter wrong\n";
    return false;
  }

  const auto id = h.ledger.GetByTxId("at1s2")->id;
  if (!h.ledger.Delete(id) || h.ledger.Delete(id) || !h.ledger.Delete("at1s3") ||
      h.ledger.All().size() != 4) {
    std::cerr << "transaction_ledger_tests: delete by id or txId failed\n";
    return false;
  }
  h.ledger.Clear();
  if (!h.ledger.All().empty() || h.ledger.Stats().total != 0) {
    std::cerr << "transaction_ledger_tests: clear left records behind\n";
    return false;
  }
  return true;
}

bool TestExportImport() {
  std::string exported;
  {
    Harness h("ledger_export");
    h.ledger.RecordSend("at1one", kRecipient, 1, 0);
    h.clock += 1000;
    h.ledger.RecordSend("at1two", kRecipient, 2, 0);
    exported = h.ledger.ExportJson();
  }
  Harness h("ledger_import");
  h.ledger.RecordSend("at1one", kRecipient, 1, 0);
  if (h.ledger.ImportJson(exported) != 1 || h.ledger.ImportJson(exported) != 0 ||
      h.ledger.All().size() != 2) {
    std::cerr << "transaction_ledger_tests: import must skip known txIds\n";
    return false;
  }
  const auto bare = nlohmann::json::array({{{"id", "tx_1_abc"},
                                            {"txId", "at1bare"},
                                            {"type", "receive"},
                                            {"status", "confirmed"},
                                            {"timestamp", 1},
                                            {"amount", 5}}});
  if (h.ledger.ImportJson(bare.dump()) != 1 ||
      h.ledger.GetByTxId("at1bare")->explorer_url.empty() ||
      h.ledger.All().back().tx_id != "at1bare") {
    std::cerr << "transaction_ledger_tests: bare array import failed\n";
    return false;
  }
  try {
    h.ledger.ImportJson("{\"transactions\": 3}");
    std::cerr << "transaction_ledger_tests: malformed import accepted\n";
    return false;
  } catch (const dappvault::util::ValidationError&) {
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestRecordSubmission()) {
      return EXIT_FAILURE;
    }
    if (!TestOwnerBackfill()) {
      return EXIT_FAILURE;
    }
    if (!TestReconcileConfirmsAndStats()) {
      return EXIT_FAILURE;
    }
    if (!TestNotFoundGrace()) {
      return EXIT_FAILURE;
    }
    if (!TestSweepAndLoop()) {
      return EXIT_FAILURE;
    }
    if (!TestSweepBoundsConcurrency()) {
      return EXIT_FAILURE;
    }
    if (!TestQueryDeleteClear()) {
      return EXIT_FAILURE;
    }
    if (!TestExportImport()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "transaction_ledger_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
