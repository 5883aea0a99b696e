#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

#if RECON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/factory.hpp"
#endif

#if RECON_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/factory.hpp"
#endif

namespace {

using recon::db::ErrorCode;
using recon::db::Repository;
using recon::db::memory::MemoryRepository;
using recon::db::model::BookingRecord;
using recon::db::model::ChargeRecord;
using recon::db::model::ExternalTransactionRecord;
using recon::db::model::FinancialRecord;
using recon::db::model::LinkRecord;
using recon::db::model::MatchType;
using recon::db::model::QuarantineRecord;
using recon::db::model::RecordKind;
using recon::util::ParseDate;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ExternalTransactionRecord BankLine(const std::string& id, const char* date, int64_t amount, const std::string& batch) {
  return ExternalTransactionRecord{.id              = id,
                                   .fingerprint     = "fp-" + id,
                                   .posted_on       = *ParseDate(date),
                                   .amount_cents    = amount,
                                   .description     = "E-TRANSFER FROM " + id,
                                   .account_id      = "0228362",
                                   .import_batch_id = batch,
                                   .source_file     = "cibc8362.csv",
                                   .counterparty    = std::nullopt,
                                   .imported_at_ms  = 1000};
}

FinancialRecord Payment(const std::string& id, const char* date, int64_t amount, std::optional<std::string> booking) {
  return FinancialRecord{.id                 = id,
                         .kind               = RecordKind::kPayment,
                         .amount_cents       = amount,
                         .date               = *ParseDate(date),
                         .description        = "CHARTER PAYMENT",
                         .booking_id         = std::move(booking),
                         .source_fingerprint = std::nullopt};
}

template <typename Row>
bool ContainsId(const std::vector<Row>& rows, const std::string& id) {
  return std::any_of(rows.begin(), rows.end(), [&](const Row& r) { return r.id == id; });
}

void VerifyExternalTransactions(Repository& repo, const std::string& prefix) {
  const auto batch = prefix + "-batch";
  auto       tx    = repo.Begin();

  auto first         = BankLine(prefix + "-t1", "2031-03-01", 20000, batch);
  first.counterparty = "JOHN SMITH";
  assert(repo.InsertExternalTransaction(*tx, first));
  assert(repo.InsertExternalTransaction(*tx, BankLine(prefix + "-t2", "2031-03-04", -4510, batch)));

  auto twin        = BankLine(prefix + "-t3", "2031-03-01", 20000, batch);
  twin.fingerprint = first.fingerprint;
  assert(repo.InsertExternalTransaction(*tx, twin).code == ErrorCode::AlreadyExists);

  auto read = repo.GetExternalTransaction(*tx, first.id);
  assert(read.has_value());
  assert(recon::util::FormatDate(read->posted_on) == "2031-03-01");
  assert(read->amount_cents == 20000);
  assert(read->counterparty == std::string("JOHN SMITH"));
  assert(!repo.GetExternalTransaction(*tx, prefix + "-t2")->counterparty);

  auto by_fingerprint = repo.FindExternalTransactionByFingerprint(*tx, first.fingerprint);
  assert(by_fingerprint.has_value() && by_fingerprint->id == first.id);
  assert(!repo.FindExternalTransactionByFingerprint(*tx, "fp-" + prefix + "-missing"));

  auto by_batch = repo.ListExternalTransactionsByBatch(*tx, batch);
  assert(by_batch.size() == 2);
  assert(by_batch[0].id == first.id);

  // inclusive on both ends
  auto in_range = repo.ListExternalTransactionsInRange(*tx, *ParseDate("2031-03-01"), *ParseDate("2031-03-03"));
  assert(ContainsId(in_range, first.id));
  assert(!ContainsId(in_range, prefix + "-t2"));

  assert(ContainsId(repo.ListUnlinkedExternalTransactions(*tx), first.id));

  assert(repo.DeleteExternalTransaction(*tx, prefix + "-t2"));
  assert(!repo.GetExternalTransaction(*tx, prefix + "-t2"));
  tx->Commit();
}

void VerifyRecordsAndBookings(Repository& repo, const std::string& prefix) {
  const auto booking_id = prefix + "-booking";
  auto       tx         = repo.Begin();

  assert(repo.InsertBooking(*tx, BookingRecord{.id = booking_id, .total_due_cents = 120000, .balance_cents = 120000, .updated_at_ms = 1}));
  assert(repo.InsertBooking(*tx, BookingRecord{.id = booking_id + "-open", .total_due_cents = std::nullopt}));

  assert(!repo.GetBooking(*tx, booking_id + "-open")->total_due_cents.has_value());

  assert(repo.InsertFinancialRecord(*tx, Payment(prefix + "-p2", "2031-03-02", 30000, booking_id)));
  assert(repo.InsertFinancialRecord(*tx, Payment(prefix + "-p1", "2031-03-02", 20000, booking_id)));
  assert(repo.InsertFinancialRecord(*tx, Payment(prefix + "-p0", "2031-03-05", 1000, std::nullopt)));

  auto payments = repo.ListPaymentsForBooking(*tx, booking_id);
  assert(payments.size() == 2);
  assert(payments[0].id == prefix + "-p1");
  assert(payments[1].id == prefix + "-p2");

  auto detached       = payments[1];
  detached.booking_id = std::nullopt;
  assert(repo.UpdateFinancialRecord(*tx, detached));
  assert(repo.ListPaymentsForBooking(*tx, booking_id).size() == 1);
  assert(!repo.GetFinancialRecord(*tx, detached.id)->booking_id);

  auto in_range = repo.ListFinancialRecordsInRange(*tx, *ParseDate("2031-03-01"), *ParseDate("2031-03-04"));
  assert(ContainsId(in_range, prefix + "-p1"));
  assert(!ContainsId(in_range, prefix + "-p0"));

  assert(repo.InsertCharge(*tx, ChargeRecord{.id = prefix + "-c1", .booking_id = booking_id, .description = "CHARTER", .amount_cents = 100000}));
  assert(repo.InsertCharge(*tx, ChargeRecord{.id = prefix + "-c2", .booking_id = booking_id, .description = "GST", .amount_cents = 20000}));
  assert(repo.ListChargesForBooking(*tx, booking_id).size() == 2);

  auto booking          = *repo.GetBooking(*tx, booking_id);
  booking.paid_cents    = 20000;
  booking.balance_cents = 100000;
  booking.updated_at_ms = 2;
  assert(repo.UpdateBooking(*tx, booking));

  auto stored = repo.GetBooking(*tx, booking_id);
  assert(stored->paid_cents == 20000);
  assert(stored->balance_cents == 100000);
  assert(stored->total_due_cents == 120000);

  assert(repo.DeleteFinancialRecord(*tx, prefix + "-p0"));
  assert(!repo.GetFinancialRecord(*tx, prefix + "-p0"));
  tx->Commit();
}

void VerifyLinkLedgerRules(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto t1 = prefix + "-lt1";
  const auto t2 = prefix + "-lt2";
  const auto p1 = prefix + "-lp1";
  const auto p2 = prefix + "-lp2";
  assert(repo.InsertExternalTransaction(*tx, BankLine(t1, "2031-04-01", 50000, prefix + "-lb")));
  assert(repo.InsertExternalTransaction(*tx, BankLine(t2, "2031-04-02", -50000, prefix + "-lb")));
  assert(repo.InsertFinancialRecord(*tx, Payment(p1, "2031-04-01", 50000, std::nullopt)));
  assert(repo.InsertFinancialRecord(*tx, Payment(p2, "2031-04-01", 50000, std::nullopt)));

  LinkRecord link{.link_id        = prefix + "-link1",
                  .transaction_id = t1,
                  .record_id      = p1,
                  .match_type     = MatchType::kExactAmountDate,
                  .confidence     = 0.8,
                  .created_at_ms  = 10,
                  .created_by     = "parity",
                  .run_id         = prefix + "-run"};
  assert(repo.InsertLink(*tx, link));

  auto second      = link;
  second.link_id   = prefix + "-link2";
  second.record_id = p2;
  assert(repo.InsertLink(*tx, second).code == ErrorCode::Conflict);

  auto active = repo.GetActiveLinkForTransaction(*tx, t1);
  assert(active.has_value());
  assert(active->record_id == p1);
  assert(active->counter_transaction_id.empty());
  assert(active->match_type == MatchType::kExactAmountDate);
  assert(repo.ListActiveLinksForRecord(*tx, p1).size() == 1);
  assert(!ContainsId(repo.ListUnlinkedExternalTransactions(*tx), t1));

  assert(repo.SupersedeLink(*tx, link.link_id, 20, std::string("booking-7")));
  assert(repo.SupersedeLink(*tx, link.link_id, 30, std::nullopt).code == ErrorCode::Conflict);
  assert(!repo.GetActiveLinkForTransaction(*tx, t1));
  assert(repo.ListActiveLinksForRecord(*tx, p1).empty());

  auto superseded = repo.GetLink(*tx, link.link_id);
  assert(superseded->superseded);
  assert(superseded->superseded_at_ms == 20);
  assert(superseded->detached_booking_id == std::string("booking-7"));

  // re-link after unlink; history keeps both rows, oldest first
  assert(repo.InsertLink(*tx, second));
  auto history = repo.ListLinksForTransaction(*tx, t1);
  assert(history.size() == 2);
  assert(history[0].link_id == link.link_id);
  assert(history[1].link_id == second.link_id);

  // reversal pair: t2 points at t1
  LinkRecord reversal{.link_id                = prefix + "-link3",
                      .transaction_id         = t2,
                      .counter_transaction_id = t1,
                      .match_type             = MatchType::kReversalPair,
                      .confidence             = 1.0,
                      .created_at_ms          = 40,
                      .created_by             = "parity",
                      .run_id                 = prefix + "-run"};
  assert(repo.InsertLink(*tx, reversal));
  assert(repo.GetActiveLinkForTransaction(*tx, t2)->counter_transaction_id == t1);

  // deleting t1 removes every link touching it and leaves t2 in place
  assert(repo.DeleteExternalTransaction(*tx, t1));
  assert(repo.ListLinksForTransaction(*tx, t1).empty());
  assert(repo.ListLinksForTransaction(*tx, t2).empty());
  assert(repo.GetExternalTransaction(*tx, t2).has_value());
  assert(repo.GetFinancialRecord(*tx, p2).has_value());
  tx->Commit();
}

void VerifyQuarantine(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  QuarantineRecord entry{.id              = prefix + "-q1",
                         .import_batch_id = prefix + "-qb",
                         .source_file     = "cibc8362.csv",
                         .line_number     = 7,
                         .reason          = "amount: missing or unparseable amount",
                         .raw_line        = "2031-05-01,DEPOSIT,,",
                         .created_at_ms   = 5};
  assert(repo.InsertQuarantine(*tx, entry));

  auto queued = repo.ListQuarantine(*tx);
  auto it     = std::find_if(queued.begin(), queued.end(), [&](const QuarantineRecord& q) { return q.id == entry.id; });
  assert(it != queued.end());
  assert(it->line_number == 7);
  assert(it->raw_line == entry.raw_line);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExternalTransaction(*tx, BankLine(prefix + "-rb", "2031-06-01", 100, prefix + "-rbb")));
    tx->Rollback();
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertExternalTransaction(*tx, BankLine(prefix + "-rb2", "2031-06-01", 200, prefix + "-rbb")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetExternalTransaction(*tx, prefix + "-rb"));
  assert(!repo.GetExternalTransaction(*tx, prefix + "-rb2"));
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& prefix, bool supports_parallel_transactions) {
  const auto booking_id = prefix + "-cc";
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, BookingRecord{.id = booking_id, .total_due_cents = 1000, .balance_cents = 1000}));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  (void)repo.ListQuarantine(*tx2); // pins the tx2 snapshot

  auto first          = *repo.GetBooking(*tx1, booking_id);
  first.paid_cents    = 400;
  first.balance_cents = 600;
  assert(repo.UpdateBooking(*tx1, first));
  tx1->Commit();

  // the later writer must lose, either at the write or at commit
  auto second          = first;
  second.paid_cents    = 900;
  second.balance_cents = 100;

  bool second_lost = false;
  if (!repo.UpdateBooking(*tx2, second)) {
    second_lost = true;
  } else {
    try {
      tx2->Commit();
    } catch (const std::exception&) {
      second_lost = true;
    }
  }
  assert(second_lost);
  tx2.reset();

  auto verify = repo.Begin();
  assert(repo.GetBooking(*verify, booking_id)->paid_cents == 400);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertExternalTransaction(*tx, BankLine(prefix + "-dt", "2031-07-01", 7700, prefix + "-db")));
    assert(repo->InsertFinancialRecord(*tx, Payment(prefix + "-dp", "2031-07-01", 7700, std::nullopt)));
    assert(repo->InsertLink(*tx, LinkRecord{.link_id        = prefix + "-dl",
                                            .transaction_id = prefix + "-dt",
                                            .record_id      = prefix + "-dp",
                                            .match_type     = MatchType::kFuzzy,
                                            .confidence     = 0.55,
                                            .created_at_ms  = 1,
                                            .created_by     = "parity",
                                            .run_id         = prefix + "-run"}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto line = repo->GetExternalTransaction(*tx, prefix + "-dt");
  assert(line.has_value());
  assert(line->amount_cents == 7700);

  auto link = repo->GetActiveLinkForTransaction(*tx, prefix + "-dt");
  assert(link.has_value());
  assert(link->record_id == prefix + "-dp");
  assert(link->confidence == 0.55);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if RECON_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("recon_integration_sqlite_" + std::to_string(recon::util::NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<recon::db::sqlite::SqliteDB>(db_path);
    recon::factory::BootstrapSqliteSchema(*db);
    return std::make_shared<recon::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if RECON_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RECON_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RECON_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<recon::db::postgres::PgPool>(conninfo);
    recon::factory::BootstrapPostgresSchema(*pool);
    return std::make_shared<recon::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a shared postgres database can be reused
  const auto prefix = backend.name + "-" + std::to_string(recon::util::NowMs());

  VerifyExternalTransactions(*repo, prefix);
  VerifyRecordsAndBookings(*repo, prefix);
  VerifyLinkLedgerRules(*repo, prefix);
  VerifyQuarantine(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyConcurrentUpdates(*repo, prefix, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RECON_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RECON_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "recon_integration_repository_parity: pass\n";
  return 0;
}
