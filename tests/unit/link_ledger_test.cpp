#include "internal/ledger/link_ledger.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace recon;
using db::model::MatchType;
using db::model::RecordKind;

void SeedTransaction(db::Repository& repo, db::Transaction& tx, const std::string& id, util::Cents amount) {
  db::model::ExternalTransactionRecord row;
  row.id              = id;
  row.fingerprint     = "fp-" + id;
  row.posted_on       = *util::ParseDate("2024-05-01");
  row.amount_cents    = amount;
  row.description     = "E-TRANSFER";
  row.account_id      = "0228362";
  row.import_batch_id = "b1";
  const auto inserted = repo.InsertExternalTransaction(tx, row);
  assert(inserted);
}

void SeedPayment(db::Repository& repo, db::Transaction& tx, const std::string& id, util::Cents amount, std::optional<std::string> booking) {
  if (booking && !repo.GetBooking(tx, *booking)) {
    db::model::BookingRecord b;
    b.id              = *booking;
    b.total_due_cents = 100000;
    const auto inserted = repo.InsertBooking(tx, b);
    assert(inserted);
  }

  db::model::FinancialRecord r;
  r.id           = id;
  r.kind         = RecordKind::kPayment;
  r.amount_cents = amount;
  r.date         = *util::ParseDate("2024-05-01");
  r.booking_id   = std::move(booking);
  const auto inserted = repo.InsertFinancialRecord(tx, r);
  assert(inserted);
}

void TestLinkIsIdempotent() {
  auto                    repo = std::make_shared<db::memory::MemoryRepository>();
  ledger::MutationJournal journal;
  ledger::LinkLedger      ledger(repo, journal, "test", "run-1");

  auto tx = repo->Begin();
  SeedTransaction(*repo, *tx, "t1", 50000);
  SeedPayment(*repo, *tx, "p1", 50000, "X");

  const auto first  = ledger.Link(*tx, "t1", "p1", MatchType::kExactAmountDate, 0.9, 100);
  const auto second = ledger.Link(*tx, "t1", "p1", MatchType::kFuzzy, 0.5, 200);

  assert(first.created);
  assert(!second.created);
  assert(second.link_id == first.link_id);
  assert(repo->ListLinksForTransaction(*tx, "t1").size() == 1);
  assert(journal.Size() == 1);

  const auto link = repo->GetLink(*tx, first.link_id);
  assert(link->created_by == "test");
  assert(link->run_id == "run-1");
  assert(link->match_type == MatchType::kExactAmountDate);
}

void TestSecondCounterpartConflicts() {
  auto                    repo = std::make_shared<db::memory::MemoryRepository>();
  ledger::MutationJournal journal;
  ledger::LinkLedger      ledger(repo, journal, "test", "run-1");

  auto tx = repo->Begin();
  SeedTransaction(*repo, *tx, "t1", 50000);
  SeedPayment(*repo, *tx, "p1", 50000, std::nullopt);
  SeedPayment(*repo, *tx, "p2", 50000, std::nullopt);

  const auto first = ledger.Link(*tx, "t1", "p1", MatchType::kFuzzy, 0.7, 100);

  bool conflicted = false;
  try {
    ledger.Link(*tx, "t1", "p2", MatchType::kFuzzy, 0.7, 100);
  } catch (const util::AmbiguousLinkConflict& e) {
    conflicted = true;
    assert(e.TransactionId() == "t1");
    assert(e.ExistingLinkId() == first.link_id);
  }
  assert(conflicted);
  assert(repo->GetActiveLinkForTransaction(*tx, "t1")->record_id == "p1");
}

void TestLinkValidatesInputs() {
  auto                    repo = std::make_shared<db::memory::MemoryRepository>();
  ledger::MutationJournal journal;
  ledger::LinkLedger      ledger(repo, journal, "test", "run-1");

  auto tx = repo->Begin();
  SeedTransaction(*repo, *tx, "t1", 50000);

  bool not_found = false;
  try {
    ledger.Link(*tx, "t1", "missing", MatchType::kFuzzy, 0.5, 1);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  SeedPayment(*repo, *tx, "p1", 50000, std::nullopt);
  bool bad_confidence = false;
  try {
    ledger.Link(*tx, "t1", "p1", MatchType::kFuzzy, 1.5, 1);
  } catch (const std::invalid_argument&) {
    bad_confidence = true;
  }
  assert(bad_confidence);
  assert(journal.Size() == 0);
}

void TestUnlinkDetachesPaymentAndKeepsHistory() {
  auto                    repo = std::make_shared<db::memory::MemoryRepository>();
  ledger::MutationJournal journal;
  ledger::LinkLedger      ledger(repo, journal, "test", "run-1");

  auto tx = repo->Begin();
  SeedTransaction(*repo, *tx, "t1", 50000);
  SeedPayment(*repo, *tx, "p1", 50000, "X");

  const auto link   = ledger.Link(*tx, "t1", "p1", MatchType::kExactAmountDate, 0.9, 100);
  const auto result = ledger.Unlink(*tx, "t1", 200);

  assert((result.superseded_link_ids == std::vector<std::string>{link.link_id}));
  assert((result.detached_record_ids == std::vector<std::string>{"p1"}));
  assert((result.affected_booking_ids == std::vector<std::string>{"X"}));

  assert(!repo->GetActiveLinkForTransaction(*tx, "t1"));
  assert(!repo->GetFinancialRecord(*tx, "p1")->booking_id);

  const auto history = repo->ListLinksForTransaction(*tx, "t1");
  assert(history.size() == 1);
  assert(history[0].superseded);
  assert(history[0].superseded_at_ms == 200);
  assert(history[0].detached_booking_id == std::string("X"));

  // link insert, payment update, link supersede
  assert(journal.Size() == 3);

  // the transaction can be linked again after an unlink
  const auto relinked = ledger.Link(*tx, "t1", "p1", MatchType::kFuzzy, 0.6, 300);
  assert(relinked.created);
  assert(relinked.reattached_booking_id == std::string("X"));
  assert(repo->GetFinancialRecord(*tx, "p1")->booking_id == std::string("X"));

  bool not_found = false;
  try {
    ledger.Unlink(*tx, "unknown", 400);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestRelinkReattachesOnlyTheDetachedPair() {
  auto                    repo = std::make_shared<db::memory::MemoryRepository>();
  ledger::MutationJournal journal;
  ledger::LinkLedger      ledger(repo, journal, "test", "run-1");

  auto tx = repo->Begin();
  SeedTransaction(*repo, *tx, "t1", 50000);
  SeedPayment(*repo, *tx, "p1", 50000, "X");
  SeedPayment(*repo, *tx, "p2", 50000, std::nullopt);

  ledger.Link(*tx, "t1", "p1", MatchType::kExactAmountDate, 0.9, 100);
  ledger.Unlink(*tx, "t1", 200);

  // another record gets no booking from the old pair
  const auto other = ledger.Link(*tx, "t1", "p2", MatchType::kFuzzy, 0.7, 300);
  assert(other.created);
  assert(!other.reattached_booking_id);
  assert(!repo->GetFinancialRecord(*tx, "p2")->booking_id);
  assert(!repo->GetFinancialRecord(*tx, "p1")->booking_id);
  ledger.Unlink(*tx, "t1", 400);

  // a booking assigned since the unlink is kept
  auto p1       = *repo->GetFinancialRecord(*tx, "p1");
  p1.booking_id = "Y";
  const auto updated = repo->UpdateFinancialRecord(*tx, p1);
  assert(updated);

  const auto relinked = ledger.Link(*tx, "t1", "p1", MatchType::kFuzzy, 0.8, 500);
  assert(relinked.created);
  assert(!relinked.reattached_booking_id);
  assert(repo->GetFinancialRecord(*tx, "p1")->booking_id == std::string("Y"));
}

void TestReversalPairUnlinksBothSides() {
  auto                    repo = std::make_shared<db::memory::MemoryRepository>();
  ledger::MutationJournal journal;
  ledger::LinkLedger      ledger(repo, journal, "test", "run-1");

  auto tx = repo->Begin();
  SeedTransaction(*repo, *tx, "t1", 20000);
  SeedTransaction(*repo, *tx, "t2", -20000);

  const auto links = ledger.LinkReversalPair(*tx, "t1", "t2", 100);
  assert(links.size() == 2);
  assert(links[0].created && links[1].created);
  assert(repo->GetActiveLinkForTransaction(*tx, "t2")->counter_transaction_id == "t1");

  bool rejected = false;
  try {
    ledger.Link(*tx, "t1", "t2", MatchType::kReversalPair, 1.0, 100);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);

  const auto result = ledger.Unlink(*tx, "t2", 200);
  assert(result.superseded_link_ids.size() == 2);
  assert(result.detached_record_ids.empty());
  assert(!repo->GetActiveLinkForTransaction(*tx, "t1"));
  assert(!repo->GetActiveLinkForTransaction(*tx, "t2"));
}

} // namespace

int main() {
  TestLinkIsIdempotent();
  TestSecondCounterpartConflicts();
  TestLinkValidatesInputs();
  TestUnlinkDetachesPaymentAndKeepsHistory();
  TestRelinkReattachesOnlyTheDetachedPair();
  TestReversalPairUnlinksBothSides();

  std::cout << "recon_unit_link_ledger: pass\n";
  return 0;
}
