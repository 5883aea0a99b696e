#include "internal/ledger/balance_recalculator.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/link_ledger.hpp"
#include "internal/match/candidate_generator.hpp"
#include "internal/match/resolver.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace recon;
using db::model::RecordKind;

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo = std::make_shared<db::memory::MemoryRepository>();
  std::unique_ptr<db::Transaction>              tx   = repo->Begin();
  ledger::MutationJournal                       journal;

  void Booking(const std::string& id, std::optional<util::Cents> total_due) {
    db::model::BookingRecord b;
    b.id              = id;
    b.total_due_cents = total_due;
    b.balance_cents   = total_due.value_or(0);
    const auto r      = repo->InsertBooking(*tx, b);
    assert(r);
  }

  void Payment(const std::string& id, util::Cents amount, std::optional<std::string> booking) {
    db::model::FinancialRecord p;
    p.id           = id;
    p.kind         = RecordKind::kPayment;
    p.amount_cents = amount;
    p.date         = *util::ParseDate("2024-05-01");
    p.description  = "CHARTER PAYMENT";
    p.booking_id   = std::move(booking);
    const auto r   = repo->InsertFinancialRecord(*tx, p);
    assert(r);
  }

  void Charge(const std::string& id, const std::string& booking, util::Cents amount) {
    db::model::ChargeRecord c;
    c.id           = id;
    c.booking_id   = booking;
    c.amount_cents = amount;
    const auto r   = repo->InsertCharge(*tx, c);
    assert(r);
  }

  void BankLine(const std::string& id, util::Cents amount) {
    db::model::ExternalTransactionRecord t;
    t.id           = id;
    t.fingerprint  = "fp-" + id;
    t.posted_on    = *util::ParseDate("2024-05-01");
    t.amount_cents = amount;
    t.description  = "DEPOSIT";
    t.account_id   = "0228362";
    const auto r   = repo->InsertExternalTransaction(*tx, t);
    assert(r);
  }
};

// match, link, recompute: the payment reaches the booking balance
void TestLinkedPaymentMovesTheBalance() {
  Fixture f;
  f.Booking("X", 120000);
  f.Payment("p1", 50000, "X");
  f.BankLine("t1", 50000);

  match::MatchPolicy        policy;
  match::CandidateGenerator generator(policy);
  match::Resolver           resolver(policy);

  const auto line = *f.repo->GetExternalTransaction(*f.tx, "t1");
  const auto [from, to] = generator.PoolWindow(line);
  const auto outcome = resolver.Resolve(line, generator.Candidates(line, f.repo->ListFinancialRecordsInRange(*f.tx, from, to), {}));
  assert(outcome.kind == match::OutcomeKind::kSingleMatch);

  ledger::LinkLedger ledger(f.repo, f.journal, "test", "run-1");
  ledger.Link(*f.tx, "t1", outcome.record->id, outcome.match_type, outcome.confidence, 2);

  ledger::BalanceRecalculator recalculator(f.repo, f.journal);

  const auto after = recalculator.Recompute(*f.tx, "X", 3);
  assert(after.changed);
  assert(after.paid_cents == after.old_paid_cents + 50000);
  assert(after.balance_cents == after.old_balance_cents - 50000);
  assert(after.balance_cents == 70000);

  const auto stored = f.repo->GetBooking(*f.tx, "X");
  assert(stored->paid_cents == 50000);
  assert(stored->balance_cents == 70000);
}

// unlink, recompute: paid drops by exactly the detached amount
void TestUnlinkReducesPaid() {
  Fixture f;
  f.Booking("X", 120000);
  f.Payment("p1", 50000, "X");
  f.Payment("p2", 20000, "X");
  f.BankLine("t1", 50000);

  ledger::BalanceRecalculator recalculator(f.repo, f.journal);
  ledger::LinkLedger          ledger(f.repo, f.journal, "test", "run-1");

  ledger.Link(*f.tx, "t1", "p1", db::model::MatchType::kExactAmountDate, 0.9, 1);
  const auto linked = recalculator.Recompute(*f.tx, "X", 2);
  assert(linked.paid_cents == 70000);

  const auto unlinked = ledger.Unlink(*f.tx, "t1", 3);
  assert(unlinked.affected_booking_ids.at(0) == "X");

  const auto after = recalculator.Recompute(*f.tx, "X", 4);
  assert(after.paid_cents == linked.paid_cents - 50000);
  assert(after.balance_cents == 100000);
}

// unlink, relink the same pair, recompute: paid is back where it was
void TestRelinkRestoresPaid() {
  Fixture f;
  f.Booking("X", 120000);
  f.Payment("p1", 50000, "X");
  f.BankLine("t1", 50000);

  ledger::BalanceRecalculator recalculator(f.repo, f.journal);
  ledger::LinkLedger          ledger(f.repo, f.journal, "test", "run-1");

  ledger.Link(*f.tx, "t1", "p1", db::model::MatchType::kExactAmountDate, 0.9, 1);
  const auto linked = recalculator.Recompute(*f.tx, "X", 2);
  assert(linked.paid_cents == 50000);

  ledger.Unlink(*f.tx, "t1", 3);
  assert(recalculator.Recompute(*f.tx, "X", 4).paid_cents == 0);

  const auto relinked = ledger.Link(*f.tx, "t1", "p1", db::model::MatchType::kFuzzy, 0.8, 5);
  assert(relinked.reattached_booking_id == std::string("X"));

  const auto restored = recalculator.Recompute(*f.tx, "X", 6);
  assert(restored.changed);
  assert(restored.paid_cents == linked.paid_cents);
  assert(restored.balance_cents == linked.balance_cents);
}

void TestRecomputeIsIdempotent() {
  Fixture f;
  f.Booking("X", 30000);
  f.Payment("p1", 10000, "X");

  ledger::BalanceRecalculator recalculator(f.repo, f.journal);

  const auto first = recalculator.Recompute(*f.tx, "X", 1);
  assert(first.changed);
  const auto journaled = f.journal.Size();

  const auto second = recalculator.Recompute(*f.tx, "X", 2);
  assert(!second.changed);
  assert(second.paid_cents == first.paid_cents);
  assert(f.journal.Size() == journaled);
  assert(f.repo->GetBooking(*f.tx, "X")->updated_at_ms == 1);
}

void TestUnknownTotalIsNeverZero() {
  Fixture f;
  f.Booking("Y", std::nullopt);
  f.Payment("p1", 10000, "Y");

  ledger::BalanceRecalculator recalculator(f.repo, f.journal);

  bool incomplete = false;
  try {
    recalculator.Recompute(*f.tx, "Y", 1);
  } catch (const util::IncompleteBookingError& e) {
    incomplete = true;
    assert(e.BookingId() == "Y");
  }
  assert(incomplete);
  assert(f.repo->GetBooking(*f.tx, "Y")->paid_cents == 0);

  bool not_found = false;
  try {
    recalculator.Recompute(*f.tx, "nope", 1);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestChargeConsistency() {
  Fixture f;
  f.Booking("X", 30000);
  f.Charge("c1", "X", 25000);
  f.Charge("c2", "X", 5000);
  f.Booking("Z", 30000);
  f.Charge("c3", "Z", 25000);
  f.Booking("W", 30000);

  ledger::BalanceRecalculator recalculator(f.repo, f.journal);

  const auto x = recalculator.Recompute(*f.tx, "X", 1);
  assert(x.has_charges && x.charges_consistent);

  const auto z = recalculator.Recompute(*f.tx, "Z", 1);
  assert(!z.charges_consistent);
  assert(z.charges_total_cents == 25000);

  const auto w = recalculator.Recompute(*f.tx, "W", 1);
  assert(!w.has_charges && w.charges_consistent);
}

} // namespace

int main() {
  TestLinkedPaymentMovesTheBalance();
  TestUnlinkReducesPaid();
  TestRelinkRestoresPaid();
  TestRecomputeIsIdempotent();
  TestUnknownTotalIsNeverZero();
  TestChargeConsistency();

  std::cout << "recon_unit_balance_recalculator: pass\n";
  return 0;
}
