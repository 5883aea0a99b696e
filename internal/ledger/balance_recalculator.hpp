#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "mutation_journal.hpp"

namespace recon::ledger {

struct BookingBalance {
  std::string booking_id;

  util::Cents total_due_cents = 0;

  util::Cents old_paid_cents    = 0;
  util::Cents old_balance_cents = 0;
  util::Cents paid_cents        = 0;
  util::Cents balance_cents     = 0;

  // sum of charge lines; bookings without charge lines are not checked
  util::Cents charges_total_cents = 0;
  bool        has_charges         = false;
  bool        charges_consistent  = true;

  bool changed = false;
};

/*
  BalanceRecalculator

  paid    = sum of payments whose booking reference is the booking
  balance = total_due - paid

  Idempotent: the booking row is written only when a derived field
  changes. An unknown total_due throws util::IncompleteBookingError;
  it is never treated as zero.
*/
class BalanceRecalculator {
 public:
  BalanceRecalculator(std::shared_ptr<db::Repository> repository, MutationJournal& journal);

  BookingBalance Recompute(db::Transaction& tx, const std::string& booking_id, uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
  MutationJournal&                journal_;
};

} // namespace recon::ledger
