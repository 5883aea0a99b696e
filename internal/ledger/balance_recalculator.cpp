#include "balance_recalculator.hpp"

#include "internal/db/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace recon::ledger {

BalanceRecalculator::BalanceRecalculator(std::shared_ptr<db::Repository> repository, MutationJournal& journal)
    : repository_(std::move(repository)), journal_(journal) {
}

BookingBalance BalanceRecalculator::Recompute(db::Transaction& tx, const std::string& booking_id, uint64_t now_ms) {
  auto booking = repository_->GetBooking(tx, booking_id);
  if (!booking) {
    throw util::NotFound("booking not found: " + booking_id);
  }
  if (!booking->total_due_cents) {
    throw util::IncompleteBookingError(booking_id, "booking " + booking_id + " has no total due");
  }

  BookingBalance balance;
  balance.booking_id        = booking_id;
  balance.total_due_cents   = *booking->total_due_cents;
  balance.old_paid_cents    = booking->paid_cents;
  balance.old_balance_cents = booking->balance_cents;

  for (const auto& payment : repository_->ListPaymentsForBooking(tx, booking_id)) {
    balance.paid_cents += payment.amount_cents;
  }
  balance.balance_cents = balance.total_due_cents - balance.paid_cents;

  for (const auto& charge : repository_->ListChargesForBooking(tx, booking_id)) {
    balance.charges_total_cents += charge.amount_cents;
    balance.has_charges = true;
  }
  balance.charges_consistent = !balance.has_charges || balance.charges_total_cents == balance.total_due_cents;

  balance.changed = balance.paid_cents != balance.old_paid_cents || balance.balance_cents != balance.old_balance_cents;
  if (!balance.changed) {
    return balance;
  }

  auto updated          = *booking;
  updated.paid_cents    = balance.paid_cents;
  updated.balance_cents = balance.balance_cents;
  updated.updated_at_ms = now_ms;

  db::ThrowIfDbError(repository_->UpdateBooking(tx, updated), "update booking balance");
  journal_.Updated(*booking, updated);

  RECON_LOG_INFO("booking balance recomputed", {observability::StringField("booking_id", booking_id),
                                                observability::CentsField("old_paid", balance.old_paid_cents),
                                                observability::CentsField("paid", balance.paid_cents),
                                                observability::CentsField("balance", balance.balance_cents)});
  return balance;
}

} // namespace recon::ledger
