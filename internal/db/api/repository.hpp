#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/charge_record.hpp"
#include "internal/db/model/external_transaction_record.hpp"
#include "internal/db/model/financial_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/quarantine_record.hpp"

namespace recon::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - At most one non-superseded link per external transaction
    (InsertLink returns Conflict otherwise)
  - External transaction fingerprints are unique
    (InsertExternalTransaction returns AlreadyExists otherwise)
  - Deleting a transaction or record deletes the links touching it,
    never the other endpoint

  List results are ordered deterministically (date, then id) so that
  preview and apply see the same sequence.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // External transactions (bank feed)
  // ---------------------------------------------------------------------

  virtual Result InsertExternalTransaction(Transaction&, const model::ExternalTransactionRecord&) = 0;

  virtual std::optional<model::ExternalTransactionRecord> GetExternalTransaction(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ExternalTransactionRecord> FindExternalTransactionByFingerprint(Transaction&, const std::string& fingerprint) = 0;

  // Transactions without a non-superseded link.
  virtual std::vector<model::ExternalTransactionRecord> ListUnlinkedExternalTransactions(Transaction&) = 0;

  // Inclusive range on posted_on.
  virtual std::vector<model::ExternalTransactionRecord> ListExternalTransactionsInRange(Transaction&, util::Date from, util::Date to) = 0;

  virtual std::vector<model::ExternalTransactionRecord> ListExternalTransactionsByBatch(Transaction&, const std::string& batch_id) = 0;

  virtual Result DeleteExternalTransaction(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Receipts and payments
  // ---------------------------------------------------------------------

  virtual Result InsertFinancialRecord(Transaction&, const model::FinancialRecord&) = 0;

  virtual Result UpdateFinancialRecord(Transaction&, const model::FinancialRecord&) = 0;

  virtual Result DeleteFinancialRecord(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::FinancialRecord> GetFinancialRecord(Transaction&, const std::string& id) = 0;

  // Inclusive range on date, both kinds.
  virtual std::vector<model::FinancialRecord> ListFinancialRecordsInRange(Transaction&, util::Date from, util::Date to) = 0;

  virtual std::vector<model::FinancialRecord> ListPaymentsForBooking(Transaction&, const std::string& booking_id) = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  virtual Result InsertBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual Result UpdateBooking(Transaction&, const model::BookingRecord&) = 0;

  // Locks the row for the rest of the transaction where the backend supports it.
  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  virtual Result InsertCharge(Transaction&, const model::ChargeRecord&) = 0;

  virtual std::vector<model::ChargeRecord> ListChargesForBooking(Transaction&, const std::string& booking_id) = 0;

  // ---------------------------------------------------------------------
  // Link ledger
  // ---------------------------------------------------------------------

  virtual Result InsertLink(Transaction&, const model::LinkRecord&) = 0;

  virtual std::optional<model::LinkRecord> GetLink(Transaction&, const std::string& link_id) = 0;

  virtual std::optional<model::LinkRecord> GetActiveLinkForTransaction(Transaction&, const std::string& transaction_id) = 0;

  virtual std::vector<model::LinkRecord> ListActiveLinksForRecord(Transaction&, const std::string& record_id) = 0;

  // Full history, superseded links included, oldest first.
  virtual std::vector<model::LinkRecord> ListLinksForTransaction(Transaction&, const std::string& transaction_id) = 0;

  virtual Result SupersedeLink(Transaction&, const std::string& link_id, uint64_t at_ms,
                               const std::optional<std::string>& detached_booking_id) = 0;

  // ---------------------------------------------------------------------
  // Import quarantine
  // ---------------------------------------------------------------------

  virtual Result InsertQuarantine(Transaction&, const model::QuarantineRecord&) = 0;

  virtual std::vector<model::QuarantineRecord> ListQuarantine(Transaction&) = 0;
};

} // namespace recon::db
