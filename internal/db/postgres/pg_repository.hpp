#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace recon::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExternalTransaction(Transaction&, const model::ExternalTransactionRecord&) override;
  std::optional<model::ExternalTransactionRecord> GetExternalTransaction(Transaction&, const std::string&) override;
  std::optional<model::ExternalTransactionRecord> FindExternalTransactionByFingerprint(Transaction&, const std::string&) override;
  std::vector<model::ExternalTransactionRecord>   ListUnlinkedExternalTransactions(Transaction&) override;
  std::vector<model::ExternalTransactionRecord>   ListExternalTransactionsInRange(Transaction&, util::Date from, util::Date to) override;
  std::vector<model::ExternalTransactionRecord>   ListExternalTransactionsByBatch(Transaction&, const std::string&) override;
  Result DeleteExternalTransaction(Transaction&, const std::string&) override;

  Result InsertFinancialRecord(Transaction&, const model::FinancialRecord&) override;
  Result UpdateFinancialRecord(Transaction&, const model::FinancialRecord&) override;
  Result DeleteFinancialRecord(Transaction&, const std::string&) override;
  std::optional<model::FinancialRecord> GetFinancialRecord(Transaction&, const std::string&) override;
  std::vector<model::FinancialRecord>   ListFinancialRecordsInRange(Transaction&, util::Date from, util::Date to) override;
  std::vector<model::FinancialRecord>   ListPaymentsForBooking(Transaction&, const std::string&) override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  Result InsertCharge(Transaction&, const model::ChargeRecord&) override;
  std::vector<model::ChargeRecord> ListChargesForBooking(Transaction&, const std::string&) override;

  Result InsertLink(Transaction&, const model::LinkRecord&) override;
  std::optional<model::LinkRecord> GetLink(Transaction&, const std::string&) override;
  std::optional<model::LinkRecord> GetActiveLinkForTransaction(Transaction&, const std::string&) override;
  std::vector<model::LinkRecord>   ListActiveLinksForRecord(Transaction&, const std::string&) override;
  std::vector<model::LinkRecord>   ListLinksForTransaction(Transaction&, const std::string&) override;
  Result SupersedeLink(Transaction&, const std::string& link_id, uint64_t at_ms, const std::optional<std::string>& detached_booking_id) override;

  Result InsertQuarantine(Transaction&, const model::QuarantineRecord&) override;
  std::vector<model::QuarantineRecord> ListQuarantine(Transaction&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace recon::db::postgres
