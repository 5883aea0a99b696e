#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace recon::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // ordered maps give the deterministic id order the SQL backends get from ORDER BY
    std::map<std::string, model::ExternalTransactionRecord> transactions;
    std::unordered_map<std::string, std::string>            fingerprint_to_id;

    std::map<std::string, model::FinancialRecord> records;
    std::map<std::string, model::BookingRecord>   bookings;
    std::map<std::string, model::ChargeRecord>    charges;

    // insertion order is creation order
    std::vector<model::LinkRecord> links;

    std::vector<model::QuarantineRecord> quarantine;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace recon::db::memory
