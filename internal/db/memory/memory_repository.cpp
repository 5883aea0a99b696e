#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace recon::db::memory {

namespace {

bool ByPostedThenId(const model::ExternalTransactionRecord& a, const model::ExternalTransactionRecord& b) {
  if (a.posted_on != b.posted_on) return a.posted_on < b.posted_on;
  return a.id < b.id;
}

bool ByDateThenId(const model::FinancialRecord& a, const model::FinancialRecord& b) {
  if (a.date != b.date) return a.date < b.date;
  return a.id < b.id;
}

bool HasActiveLink(const std::vector<model::LinkRecord>& links, const std::string& transaction_id) {
  return std::any_of(links.begin(), links.end(), [&](const model::LinkRecord& l) {
    return !l.superseded && l.transaction_id == transaction_id;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// External transactions
// ------------------------------------------------------------------

Result MemoryRepository::InsertExternalTransaction(Transaction& t, const model::ExternalTransactionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.transactions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "transaction id exists");
  if (s.fingerprint_to_id.contains(r.fingerprint)) return Result::Err(ErrorCode::AlreadyExists, "fingerprint exists");
  s.transactions[r.id]              = r;
  s.fingerprint_to_id[r.fingerprint] = r.id;
  return Result::Ok();
}

std::optional<model::ExternalTransactionRecord> MemoryRepository::GetExternalTransaction(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.transactions.find(id);
  if (it == s.transactions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ExternalTransactionRecord> MemoryRepository::FindExternalTransactionByFingerprint(Transaction& t, const std::string& fingerprint) {
  const auto& s  = TX(t).View();
  auto        it = s.fingerprint_to_id.find(fingerprint);
  if (it == s.fingerprint_to_id.end()) return std::nullopt;
  return s.transactions.at(it->second);
}

std::vector<model::ExternalTransactionRecord> MemoryRepository::ListUnlinkedExternalTransactions(Transaction& t) {
  const auto&                                   s = TX(t).View();
  std::vector<model::ExternalTransactionRecord> out;
  for (const auto& [id, record] : s.transactions) {
    if (!HasActiveLink(s.links, id)) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), ByPostedThenId);
  return out;
}

std::vector<model::ExternalTransactionRecord> MemoryRepository::ListExternalTransactionsInRange(Transaction& t, util::Date from, util::Date to) {
  std::vector<model::ExternalTransactionRecord> out;
  for (const auto& [_, record] : TX(t).View().transactions) {
    if (record.posted_on >= from && record.posted_on <= to) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), ByPostedThenId);
  return out;
}

std::vector<model::ExternalTransactionRecord> MemoryRepository::ListExternalTransactionsByBatch(Transaction& t, const std::string& batch_id) {
  std::vector<model::ExternalTransactionRecord> out;
  for (const auto& [_, record] : TX(t).View().transactions) {
    if (record.import_batch_id == batch_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), ByPostedThenId);
  return out;
}

Result MemoryRepository::DeleteExternalTransaction(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.transactions.find(id);
  if (it == s.transactions.end()) return Result::Ok();

  s.fingerprint_to_id.erase(it->second.fingerprint);
  s.transactions.erase(it);
  std::erase_if(s.links, [&](const model::LinkRecord& l) {
    return l.transaction_id == id || l.counter_transaction_id == id;
  });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Receipts and payments
// ------------------------------------------------------------------

Result MemoryRepository::InsertFinancialRecord(Transaction& t, const model::FinancialRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.records.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.records[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateFinancialRecord(Transaction& t, const model::FinancialRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.records.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.records[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteFinancialRecord(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.records.erase(id);
  std::erase_if(s.links, [&](const model::LinkRecord& l) { return l.record_id == id; });
  return Result::Ok();
}

std::optional<model::FinancialRecord> MemoryRepository::GetFinancialRecord(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FinancialRecord> MemoryRepository::ListFinancialRecordsInRange(Transaction& t, util::Date from, util::Date to) {
  std::vector<model::FinancialRecord> out;
  for (const auto& [_, record] : TX(t).View().records) {
    if (record.date >= from && record.date <= to) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), ByDateThenId);
  return out;
}

std::vector<model::FinancialRecord> MemoryRepository::ListPaymentsForBooking(Transaction& t, const std::string& booking_id) {
  std::vector<model::FinancialRecord> out;
  for (const auto& [_, record] : TX(t).View().records) {
    if (record.kind == model::RecordKind::kPayment && record.booking_id == booking_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), ByDateThenId);
  return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.bookings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.bookings[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.bookings.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.bookings[r.id] = r;
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bookings.find(id);
  if (it == s.bookings.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertCharge(Transaction& t, const model::ChargeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.bookings.contains(r.booking_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown booking");
  if (s.charges.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.charges[r.id] = r;
  return Result::Ok();
}

std::vector<model::ChargeRecord> MemoryRepository::ListChargesForBooking(Transaction& t, const std::string& booking_id) {
  std::vector<model::ChargeRecord> out;
  for (const auto& [_, charge] : TX(t).View().charges) {
    if (charge.booking_id == booking_id) out.push_back(charge);
  }
  return out;
}

// ------------------------------------------------------------------
// Link ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.transactions.contains(r.transaction_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown transaction");
  if (!r.record_id.empty() && !s.records.contains(r.record_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown record");
  if (!r.counter_transaction_id.empty() && !s.transactions.contains(r.counter_transaction_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown counter transaction");
  }
  for (const auto& l : s.links) {
    if (l.link_id == r.link_id) return Result::Err(ErrorCode::AlreadyExists);
  }
  if (!r.superseded && HasActiveLink(s.links, r.transaction_id)) {
    return Result::Err(ErrorCode::Conflict, "transaction already has an active link");
  }
  s.links.push_back(r);
  return Result::Ok();
}

std::optional<model::LinkRecord> MemoryRepository::GetLink(Transaction& t, const std::string& link_id) {
  for (const auto& l : TX(t).View().links) {
    if (l.link_id == link_id) return l;
  }
  return std::nullopt;
}

std::optional<model::LinkRecord> MemoryRepository::GetActiveLinkForTransaction(Transaction& t, const std::string& transaction_id) {
  for (const auto& l : TX(t).View().links) {
    if (!l.superseded && l.transaction_id == transaction_id) return l;
  }
  return std::nullopt;
}

std::vector<model::LinkRecord> MemoryRepository::ListActiveLinksForRecord(Transaction& t, const std::string& record_id) {
  std::vector<model::LinkRecord> out;
  for (const auto& l : TX(t).View().links) {
    if (!l.superseded && l.record_id == record_id) out.push_back(l);
  }
  return out;
}

std::vector<model::LinkRecord> MemoryRepository::ListLinksForTransaction(Transaction& t, const std::string& transaction_id) {
  std::vector<model::LinkRecord> out;
  for (const auto& l : TX(t).View().links) {
    if (l.transaction_id == transaction_id) out.push_back(l);
  }
  return out;
}

Result MemoryRepository::SupersedeLink(Transaction& t, const std::string& link_id, uint64_t at_ms,
                                       const std::optional<std::string>& detached_booking_id) {
  for (auto& l : TX(t).Mutable().links) {
    if (l.link_id != link_id) continue;
    if (l.superseded) return Result::Err(ErrorCode::Conflict, "link already superseded");
    l.superseded          = true;
    l.superseded_at_ms    = at_ms;
    l.detached_booking_id = detached_booking_id;
    return Result::Ok();
  }
  return Result::Err(ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Import quarantine
// ------------------------------------------------------------------

Result MemoryRepository::InsertQuarantine(Transaction& t, const model::QuarantineRecord& r) {
  TX(t).Mutable().quarantine.push_back(r);
  return Result::Ok();
}

std::vector<model::QuarantineRecord> MemoryRepository::ListQuarantine(Transaction& t) {
  return TX(t).View().quarantine;
}

} // namespace recon::db::memory
