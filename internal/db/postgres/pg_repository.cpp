#include "pg_repository.hpp"

#include <stdexcept>

namespace recon::db::postgres {

namespace {

constexpr const char* kTxColumns =
    "id,fingerprint,to_char(posted_on,'YYYY-MM-DD'),amount_cents,description,account_id,import_batch_id,source_file,"
    "counterparty,imported_at_ms";
constexpr const char* kRecordColumns =
    "id,kind,amount_cents,to_char(record_date,'YYYY-MM-DD'),description,booking_id,source_fingerprint";
constexpr const char* kLinkColumns =
    "link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,created_at_ms,created_by,run_id,"
    "superseded,superseded_at_ms,detached_booking_id";

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

util::Date DateField(const pqxx::field& f) {
  auto d = util::ParseDate(f.c_str());
  if (!d.has_value()) throw std::runtime_error(std::string("postgres: malformed date '") + f.c_str() + "'");
  return *d;
}

model::ExternalTransactionRecord ReadTransaction(const pqxx::row& row) {
  model::ExternalTransactionRecord r;
  r.id              = row[0].c_str();
  r.fingerprint     = row[1].c_str();
  r.posted_on       = DateField(row[2]);
  r.amount_cents    = row[3].as<int64_t>();
  r.description     = row[4].c_str();
  r.account_id      = row[5].c_str();
  r.import_batch_id = row[6].c_str();
  r.source_file     = row[7].c_str();
  r.counterparty    = OptText(row[8]);
  r.imported_at_ms  = row[9].as<uint64_t>();
  return r;
}

model::FinancialRecord ReadRecord(const pqxx::row& row) {
  model::FinancialRecord r;
  r.id   = row[0].c_str();
  auto k = model::RecordKindFromString(row[1].c_str());
  if (!k.has_value()) throw std::runtime_error("postgres: unknown record kind for " + r.id);
  r.kind               = *k;
  r.amount_cents       = row[2].as<int64_t>();
  r.date               = DateField(row[3]);
  r.description        = row[4].c_str();
  r.booking_id         = OptText(row[5]);
  r.source_fingerprint = OptText(row[6]);
  return r;
}

model::BookingRecord ReadBooking(const pqxx::row& row) {
  model::BookingRecord r;
  r.id = row[0].c_str();
  if (!row[1].is_null()) r.total_due_cents = row[1].as<int64_t>();
  r.paid_cents    = row[2].as<int64_t>();
  r.balance_cents = row[3].as<int64_t>();
  auto status     = model::BookingStatusFromString(row[4].c_str());
  if (!status.has_value()) throw std::runtime_error("postgres: unknown booking status for " + r.id);
  r.status        = *status;
  r.updated_at_ms = row[5].as<uint64_t>();
  return r;
}

model::LinkRecord ReadLink(const pqxx::row& row) {
  model::LinkRecord r;
  r.link_id                = row[0].c_str();
  r.transaction_id         = row[1].c_str();
  r.record_id              = TextOrEmpty(row[2]);
  r.counter_transaction_id = TextOrEmpty(row[3]);
  auto type                = model::MatchTypeFromString(row[4].c_str());
  if (!type.has_value()) throw std::runtime_error("postgres: unknown match type for link " + r.link_id);
  r.match_type          = *type;
  r.confidence          = row[5].as<double>();
  r.created_at_ms       = row[6].as<uint64_t>();
  r.created_by          = row[7].c_str();
  r.run_id              = row[8].c_str();
  r.superseded          = row[9].as<bool>();
  r.superseded_at_ms    = row[10].is_null() ? 0 : row[10].as<uint64_t>();
  r.detached_booking_id = OptText(row[11]);
  return r;
}

template <typename Reader>
auto ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<decltype(reader(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(reader(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// External transactions
// ------------------------------------------------------------------

Result PgRepository::InsertExternalTransaction(Transaction& t, const model::ExternalTransactionRecord& r) {
  try {
    if (FindExternalTransactionByFingerprint(t, r.fingerprint).has_value()) {
      return Result::Err(ErrorCode::AlreadyExists, "fingerprint exists");
    }
    TX(t).Work().exec_prepared("insert_external_transaction", r.id, r.fingerprint, util::FormatDate(r.posted_on), r.amount_cents,
                               r.description, r.account_id, r.import_batch_id, r.source_file, r.counterparty, r.imported_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExternalTransactionRecord> PgRepository::GetExternalTransaction(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTxColumns + " FROM external_transactions WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadTransaction(res[0]);
}

std::optional<model::ExternalTransactionRecord> PgRepository::FindExternalTransactionByFingerprint(Transaction& t, const std::string& fingerprint) {
  auto res = TX(t).Work().exec_prepared("find_tx_by_fingerprint", fingerprint);
  if (res.empty()) return std::nullopt;
  return ReadTransaction(res[0]);
}

std::vector<model::ExternalTransactionRecord> PgRepository::ListUnlinkedExternalTransactions(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kTxColumns +
                               " FROM external_transactions e WHERE NOT EXISTS ("
                               "SELECT 1 FROM ledger_links l WHERE l.transaction_id=e.id AND NOT l.superseded) "
                               "ORDER BY posted_on ASC, id ASC;");
  return ReadAll(res, ReadTransaction);
}

std::vector<model::ExternalTransactionRecord> PgRepository::ListExternalTransactionsInRange(Transaction& t, util::Date from, util::Date to) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTxColumns +
                                          " FROM external_transactions WHERE posted_on BETWEEN $1::date AND $2::date "
                                          "ORDER BY posted_on ASC, id ASC;",
                                      util::FormatDate(from), util::FormatDate(to));
  return ReadAll(res, ReadTransaction);
}

std::vector<model::ExternalTransactionRecord> PgRepository::ListExternalTransactionsByBatch(Transaction& t, const std::string& batch_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTxColumns + " FROM external_transactions WHERE import_batch_id=$1 ORDER BY posted_on ASC, id ASC;", batch_id);
  return ReadAll(res, ReadTransaction);
}

Result PgRepository::DeleteExternalTransaction(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM ledger_links WHERE transaction_id=$1 OR counter_transaction_id=$1;", id);
    TX(t).Work().exec_params("DELETE FROM external_transactions WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Receipts and payments
// ------------------------------------------------------------------

Result PgRepository::InsertFinancialRecord(Transaction& t, const model::FinancialRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO financial_records(id,kind,amount_cents,record_date,description,booking_id,source_fingerprint) "
        "VALUES($1,$2,$3,$4::date,$5,$6,$7);",
        r.id, std::string(model::ToString(r.kind)), r.amount_cents, util::FormatDate(r.date), r.description, r.booking_id,
        r.source_fingerprint);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateFinancialRecord(Transaction& t, const model::FinancialRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE financial_records SET kind=$2,amount_cents=$3,record_date=$4::date,description=$5,booking_id=$6,"
        "source_fingerprint=$7 WHERE id=$1;",
        r.id, std::string(model::ToString(r.kind)), r.amount_cents, util::FormatDate(r.date), r.description, r.booking_id,
        r.source_fingerprint);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteFinancialRecord(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM ledger_links WHERE record_id=$1;", id);
    TX(t).Work().exec_params("DELETE FROM financial_records WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FinancialRecord> PgRepository::GetFinancialRecord(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRecordColumns + " FROM financial_records WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadRecord(res[0]);
}

std::vector<model::FinancialRecord> PgRepository::ListFinancialRecordsInRange(Transaction& t, util::Date from, util::Date to) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRecordColumns +
                                          " FROM financial_records WHERE record_date BETWEEN $1::date AND $2::date "
                                          "ORDER BY record_date ASC, id ASC;",
                                      util::FormatDate(from), util::FormatDate(to));
  return ReadAll(res, ReadRecord);
}

std::vector<model::FinancialRecord> PgRepository::ListPaymentsForBooking(Transaction& t, const std::string& booking_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRecordColumns +
                                          " FROM financial_records WHERE kind='payment' AND booking_id=$1 "
                                          "ORDER BY record_date ASC, id ASC;",
                                      booking_id);
  return ReadAll(res, ReadRecord);
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result PgRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO bookings(id,total_due_cents,paid_cents,balance_cents,status,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6);", r.id,
        r.total_due_cents, r.paid_cents, r.balance_cents, std::string(model::ToString(r.status)), r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE bookings SET total_due_cents=$2,paid_cents=$3,balance_cents=$4,status=$5,updated_at_ms=$6 WHERE id=$1;", r.id,
        r.total_due_cents, r.paid_cents, r.balance_cents, std::string(model::ToString(r.status)), r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BookingRecord> PgRepository::GetBooking(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_booking_for_update", id);
  if (res.empty()) return std::nullopt;
  return ReadBooking(res[0]);
}

Result PgRepository::InsertCharge(Transaction& t, const model::ChargeRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO booking_charges(id,booking_id,description,amount_cents) VALUES($1,$2,$3,$4);", r.id,
                             r.booking_id, r.description, r.amount_cents);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ChargeRecord> PgRepository::ListChargesForBooking(Transaction& t, const std::string& booking_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,booking_id,description,amount_cents FROM booking_charges WHERE booking_id=$1 ORDER BY id ASC;", booking_id);
  return ReadAll(res, [](const pqxx::row& row) {
    model::ChargeRecord c;
    c.id           = row[0].c_str();
    c.booking_id   = row[1].c_str();
    c.description  = row[2].c_str();
    c.amount_cents = row[3].as<int64_t>();
    return c;
  });
}

// ------------------------------------------------------------------
// Link ledger
// ------------------------------------------------------------------

Result PgRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  try {
    if (!r.superseded && GetActiveLinkForTransaction(t, r.transaction_id).has_value()) {
      return Result::Err(ErrorCode::Conflict, "transaction already has an active link");
    }
    std::optional<uint64_t> superseded_at;
    if (r.superseded) superseded_at = r.superseded_at_ms;

    TX(t).Work().exec_prepared("insert_link", r.link_id, r.transaction_id, NullIfEmpty(r.record_id), NullIfEmpty(r.counter_transaction_id),
                               std::string(model::ToString(r.match_type)), r.confidence, r.created_at_ms, r.created_by, r.run_id,
                               r.superseded, superseded_at, r.detached_booking_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LinkRecord> PgRepository::GetLink(Transaction& t, const std::string& link_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kLinkColumns + " FROM ledger_links WHERE link_id=$1;", link_id);
  if (res.empty()) return std::nullopt;
  return ReadLink(res[0]);
}

std::optional<model::LinkRecord> PgRepository::GetActiveLinkForTransaction(Transaction& t, const std::string& transaction_id) {
  auto res = TX(t).Work().exec_prepared("get_active_link_for_update", transaction_id);
  if (res.empty()) return std::nullopt;
  return ReadLink(res[0]);
}

std::vector<model::LinkRecord> PgRepository::ListActiveLinksForRecord(Transaction& t, const std::string& record_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kLinkColumns +
                                          " FROM ledger_links WHERE record_id=$1 AND NOT superseded ORDER BY seq ASC;",
                                      record_id);
  return ReadAll(res, ReadLink);
}

std::vector<model::LinkRecord> PgRepository::ListLinksForTransaction(Transaction& t, const std::string& transaction_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kLinkColumns + " FROM ledger_links WHERE transaction_id=$1 ORDER BY seq ASC;",
      transaction_id);
  return ReadAll(res, ReadLink);
}

Result PgRepository::SupersedeLink(Transaction& t, const std::string& link_id, uint64_t at_ms,
                                   const std::optional<std::string>& detached_booking_id) {
  try {
    auto res = TX(t).Work().exec_prepared("supersede_link", link_id, at_ms, detached_booking_id);
    if (res.affected_rows() == 1) return Result::Ok();
    if (GetLink(t, link_id).has_value()) return Result::Err(ErrorCode::Conflict, "link already superseded");
    return Result::Err(ErrorCode::NotFound);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Import quarantine
// ------------------------------------------------------------------

Result PgRepository::InsertQuarantine(Transaction& t, const model::QuarantineRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO import_quarantine(id,import_batch_id,source_file,line_number,reason,raw_line,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7);",
        r.id, r.import_batch_id, r.source_file, r.line_number, r.reason, r.raw_line, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::QuarantineRecord> PgRepository::ListQuarantine(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,import_batch_id,source_file,line_number,reason,raw_line,created_at_ms "
      "FROM import_quarantine ORDER BY created_at_ms ASC, seq ASC;");
  return ReadAll(res, [](const pqxx::row& row) {
    model::QuarantineRecord q;
    q.id              = row[0].c_str();
    q.import_batch_id = row[1].c_str();
    q.source_file     = row[2].c_str();
    q.line_number     = row[3].as<uint32_t>();
    q.reason          = row[4].c_str();
    q.raw_line        = row[5].c_str();
    q.created_at_ms   = row[6].as<uint64_t>();
    return q;
  });
}

} // namespace recon::db::postgres
