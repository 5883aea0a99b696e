#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace recon::db::sqlite {

using recon::db::ErrorCode;
using recon::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kTxColumns =
    "id,fingerprint,posted_on,amount_cents,description,account_id,import_batch_id,source_file,counterparty,imported_at_ms";
constexpr const char* kRecordColumns = "id,kind,amount_cents,record_date,description,booking_id,source_fingerprint";
constexpr const char* kBookingColumns = "id,total_due_cents,paid_cents,balance_cents,status,updated_at_ms";
constexpr const char* kLinkColumns =
    "link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,created_at_ms,created_by,run_id,"
    "superseded,superseded_at_ms,detached_booking_id";

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s.has_value()) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// empty string is stored as NULL (link counterpart columns)
void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDate(sqlite3_stmt* st, int idx, util::Date d) {
  BindText(st, idx, util::FormatDate(d));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

util::Date ColDate(sqlite3_stmt* st, int col) {
  const auto text = ColText(st, col);
  auto       d    = util::ParseDate(text);
  if (!d.has_value()) throw std::runtime_error("sqlite: malformed date '" + text + "'");
  return *d;
}

model::ExternalTransactionRecord ReadTransaction(sqlite3_stmt* st) {
  model::ExternalTransactionRecord r;
  r.id              = ColText(st, 0);
  r.fingerprint     = ColText(st, 1);
  r.posted_on       = ColDate(st, 2);
  r.amount_cents    = ColI64(st, 3);
  r.description     = ColText(st, 4);
  r.account_id      = ColText(st, 5);
  r.import_batch_id = ColText(st, 6);
  r.source_file     = ColText(st, 7);
  r.counterparty    = ColOptText(st, 8);
  r.imported_at_ms  = ColU64(st, 9);
  return r;
}

model::FinancialRecord ReadRecord(sqlite3_stmt* st) {
  model::FinancialRecord r;
  r.id   = ColText(st, 0);
  auto k = model::RecordKindFromString(ColText(st, 1));
  if (!k.has_value()) throw std::runtime_error("sqlite: unknown record kind for " + r.id);
  r.kind               = *k;
  r.amount_cents       = ColI64(st, 2);
  r.date               = ColDate(st, 3);
  r.description        = ColText(st, 4);
  r.booking_id         = ColOptText(st, 5);
  r.source_fingerprint = ColOptText(st, 6);
  return r;
}

model::BookingRecord ReadBooking(sqlite3_stmt* st) {
  model::BookingRecord r;
  r.id = ColText(st, 0);
  if (sqlite3_column_type(st, 1) != SQLITE_NULL) r.total_due_cents = ColI64(st, 1);
  r.paid_cents    = ColI64(st, 2);
  r.balance_cents = ColI64(st, 3);
  auto status     = model::BookingStatusFromString(ColText(st, 4));
  if (!status.has_value()) throw std::runtime_error("sqlite: unknown booking status for " + r.id);
  r.status        = *status;
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

model::LinkRecord ReadLink(sqlite3_stmt* st) {
  model::LinkRecord r;
  r.link_id                = ColText(st, 0);
  r.transaction_id         = ColText(st, 1);
  r.record_id              = ColText(st, 2);
  r.counter_transaction_id = ColText(st, 3);
  auto type                = model::MatchTypeFromString(ColText(st, 4));
  if (!type.has_value()) throw std::runtime_error("sqlite: unknown match type for link " + r.link_id);
  r.match_type          = *type;
  r.confidence          = sqlite3_column_double(st, 5);
  r.created_at_ms       = ColU64(st, 6);
  r.created_by          = ColText(st, 7);
  r.run_id              = ColText(st, 8);
  r.superseded          = sqlite3_column_int(st, 9) != 0;
  r.superseded_at_ms    = ColU64(st, 10);
  r.detached_booking_id = ColOptText(st, 11);
  return r;
}

template <typename Reader>
auto ReadAll(sqlite3_stmt* st, Reader reader) {
  std::vector<decltype(reader(st))> out;
  int                               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(reader(st));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(sqlite3_db_handle(st))));
  return out;
}

template <typename Reader>
auto ReadOne(sqlite3_stmt* st, Reader reader) -> std::optional<decltype(reader(st))> {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(sqlite3_db_handle(st))));
  return reader(st);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// External transactions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExternalTransaction(Transaction& t, const model::ExternalTransactionRecord& r) {
  auto* db = TX(t).Handle();

  if (FindExternalTransactionByFingerprint(t, r.fingerprint).has_value()) {
    return Result::Err(ErrorCode::AlreadyExists, "fingerprint exists");
  }

  auto st = Prepare(db,
                    "INSERT INTO external_transactions(id,fingerprint,posted_on,amount_cents,description,account_id,"
                    "import_batch_id,source_file,counterparty,imported_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.fingerprint);
  BindDate(st.get(), 3, r.posted_on);
  BindI64(st.get(), 4, r.amount_cents);
  BindText(st.get(), 5, r.description);
  BindText(st.get(), 6, r.account_id);
  BindText(st.get(), 7, r.import_batch_id);
  BindText(st.get(), 8, r.source_file);
  BindOptText(st.get(), 9, r.counterparty);
  BindU64(st.get(), 10, r.imported_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ExternalTransactionRecord> SqliteRepository::GetExternalTransaction(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kTxColumns + " FROM external_transactions WHERE id=?;");
  BindText(st.get(), 1, id);
  return ReadOne(st.get(), ReadTransaction);
}

std::optional<model::ExternalTransactionRecord> SqliteRepository::FindExternalTransactionByFingerprint(Transaction& t, const std::string& fingerprint) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kTxColumns + " FROM external_transactions WHERE fingerprint=?;");
  BindText(st.get(), 1, fingerprint);
  return ReadOne(st.get(), ReadTransaction);
}

std::vector<model::ExternalTransactionRecord> SqliteRepository::ListUnlinkedExternalTransactions(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kTxColumns +
                                        " FROM external_transactions e WHERE NOT EXISTS ("
                                        "SELECT 1 FROM ledger_links l WHERE l.transaction_id=e.id AND l.superseded=0) "
                                        "ORDER BY posted_on ASC, id ASC;");
  return ReadAll(st.get(), ReadTransaction);
}

std::vector<model::ExternalTransactionRecord> SqliteRepository::ListExternalTransactionsInRange(Transaction& t, util::Date from, util::Date to) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kTxColumns +
                                        " FROM external_transactions WHERE posted_on BETWEEN ? AND ? ORDER BY posted_on ASC, id ASC;");
  BindDate(st.get(), 1, from);
  BindDate(st.get(), 2, to);
  return ReadAll(st.get(), ReadTransaction);
}

std::vector<model::ExternalTransactionRecord> SqliteRepository::ListExternalTransactionsByBatch(Transaction& t, const std::string& batch_id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kTxColumns +
                                        " FROM external_transactions WHERE import_batch_id=? ORDER BY posted_on ASC, id ASC;");
  BindText(st.get(), 1, batch_id);
  return ReadAll(st.get(), ReadTransaction);
}

Result SqliteRepository::DeleteExternalTransaction(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto links = Prepare(db, "DELETE FROM ledger_links WHERE transaction_id=? OR counter_transaction_id=?;");
  BindText(links.get(), 1, id);
  BindText(links.get(), 2, id);
  if (auto res = Translate(db, sqlite3_step(links.get())); !res) return res;

  auto st = Prepare(db, "DELETE FROM external_transactions WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Receipts and payments
// ------------------------------------------------------------------

Result SqliteRepository::InsertFinancialRecord(Transaction& t, const model::FinancialRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                    "INSERT INTO financial_records(id,kind,amount_cents,record_date,description,booking_id,source_fingerprint) "
                     "VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, std::string(model::ToString(r.kind)));
  BindI64(st.get(), 3, r.amount_cents);
  BindDate(st.get(), 4, r.date);
  BindText(st.get(), 5, r.description);
  BindOptText(st.get(), 6, r.booking_id);
  BindOptText(st.get(), 7, r.source_fingerprint);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateFinancialRecord(Transaction& t, const model::FinancialRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                    "UPDATE financial_records SET kind=?,amount_cents=?,record_date=?,description=?,booking_id=?,"
                     "source_fingerprint=? WHERE id=?;");
  BindText(st.get(), 1, std::string(model::ToString(r.kind)));
  BindI64(st.get(), 2, r.amount_cents);
  BindDate(st.get(), 3, r.date);
  BindText(st.get(), 4, r.description);
  BindOptText(st.get(), 5, r.booking_id);
  BindOptText(st.get(), 6, r.source_fingerprint);
  BindText(st.get(), 7, r.id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::DeleteFinancialRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto links = Prepare(db, "DELETE FROM ledger_links WHERE record_id=?;");
  BindText(links.get(), 1, id);
  if (auto res = Translate(db, sqlite3_step(links.get())); !res) return res;

  auto st = Prepare(db, "DELETE FROM financial_records WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::FinancialRecord> SqliteRepository::GetFinancialRecord(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRecordColumns + " FROM financial_records WHERE id=?;");
  BindText(st.get(), 1, id);
  return ReadOne(st.get(), ReadRecord);
}

std::vector<model::FinancialRecord> SqliteRepository::ListFinancialRecordsInRange(Transaction& t, util::Date from, util::Date to) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRecordColumns +
                                        " FROM financial_records WHERE record_date BETWEEN ? AND ? ORDER BY record_date ASC, id ASC;");
  BindDate(st.get(), 1, from);
  BindDate(st.get(), 2, to);
  return ReadAll(st.get(), ReadRecord);
}

std::vector<model::FinancialRecord> SqliteRepository::ListPaymentsForBooking(Transaction& t, const std::string& booking_id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRecordColumns +
                                        " FROM financial_records WHERE kind='payment' AND booking_id=? ORDER BY record_date ASC, id ASC;");
  BindText(st.get(), 1, booking_id);
  return ReadAll(st.get(), ReadRecord);
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO bookings(id,total_due_cents,paid_cents,balance_cents,status,updated_at_ms) VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  if (r.total_due_cents.has_value()) {
    BindI64(st.get(), 2, *r.total_due_cents);
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  BindI64(st.get(), 3, r.paid_cents);
  BindI64(st.get(), 4, r.balance_cents);
  BindText(st.get(), 5, std::string(model::ToString(r.status)));
  BindU64(st.get(), 6, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE bookings SET total_due_cents=?,paid_cents=?,balance_cents=?,status=?,updated_at_ms=? WHERE id=?;");
  if (r.total_due_cents.has_value()) {
    BindI64(st.get(), 1, *r.total_due_cents);
  } else {
    sqlite3_bind_null(st.get(), 1);
  }
  BindI64(st.get(), 2, r.paid_cents);
  BindI64(st.get(), 3, r.balance_cents);
  BindText(st.get(), 4, std::string(model::ToString(r.status)));
  BindU64(st.get(), 5, r.updated_at_ms);
  BindText(st.get(), 6, r.id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::BookingRecord> SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
  // BEGIN IMMEDIATE already holds the database write lock
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id=?;");
  BindText(st.get(), 1, id);
  return ReadOne(st.get(), ReadBooking);
}

Result SqliteRepository::InsertCharge(Transaction& t, const model::ChargeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO booking_charges(id,booking_id,description,amount_cents) VALUES(?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.booking_id);
  BindText(st.get(), 3, r.description);
  BindI64(st.get(), 4, r.amount_cents);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ChargeRecord> SqliteRepository::ListChargesForBooking(Transaction& t, const std::string& booking_id) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,booking_id,description,amount_cents FROM booking_charges WHERE booking_id=? ORDER BY id ASC;");
  BindText(st.get(), 1, booking_id);
  return ReadAll(st.get(), [](sqlite3_stmt* s) {
    model::ChargeRecord c;
    c.id           = ColText(s, 0);
    c.booking_id   = ColText(s, 1);
    c.description  = ColText(s, 2);
    c.amount_cents = ColI64(s, 3);
    return c;
  });
}

// ------------------------------------------------------------------
// Link ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto* db = TX(t).Handle();

  if (!r.superseded && GetActiveLinkForTransaction(t, r.transaction_id).has_value()) {
    return Result::Err(ErrorCode::Conflict, "transaction already has an active link");
  }

  auto st = Prepare(db,
                    "INSERT INTO ledger_links(link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,"
                    "created_at_ms,created_by,run_id,superseded,superseded_at_ms,detached_booking_id) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.link_id);
  BindText(st.get(), 2, r.transaction_id);
  BindTextOrNull(st.get(), 3, r.record_id);
  BindTextOrNull(st.get(), 4, r.counter_transaction_id);
  BindText(st.get(), 5, std::string(model::ToString(r.match_type)));
  sqlite3_bind_double(st.get(), 6, r.confidence);
  BindU64(st.get(), 7, r.created_at_ms);
  BindText(st.get(), 8, r.created_by);
  BindText(st.get(), 9, r.run_id);
  sqlite3_bind_int(st.get(), 10, r.superseded ? 1 : 0);
  BindU64(st.get(), 11, r.superseded_at_ms);
  BindOptText(st.get(), 12, r.detached_booking_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LinkRecord> SqliteRepository::GetLink(Transaction& t, const std::string& link_id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kLinkColumns + " FROM ledger_links WHERE link_id=?;");
  BindText(st.get(), 1, link_id);
  return ReadOne(st.get(), ReadLink);
}

std::optional<model::LinkRecord> SqliteRepository::GetActiveLinkForTransaction(Transaction& t, const std::string& transaction_id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kLinkColumns + " FROM ledger_links WHERE transaction_id=? AND superseded=0;");
  BindText(st.get(), 1, transaction_id);
  return ReadOne(st.get(), ReadLink);
}

std::vector<model::LinkRecord> SqliteRepository::ListActiveLinksForRecord(Transaction& t, const std::string& record_id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kLinkColumns +
                                        " FROM ledger_links WHERE record_id=? AND superseded=0 ORDER BY created_at_ms ASC, rowid ASC;");
  BindText(st.get(), 1, record_id);
  return ReadAll(st.get(), ReadLink);
}

std::vector<model::LinkRecord> SqliteRepository::ListLinksForTransaction(Transaction& t, const std::string& transaction_id) {
  auto st = Prepare(TX(t).Handle(),
                    std::string("SELECT ") + kLinkColumns + " FROM ledger_links WHERE transaction_id=? ORDER BY created_at_ms ASC, rowid ASC;");
  BindText(st.get(), 1, transaction_id);
  return ReadAll(st.get(), ReadLink);
}

Result SqliteRepository::SupersedeLink(Transaction& t, const std::string& link_id, uint64_t at_ms,
                                       const std::optional<std::string>& detached_booking_id) {
  auto* db = TX(t).Handle();

  auto existing = GetLink(t, link_id);
  if (!existing.has_value()) return Result::Err(ErrorCode::NotFound);
  if (existing->superseded) return Result::Err(ErrorCode::Conflict, "link already superseded");

  auto st = Prepare(db, "UPDATE ledger_links SET superseded=1,superseded_at_ms=?,detached_booking_id=? WHERE link_id=?;");
  BindU64(st.get(), 1, at_ms);
  BindOptText(st.get(), 2, detached_booking_id);
  BindText(st.get(), 3, link_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Import quarantine
// ------------------------------------------------------------------

Result SqliteRepository::InsertQuarantine(Transaction& t, const model::QuarantineRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                    "INSERT INTO import_quarantine(id,import_batch_id,source_file,line_number,reason,raw_line,created_at_ms) "
                     "VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.import_batch_id);
  BindText(st.get(), 3, r.source_file);
  sqlite3_bind_int64(st.get(), 4, r.line_number);
  BindText(st.get(), 5, r.reason);
  BindText(st.get(), 6, r.raw_line);
  BindU64(st.get(), 7, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::QuarantineRecord> SqliteRepository::ListQuarantine(Transaction& t) {
  auto st = Prepare(TX(t).Handle(),
                    "SELECT id,import_batch_id,source_file,line_number,reason,raw_line,created_at_ms "
                    "FROM import_quarantine ORDER BY created_at_ms ASC, rowid ASC;");
  return ReadAll(st.get(), [](sqlite3_stmt* s) {
    model::QuarantineRecord q;
    q.id              = ColText(s, 0);
    q.import_batch_id = ColText(s, 1);
    q.source_file     = ColText(s, 2);
    q.line_number     = static_cast<uint32_t>(sqlite3_column_int64(s, 3));
    q.reason          = ColText(s, 4);
    q.raw_line        = ColText(s, 5);
    q.created_at_ms   = ColU64(s, 6);
    return q;
  });
}

} // namespace recon::db::sqlite
