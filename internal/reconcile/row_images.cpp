#include "row_images.hpp"

#include <optional>

namespace recon::reconcile {

namespace {

using google::protobuf::Struct;

void PutString(Struct& s, const std::string& key, const std::string& value) {
  (*s.mutable_fields())[key].set_string_value(value);
}

void PutNumber(Struct& s, const std::string& key, double value) {
  (*s.mutable_fields())[key].set_number_value(value);
}

void PutBool(Struct& s, const std::string& key, bool value) {
  (*s.mutable_fields())[key].set_bool_value(value);
}

void PutNull(Struct& s, const std::string& key) {
  (*s.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
}

void PutOptional(Struct& s, const std::string& key, const std::optional<std::string>& value) {
  if (value) {
    PutString(s, key, *value);
  } else {
    PutNull(s, key);
  }
}

} // namespace

Struct ToStruct(const db::model::ExternalTransactionRecord& row) {
  Struct s;
  PutString(s, "id", row.id);
  PutString(s, "fingerprint", row.fingerprint);
  PutString(s, "posted_on", util::FormatDate(row.posted_on));
  PutNumber(s, "amount_cents", static_cast<double>(row.amount_cents));
  PutString(s, "description", row.description);
  PutString(s, "account_id", row.account_id);
  PutString(s, "import_batch_id", row.import_batch_id);
  PutString(s, "source_file", row.source_file);
  PutOptional(s, "counterparty", row.counterparty);
  PutNumber(s, "imported_at_ms", static_cast<double>(row.imported_at_ms));
  return s;
}

Struct ToStruct(const db::model::FinancialRecord& row) {
  Struct s;
  PutString(s, "id", row.id);
  PutString(s, "kind", std::string(db::model::ToString(row.kind)));
  PutNumber(s, "amount_cents", static_cast<double>(row.amount_cents));
  PutString(s, "record_date", util::FormatDate(row.date));
  PutString(s, "description", row.description);
  PutOptional(s, "booking_id", row.booking_id);
  PutOptional(s, "source_fingerprint", row.source_fingerprint);
  return s;
}

Struct ToStruct(const db::model::BookingRecord& row) {
  Struct s;
  PutString(s, "id", row.id);
  if (row.total_due_cents) {
    PutNumber(s, "total_due_cents", static_cast<double>(*row.total_due_cents));
  } else {
    PutNull(s, "total_due_cents");
  }
  PutNumber(s, "paid_cents", static_cast<double>(row.paid_cents));
  PutNumber(s, "balance_cents", static_cast<double>(row.balance_cents));
  PutString(s, "status", std::string(db::model::ToString(row.status)));
  PutNumber(s, "updated_at_ms", static_cast<double>(row.updated_at_ms));
  return s;
}

Struct ToStruct(const db::model::LinkRecord& row) {
  Struct s;
  PutString(s, "link_id", row.link_id);
  PutString(s, "transaction_id", row.transaction_id);
  if (row.record_id.empty()) {
    PutNull(s, "record_id");
  } else {
    PutString(s, "record_id", row.record_id);
  }
  if (row.counter_transaction_id.empty()) {
    PutNull(s, "counter_transaction_id");
  } else {
    PutString(s, "counter_transaction_id", row.counter_transaction_id);
  }
  PutString(s, "match_type", std::string(db::model::ToString(row.match_type)));
  PutNumber(s, "confidence", row.confidence);
  PutNumber(s, "created_at_ms", static_cast<double>(row.created_at_ms));
  PutString(s, "created_by", row.created_by);
  PutString(s, "run_id", row.run_id);
  PutBool(s, "superseded", row.superseded);
  PutNumber(s, "superseded_at_ms", static_cast<double>(row.superseded_at_ms));
  PutOptional(s, "detached_booking_id", row.detached_booking_id);
  return s;
}

Struct ToStruct(const db::model::QuarantineRecord& row) {
  Struct s;
  PutString(s, "id", row.id);
  PutString(s, "import_batch_id", row.import_batch_id);
  PutString(s, "source_file", row.source_file);
  PutNumber(s, "line_number", static_cast<double>(row.line_number));
  PutString(s, "reason", row.reason);
  PutString(s, "raw_line", row.raw_line);
  PutNumber(s, "created_at_ms", static_cast<double>(row.created_at_ms));
  return s;
}

} // namespace recon::reconcile
