#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/external_transaction_record.hpp"
#include "internal/db/model/financial_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/quarantine_record.hpp"

namespace recon::reconcile {

/*
  Row images for change-set samples and backup snapshots.

  Column names match the SQL schema so an operator can restore a row
  verbatim. Money and millisecond timestamps are JSON numbers, unknown
  values are null.
*/

google::protobuf::Struct ToStruct(const db::model::ExternalTransactionRecord& row);
google::protobuf::Struct ToStruct(const db::model::FinancialRecord& row);
google::protobuf::Struct ToStruct(const db::model::BookingRecord& row);
google::protobuf::Struct ToStruct(const db::model::LinkRecord& row);
google::protobuf::Struct ToStruct(const db::model::QuarantineRecord& row);

inline std::string_view TableOf(const db::model::ExternalTransactionRecord&) {
  return "external_transactions";
}
inline std::string_view TableOf(const db::model::FinancialRecord&) {
  return "financial_records";
}
inline std::string_view TableOf(const db::model::BookingRecord&) {
  return "bookings";
}
inline std::string_view TableOf(const db::model::LinkRecord&) {
  return "ledger_links";
}
inline std::string_view TableOf(const db::model::QuarantineRecord&) {
  return "import_quarantine";
}

// "<primary key column>=<value>"
inline std::string KeyOf(const db::model::ExternalTransactionRecord& row) {
  return "id=" + row.id;
}
inline std::string KeyOf(const db::model::FinancialRecord& row) {
  return "id=" + row.id;
}
inline std::string KeyOf(const db::model::BookingRecord& row) {
  return "id=" + row.id;
}
inline std::string KeyOf(const db::model::LinkRecord& row) {
  return "link_id=" + row.link_id;
}
inline std::string KeyOf(const db::model::QuarantineRecord& row) {
  return "id=" + row.id;
}

} // namespace recon::reconcile
