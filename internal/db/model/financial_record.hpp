#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/util/date.hpp"
#include "internal/util/money.hpp"

namespace recon::db::model {

enum class RecordKind {
  kReceipt, // money out (vendor receipt)
  kPayment, // money in (customer payment)
};

inline std::string_view ToString(RecordKind kind) {
  return kind == RecordKind::kReceipt ? "receipt" : "payment";
}

inline std::optional<RecordKind> RecordKindFromString(std::string_view s) {
  if (s == "receipt") return RecordKind::kReceipt;
  if (s == "payment") return RecordKind::kPayment;
  return std::nullopt;
}

/*
  Receipt or payment a bank line can be matched against.

  booking_id is the attribution of a payment to a booking. The balance of
  that booking is derived from the payments carrying its id.
*/
struct FinancialRecord {
  std::string id;
  RecordKind  kind = RecordKind::kReceipt;

  // always positive; direction comes from kind
  util::Cents amount_cents = 0;

  util::Date  date{};
  std::string description;

  std::optional<std::string> booking_id;

  // set when the record was created from a bank line (exact_hash match)
  std::optional<std::string> source_fingerprint;
};

} // namespace recon::db::model
