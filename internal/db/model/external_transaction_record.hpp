#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/date.hpp"
#include "internal/util/money.hpp"

namespace recon::db::model {

/*
  Imported bank-feed line.

  IMPORTANT:
  - Immutable once imported. Corrections arrive as new rows plus a reversal.
  - fingerprint is unique across the table; a collision means "already imported".
  - Rows are deleted only by an explicit batch rollback.
*/

struct ExternalTransactionRecord {
  std::string id; // UUID
  std::string fingerprint;

  util::Date posted_on{};

  // credit / money in is positive, debit / money out negative
  util::Cents amount_cents = 0;

  std::string description;
  std::string account_id;
  std::string import_batch_id;
  std::string source_file;

  std::optional<std::string> counterparty;

  uint64_t imported_at_ms = 0;
};

} // namespace recon::db::model
