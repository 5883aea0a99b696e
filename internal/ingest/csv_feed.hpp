#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/date.hpp"
#include "internal/util/money.hpp"

namespace recon::ingest {

/*
  One incoming bank line.

  Fields are optional because feeds are not trusted; completeness is
  checked by fingerprinting, which routes incomplete lines to the
  quarantine queue.
*/
struct ImportLine {
  uint32_t    line_number = 0;
  std::string raw;

  std::optional<util::Date>  posted_on;
  std::optional<util::Cents> amount_cents;
  std::string                description;
  std::string                account_id;

  std::optional<std::string> counterparty;
};

struct ImportBatch {
  std::string batch_id;
  std::string source_file;

  std::vector<ImportLine> lines;
};

/*
  Reader for the bank's "date, description, debit, credit" CSV export.

  - an optional header row is skipped when its first cell is "date"
  - debit is money out (negative amount), credit money in
  - blank rows are ignored, extra trailing columns too
  - unparseable dates or amounts leave the field unset
*/
class CsvFeedReader {
 public:
  static ImportBatch ReadFile(const std::string& path, const std::string& account_id, const std::string& batch_id);

  static ImportBatch Parse(std::istream& in, const std::string& source_file, const std::string& account_id, const std::string& batch_id);
};

// RFC 4180 cells: quoted cells may contain commas and doubled quotes.
std::vector<std::string> SplitCsvRow(std::string_view row);

// Name after "E-TRANSFER FROM"/"E-TRANSFER TO" style prefixes, if any.
std::optional<std::string> ExtractCounterparty(std::string_view description);

} // namespace recon::ingest
