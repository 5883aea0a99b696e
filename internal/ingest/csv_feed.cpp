#include "csv_feed.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>

#include "internal/fingerprint/fingerprint.hpp"

namespace recon::ingest {

namespace {

std::string Trim(std::string_view s) {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return std::string(s.substr(begin, end - begin));
}

bool IsHeader(const std::vector<std::string>& cells) {
  if (cells.empty()) {
    return false;
  }
  auto first = Trim(cells.front());
  std::transform(first.begin(), first.end(), first.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return first == "date";
}

// Both empty -> unset. One malformed -> unset.
std::optional<util::Cents> SignedAmount(const std::string& debit, const std::string& credit) {
  if (debit.empty() && credit.empty()) {
    return std::nullopt;
  }

  util::Cents amount = 0;
  if (!debit.empty()) {
    auto value = util::ParseCents(debit);
    if (!value) return std::nullopt;
    amount -= util::AbsCents(*value);
  }
  if (!credit.empty()) {
    auto value = util::ParseCents(credit);
    if (!value) return std::nullopt;
    amount += util::AbsCents(*value);
  }
  return amount;
}

} // namespace

std::vector<std::string> SplitCsvRow(std::string_view row) {
  std::vector<std::string> cells;
  std::string              cell;
  bool                     quoted = false;

  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];
    if (quoted) {
      if (c == '"' && i + 1 < row.size() && row[i + 1] == '"') {
        cell.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        cell.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      cells.push_back(std::move(cell));
      cell.clear();
    } else if (c != '\r') {
      cell.push_back(c);
    }
  }
  cells.push_back(std::move(cell));
  return cells;
}

std::optional<std::string> ExtractCounterparty(std::string_view description) {
  static constexpr std::array<std::string_view, 4> kPrefixes = {"E-TRANSFER FROM ", "E-TRANSFER TO ", "INTERAC E-TRANSFER FROM ",
                                                                "INTERAC E-TRANSFER TO "};

  const auto normalized = fingerprint::NormalizeDescription(description);
  for (auto prefix : kPrefixes) {
    if (normalized.rfind(prefix, 0) == 0) {
      auto name = Trim(std::string_view(normalized).substr(prefix.size()));
      if (!name.empty()) {
        return name;
      }
    }
  }
  return std::nullopt;
}

ImportBatch CsvFeedReader::ReadFile(const std::string& path, const std::string& account_id, const std::string& batch_id) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open feed file: " + path);
  }
  return Parse(in, path, account_id, batch_id);
}

ImportBatch CsvFeedReader::Parse(std::istream& in, const std::string& source_file, const std::string& account_id, const std::string& batch_id) {
  ImportBatch batch;
  batch.batch_id    = batch_id;
  batch.source_file = source_file;

  std::string row;
  uint32_t    line_number = 0;

  while (std::getline(in, row)) {
    ++line_number;
    if (Trim(row).empty()) {
      continue;
    }

    auto cells = SplitCsvRow(row);
    if (line_number == 1 && IsHeader(cells)) {
      continue;
    }
    cells.resize(std::max<size_t>(cells.size(), 4));

    ImportLine line;
    line.line_number  = line_number;
    line.raw          = row;
    line.posted_on    = util::ParseDate(Trim(cells[0]));
    line.description  = Trim(cells[1]);
    line.amount_cents = SignedAmount(Trim(cells[2]), Trim(cells[3]));
    line.account_id   = account_id;
    line.counterparty = ExtractCounterparty(line.description);

    if (!line.raw.empty() && line.raw.back() == '\r') {
      line.raw.pop_back();
    }

    batch.lines.push_back(std::move(line));
  }

  if (in.bad()) {
    throw std::runtime_error("error reading feed: " + source_file);
  }
  return batch;
}

} // namespace recon::ingest
