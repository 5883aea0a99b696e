#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recon::db::model {

enum class MatchType {
  kExactHash,
  kExactAmountDate,
  kFuzzy,
  kReversalPair,
};

inline std::string_view ToString(MatchType type) {
  switch (type) {
    case MatchType::kExactHash:
      return "exact_hash";
    case MatchType::kExactAmountDate:
      return "exact_amount_date";
    case MatchType::kFuzzy:
      return "fuzzy";
    case MatchType::kReversalPair:
      return "reversal_pair";
  }
  return "fuzzy";
}

inline std::optional<MatchType> MatchTypeFromString(std::string_view s) {
  if (s == "exact_hash") return MatchType::kExactHash;
  if (s == "exact_amount_date") return MatchType::kExactAmountDate;
  if (s == "fuzzy") return MatchType::kFuzzy;
  if (s == "reversal_pair") return MatchType::kReversalPair;
  return std::nullopt;
}

/*
  Association between one external transaction and its counterpart.

  IMPORTANT:
  - Append-only. Unlinking sets superseded, rows are never updated otherwise.
  - At most one non-superseded link per transaction_id.
  - Counterpart is record_id, or counter_transaction_id for reversal pairs
    (exactly one of the two is set).
*/
struct LinkRecord {
  std::string link_id; // UUID
  std::string transaction_id;

  std::string record_id;
  std::string counter_transaction_id;

  MatchType match_type = MatchType::kFuzzy;
  double    confidence = 0.0;

  uint64_t    created_at_ms = 0;
  std::string created_by;
  std::string run_id;

  bool     superseded       = false;
  uint64_t superseded_at_ms = 0;

  // booking the linked payment was detached from on unlink
  std::optional<std::string> detached_booking_id;
};

} // namespace recon::db::model
