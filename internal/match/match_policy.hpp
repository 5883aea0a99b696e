#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/external_transaction_record.hpp"
#include "internal/util/money.hpp"

namespace recon::runtime::config {
class MatchingConfig;
}

namespace recon::match {

struct Tolerance {
  uint32_t    date_window_days       = 3;
  util::Cents amount_tolerance_cents = 0;
};

/*
  Classifies a bank line into a counterparty type. A rule matches when
  one of its keywords occurs in the normalized description or the
  line's source account is listed.
*/
struct CounterpartyRule {
  std::string              counterparty_type;
  std::vector<std::string> description_keywords; // upper-case
  std::vector<std::string> account_ids;
  Tolerance                tolerance;
};

struct ScoringWeights {
  double exact_amount_bonus   = 50.0;
  double exact_date_bonus     = 30.0;
  double token_overlap_bonus  = 40.0;
  double acceptance_threshold = 50.0;
  double minimum_margin       = 10.0;

  double MaxScore() const {
    return exact_amount_bonus + exact_date_bonus + token_overlap_bonus;
  }
};

struct Classification {
  std::string counterparty_type;
  Tolerance   tolerance;
};

/*
  Matching configuration resolved once per run.

  Fields absent from the YAML keep the defaults below: 3-day window,
  exact amount, and the reversal keywords seen on the bank exports.
*/
struct MatchPolicy {
  static constexpr std::string_view kDefaultCounterpartyType = "default";

  Tolerance                     default_tolerance;
  std::vector<CounterpartyRule> rules;
  ScoringWeights                scoring;
  uint32_t                      reversal_window_days = 3;
  std::vector<std::string>      reversal_keywords{"REVERSAL", "REVERSED", "NSF", "RETURNED"};

  static MatchPolicy FromConfig(const recon::runtime::config::MatchingConfig& config);

  // First matching rule wins; default tolerance otherwise.
  Classification Classify(const db::model::ExternalTransactionRecord& tx) const;

  bool HasReversalKeyword(std::string_view description) const;
};

} // namespace recon::match
