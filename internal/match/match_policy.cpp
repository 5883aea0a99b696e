#include "match_policy.hpp"

#include <algorithm>

#include "config/config.pb.h"
#include "internal/fingerprint/fingerprint.hpp"

namespace recon::match {

namespace {

Tolerance ApplyTolerance(const recon::runtime::config::TolerancePolicy& policy, Tolerance base) {
  if (policy.has_date_window_days()) {
    base.date_window_days = policy.date_window_days();
  }
  if (policy.has_amount_tolerance_cents()) {
    base.amount_tolerance_cents = static_cast<util::Cents>(policy.amount_tolerance_cents());
  }
  return base;
}

bool ContainsKeyword(const std::string& normalized, const std::vector<std::string>& keywords) {
  return std::any_of(keywords.begin(), keywords.end(), [&](const std::string& keyword) {
    return !keyword.empty() && normalized.find(keyword) != std::string::npos;
  });
}

} // namespace

MatchPolicy MatchPolicy::FromConfig(const recon::runtime::config::MatchingConfig& config) {
  MatchPolicy policy;

  if (config.has_default_tolerance()) {
    policy.default_tolerance = ApplyTolerance(config.default_tolerance(), policy.default_tolerance);
  }

  for (const auto& rule_config : config.counterparty_rules()) {
    CounterpartyRule rule;
    rule.counterparty_type = rule_config.counterparty_type();
    for (const auto& keyword : rule_config.description_keywords()) {
      rule.description_keywords.push_back(fingerprint::NormalizeDescription(keyword));
    }
    rule.account_ids.assign(rule_config.account_ids().begin(), rule_config.account_ids().end());
    rule.tolerance = ApplyTolerance(rule_config.tolerance(), policy.default_tolerance);
    policy.rules.push_back(std::move(rule));
  }

  if (config.has_scoring()) {
    const auto& s = config.scoring();
    if (s.has_exact_amount_bonus()) policy.scoring.exact_amount_bonus = s.exact_amount_bonus();
    if (s.has_exact_date_bonus()) policy.scoring.exact_date_bonus = s.exact_date_bonus();
    if (s.has_token_overlap_bonus()) policy.scoring.token_overlap_bonus = s.token_overlap_bonus();
    if (s.has_acceptance_threshold()) policy.scoring.acceptance_threshold = s.acceptance_threshold();
    if (s.has_minimum_margin()) policy.scoring.minimum_margin = s.minimum_margin();
  }

  if (config.has_reversal_window_days()) {
    policy.reversal_window_days = config.reversal_window_days();
  }
  if (config.reversal_keywords_size() > 0) {
    policy.reversal_keywords.clear();
    for (const auto& keyword : config.reversal_keywords()) {
      policy.reversal_keywords.push_back(fingerprint::NormalizeDescription(keyword));
    }
  }

  return policy;
}

Classification MatchPolicy::Classify(const db::model::ExternalTransactionRecord& tx) const {
  const auto normalized = fingerprint::NormalizeDescription(tx.description);

  for (const auto& rule : rules) {
    const bool account_listed = std::find(rule.account_ids.begin(), rule.account_ids.end(), tx.account_id) != rule.account_ids.end();
    if (account_listed || ContainsKeyword(normalized, rule.description_keywords)) {
      return {rule.counterparty_type, rule.tolerance};
    }
  }

  return {std::string(kDefaultCounterpartyType), default_tolerance};
}

bool MatchPolicy::HasReversalKeyword(std::string_view description) const {
  return ContainsKeyword(fingerprint::NormalizeDescription(description), reversal_keywords);
}

} // namespace recon::match
