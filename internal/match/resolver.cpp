#include "resolver.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

#include "internal/fingerprint/fingerprint.hpp"

namespace recon::match {

using db::model::ExternalTransactionRecord;
using db::model::MatchType;

namespace {

constexpr size_t kMinTokenLength = 3;

struct Scored {
  const Candidate* candidate = nullptr;
  double           score     = 0.0;
};

bool RankBefore(const Scored& a, const Scored& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  return std::tie(a.candidate->amount_delta_cents, a.candidate->date_delta_days, a.candidate->record.date, a.candidate->record.id) <
         std::tie(b.candidate->amount_delta_cents, b.candidate->date_delta_days, b.candidate->record.date, b.candidate->record.id);
}

} // namespace

std::string_view ToString(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kNoMatch:
      return "no_match";
    case OutcomeKind::kSingleMatch:
      return "single_match";
    case OutcomeKind::kAmbiguous:
      return "ambiguous";
    case OutcomeKind::kReversalPair:
      return "reversal_pair";
  }
  return "no_match";
}

std::set<std::string> DescriptionTokens(std::string_view description) {
  std::set<std::string> tokens;
  std::string           current;

  const auto flush = [&] {
    if (current.size() >= kMinTokenLength) {
      tokens.insert(current);
    }
    current.clear();
  };

  for (char c : fingerprint::NormalizeDescription(description)) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      current.push_back(c);
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

double Jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
  if (a.empty() && b.empty()) {
    return 0.0;
  }
  size_t shared = 0;
  for (const auto& token : a) {
    shared += b.count(token);
  }
  const size_t combined = a.size() + b.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(combined);
}

Resolver::Resolver(const MatchPolicy& policy) : policy_(policy) {
}

double Resolver::Score(const ExternalTransactionRecord& tx, const Candidate& candidate) const {
  const auto& w     = policy_.scoring;
  double      score = 0.0;

  if (candidate.amount_delta_cents == 0) {
    score += w.exact_amount_bonus;
  }
  if (candidate.date_delta_days == 0) {
    score += w.exact_date_bonus;
  }
  score += w.token_overlap_bonus * Jaccard(DescriptionTokens(tx.description), DescriptionTokens(candidate.record.description));
  return score;
}

MatchOutcome Resolver::Resolve(const ExternalTransactionRecord& tx, const std::vector<Candidate>& candidates) const {
  MatchOutcome outcome;
  if (candidates.empty()) {
    return outcome;
  }

  // exact-hash short-circuit
  std::vector<const Candidate*> hash_hits;
  for (const auto& c : candidates) {
    if (c.record.source_fingerprint && !tx.fingerprint.empty() && *c.record.source_fingerprint == tx.fingerprint) {
      hash_hits.push_back(&c);
    }
  }
  if (hash_hits.size() == 1) {
    outcome.kind       = OutcomeKind::kSingleMatch;
    outcome.record     = hash_hits.front()->record;
    outcome.match_type = MatchType::kExactHash;
    outcome.confidence = 1.0;
    outcome.candidate_ids.push_back(hash_hits.front()->record.id);
    return outcome;
  }
  if (hash_hits.size() > 1) {
    outcome.kind = OutcomeKind::kAmbiguous;
    for (const auto* c : hash_hits) {
      outcome.candidate_ids.push_back(c->record.id);
    }
    return outcome;
  }

  std::vector<Scored> ranked;
  ranked.reserve(candidates.size());
  for (const auto& c : candidates) {
    ranked.push_back(Scored{&c, Score(tx, c)});
  }
  std::sort(ranked.begin(), ranked.end(), RankBefore);

  for (const auto& s : ranked) {
    outcome.candidate_ids.push_back(s.candidate->record.id);
  }

  const auto&  top       = ranked.front();
  const double runner_up = ranked.size() > 1 ? ranked[1].score : 0.0;

  const bool above_threshold = top.score >= policy_.scoring.acceptance_threshold;
  const bool clear_margin    = top.score - runner_up >= policy_.scoring.minimum_margin;

  if (!above_threshold || !clear_margin) {
    outcome.kind = OutcomeKind::kAmbiguous;
    return outcome;
  }

  const double max_score = policy_.scoring.MaxScore();

  outcome.kind       = OutcomeKind::kSingleMatch;
  outcome.record     = top.candidate->record;
  outcome.confidence = max_score > 0.0 ? std::clamp(top.score / max_score, 0.0, 1.0) : 0.0;
  outcome.match_type =
      top.candidate->amount_delta_cents == 0 && top.candidate->date_delta_days == 0 ? MatchType::kExactAmountDate : MatchType::kFuzzy;
  outcome.candidate_ids = {top.candidate->record.id};
  return outcome;
}

std::optional<MatchOutcome> Resolver::ResolveReversal(const ExternalTransactionRecord&              tx,
                                                      const std::vector<ExternalTransactionRecord>& unlinked) const {
  if (tx.amount_cents == 0) {
    return std::nullopt;
  }

  const bool tx_marked = policy_.HasReversalKeyword(tx.description);
  const auto window    = static_cast<int64_t>(policy_.reversal_window_days);

  std::vector<const ExternalTransactionRecord*> counters;
  int64_t                                       nearest = window + 1;

  for (const auto& other : unlinked) {
    if (other.id == tx.id || other.account_id != tx.account_id || other.amount_cents != -tx.amount_cents) {
      continue;
    }
    const auto delta = util::DaysBetween(tx.posted_on, other.posted_on);
    if (delta > window || !(tx_marked || policy_.HasReversalKeyword(other.description))) {
      continue;
    }
    if (delta < nearest) {
      nearest = delta;
      counters.clear();
    }
    if (delta == nearest) {
      counters.push_back(&other);
    }
  }

  if (counters.empty()) {
    return std::nullopt;
  }

  MatchOutcome outcome;
  for (const auto* c : counters) {
    outcome.candidate_ids.push_back(c->id);
  }

  if (counters.size() > 1) {
    outcome.kind = OutcomeKind::kAmbiguous;
    return outcome;
  }

  outcome.kind                = OutcomeKind::kReversalPair;
  outcome.counter_transaction = *counters.front();
  outcome.match_type          = MatchType::kReversalPair;
  outcome.confidence          = 1.0;
  return outcome;
}

} // namespace recon::match
