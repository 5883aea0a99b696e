#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "candidate_generator.hpp"
#include "internal/db/model/link_record.hpp"
#include "match_policy.hpp"

namespace recon::match {

enum class OutcomeKind {
  kNoMatch,
  kSingleMatch,
  kAmbiguous,
  kReversalPair,
};

std::string_view ToString(OutcomeKind kind);

/*
  Result of resolving one external transaction.

  kSingleMatch   record, match_type and confidence are set
  kReversalPair  counter_transaction is set, confidence 1.0
  kAmbiguous     candidate_ids lists the contenders, nothing is linked
  kNoMatch       nothing to link
*/
struct MatchOutcome {
  OutcomeKind kind = OutcomeKind::kNoMatch;

  std::optional<db::model::FinancialRecord>           record;
  std::optional<db::model::ExternalTransactionRecord> counter_transaction;

  db::model::MatchType match_type = db::model::MatchType::kFuzzy;
  double               confidence = 0.0;

  std::vector<std::string> candidate_ids;
};

/*
  Resolver

  Scores candidates and picks a winner only when it is both above the
  acceptance threshold and ahead of the runner-up by the minimum
  margin. Everything else is Ambiguous; the resolver never guesses.
*/
class Resolver {
 public:
  explicit Resolver(const MatchPolicy& policy);

  double Score(const db::model::ExternalTransactionRecord& tx, const Candidate& candidate) const;

  MatchOutcome Resolve(const db::model::ExternalTransactionRecord& tx, const std::vector<Candidate>& candidates) const;

  /*
    Looks for an equal-and-opposite line on the same account inside the
    reversal window, where at least one side carries a reversal keyword.

    Returns nullopt when tx is not part of a reversal, otherwise a
    kReversalPair outcome or kAmbiguous when two counters are equally
    near. A reversal is never matched against records.
  */
  std::optional<MatchOutcome> ResolveReversal(const db::model::ExternalTransactionRecord&              tx,
                                              const std::vector<db::model::ExternalTransactionRecord>& unlinked) const;

 private:
  const MatchPolicy& policy_;
};

// Tokens of length >= 3 from the normalized description.
std::set<std::string> DescriptionTokens(std::string_view description);

double Jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

} // namespace recon::match
