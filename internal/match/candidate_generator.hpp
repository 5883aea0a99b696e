#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/db/model/external_transaction_record.hpp"
#include "internal/db/model/financial_record.hpp"
#include "match_policy.hpp"

namespace recon::match {

struct Candidate {
  db::model::FinancialRecord record;

  util::Cents amount_delta_cents = 0;
  int64_t     date_delta_days    = 0;
};

/*
  CandidateGenerator

  Pure filter over a record pool. Keeps records that
    - face the same direction (money in -> payment, money out -> receipt)
    - are not already actively linked
    - lie within the date window and amount tolerance of the
      transaction's counterparty type

  Output order: amount delta, date delta, earlier record date, id.
*/
class CandidateGenerator {
 public:
  explicit CandidateGenerator(const MatchPolicy& policy);

  std::vector<Candidate> Candidates(const db::model::ExternalTransactionRecord&     tx,
                                    const std::vector<db::model::FinancialRecord>& pool,
                                    const std::unordered_set<std::string>&         linked_record_ids) const;

  // Inclusive date range the pool has to cover for tx.
  std::pair<util::Date, util::Date> PoolWindow(const db::model::ExternalTransactionRecord& tx) const;

 private:
  const MatchPolicy& policy_;
};

} // namespace recon::match
