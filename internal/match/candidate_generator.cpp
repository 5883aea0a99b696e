#include "candidate_generator.hpp"

#include <algorithm>
#include <tuple>

namespace recon::match {

using db::model::ExternalTransactionRecord;
using db::model::FinancialRecord;
using db::model::RecordKind;

CandidateGenerator::CandidateGenerator(const MatchPolicy& policy) : policy_(policy) {
}

std::pair<util::Date, util::Date> CandidateGenerator::PoolWindow(const ExternalTransactionRecord& tx) const {
  const auto window = static_cast<int64_t>(policy_.Classify(tx).tolerance.date_window_days);
  return {util::AddDays(tx.posted_on, -window), util::AddDays(tx.posted_on, window)};
}

std::vector<Candidate> CandidateGenerator::Candidates(const ExternalTransactionRecord&        tx,
                                                      const std::vector<FinancialRecord>&     pool,
                                                      const std::unordered_set<std::string>& linked_record_ids) const {
  std::vector<Candidate> out;
  if (tx.amount_cents == 0) {
    return out;
  }

  const auto tolerance = policy_.Classify(tx).tolerance;
  const auto direction = tx.amount_cents > 0 ? RecordKind::kPayment : RecordKind::kReceipt;
  const auto magnitude = util::AbsCents(tx.amount_cents);

  for (const auto& record : pool) {
    if (record.kind != direction || linked_record_ids.count(record.id) != 0) {
      continue;
    }

    const auto amount_delta = util::AbsCents(magnitude - record.amount_cents);
    const auto date_delta   = util::DaysBetween(tx.posted_on, record.date);

    if (amount_delta > tolerance.amount_tolerance_cents || date_delta > static_cast<int64_t>(tolerance.date_window_days)) {
      continue;
    }

    out.push_back(Candidate{record, amount_delta, date_delta});
  }

  std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
    return std::tie(a.amount_delta_cents, a.date_delta_days, a.record.date, a.record.id) <
           std::tie(b.amount_delta_cents, b.date_delta_days, b.record.date, b.record.id);
  });

  return out;
}

} // namespace recon::match
