#include "controller.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <unordered_set>

#include "internal/db/db_errors.hpp"
#include "internal/ingest/importer.hpp"
#include "internal/ledger/balance_recalculator.hpp"
#include "internal/ledger/link_ledger.hpp"
#include "internal/ledger/mutation_journal.hpp"
#include "internal/match/candidate_generator.hpp"
#include "internal/match/resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recon::reconcile {

namespace report = recon::report::v1;

using db::model::ExternalTransactionRecord;

struct Controller::Execution {
  report::ChangeSet       change_set;
  ledger::MutationJournal journal;
};

namespace {

report::OutcomeKind ToProto(match::OutcomeKind kind) {
  switch (kind) {
    case match::OutcomeKind::kNoMatch:
      return report::OUTCOME_NO_MATCH;
    case match::OutcomeKind::kSingleMatch:
      return report::OUTCOME_SINGLE_MATCH;
    case match::OutcomeKind::kAmbiguous:
      return report::OUTCOME_AMBIGUOUS;
    case match::OutcomeKind::kReversalPair:
      return report::OUTCOME_REVERSAL_PAIR;
  }
  return report::OUTCOME_KIND_UNSPECIFIED;
}

std::string CountsText(const report::ChangeCounts& c) {
  return "imported=" + std::to_string(c.imported()) + " duplicates=" + std::to_string(c.duplicates_skipped()) +
         " quarantined=" + std::to_string(c.quarantined()) + " links_created=" + std::to_string(c.links_created()) +
         " links_removed=" + std::to_string(c.links_removed()) + " balance_changes=" + std::to_string(c.balance_changes()) +
         " deleted=" + std::to_string(c.transactions_deleted()) + " detached=" + std::to_string(c.records_detached()) +
         " reattached=" + std::to_string(c.records_reattached());
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

/*
  One pass of the plan against one storage transaction. Everything it
  writes goes through the ledger components and lands in the journal.
*/
class PlanRunner {
 public:
  PlanRunner(std::shared_ptr<db::Repository> repository, db::Transaction& tx, const match::MatchPolicy& policy,
             ledger::MutationJournal& journal, report::ChangeSet& change_set, const ControllerOptions& options, const std::string& run_id)
      : repository_(repository),
        tx_(tx),
        policy_(policy),
        journal_(journal),
        change_set_(change_set),
        counts_(*change_set.mutable_counts()),
        importer_(repository, journal),
        ledger_(repository, journal, options.process_tag, run_id),
        recalculator_(repository, journal),
        now_ms_(util::NowMs()),
        applied_(change_set.mode() == report::RUN_MODE_APPLIED) {
  }

  void RollbackBatch(const std::string& batch_id);
  void Import(const ingest::ImportBatch& batch);
  void Unlink(const std::string& transaction_id);
  void MatchUnlinked();
  void Recompute(const std::vector<std::string>& explicit_booking_ids);

 private:
  void AddIssue(report::IssueKind kind, const std::string& subject, const std::string& message, const std::string& batch_id = {},
                uint32_t line_number = 0);

  void RecordUnlink(const ledger::UnlinkResult& result);
  void RecordLink(const ledger::LinkResult& result, report::TransactionOutcome& outcome);

  void MatchOne(const ExternalTransactionRecord& tx, const std::vector<ExternalTransactionRecord>& unlinked,
                std::unordered_set<std::string>& settled);

  std::shared_ptr<db::Repository> repository_;
  db::Transaction&                tx_;
  const match::MatchPolicy&       policy_;
  ledger::MutationJournal&        journal_;
  report::ChangeSet&              change_set_;
  report::ChangeCounts&           counts_;

  ingest::Importer            importer_;
  ledger::LinkLedger          ledger_;
  ledger::BalanceRecalculator recalculator_;

  std::set<std::string> dirty_bookings_;
  uint64_t              now_ms_;
  bool                  applied_;
};

void PlanRunner::AddIssue(report::IssueKind kind, const std::string& subject, const std::string& message, const std::string& batch_id,
                          uint32_t line_number) {
  auto* issue = change_set_.add_issues();
  issue->set_kind(kind);
  issue->set_subject_id(subject);
  issue->set_message(message);
  issue->set_batch_id(batch_id);
  issue->set_line_number(line_number);
}

void PlanRunner::RecordUnlink(const ledger::UnlinkResult& result) {
  for (const auto& link_id : result.superseded_link_ids) {
    change_set_.add_links_removed(link_id);
  }
  counts_.set_links_removed(counts_.links_removed() + result.superseded_link_ids.size());
  counts_.set_records_detached(counts_.records_detached() + result.detached_record_ids.size());
  dirty_bookings_.insert(result.affected_booking_ids.begin(), result.affected_booking_ids.end());
}

void PlanRunner::RecordLink(const ledger::LinkResult& result, report::TransactionOutcome& outcome) {
  if (applied_) {
    outcome.set_link_id(result.link_id);
  }
  if (!result.created) {
    return;
  }
  counts_.set_links_created(counts_.links_created() + 1);
  if (applied_) {
    change_set_.add_links_created(result.link_id);
  }
  if (result.reattached_booking_id) {
    counts_.set_records_reattached(counts_.records_reattached() + 1);
    dirty_bookings_.insert(*result.reattached_booking_id);
  }
}

void PlanRunner::RollbackBatch(const std::string& batch_id) {
  const auto transactions = repository_->ListExternalTransactionsByBatch(tx_, batch_id);
  if (transactions.empty()) {
    AddIssue(report::ISSUE_NOT_FOUND, batch_id, "import batch has no transactions", batch_id);
    return;
  }

  for (const auto& t : transactions) {
    // the row may already be gone as the partner of an earlier reversal
    if (!repository_->GetExternalTransaction(tx_, t.id)) {
      continue;
    }

    if (repository_->GetActiveLinkForTransaction(tx_, t.id)) {
      RecordUnlink(ledger_.Unlink(tx_, t.id, now_ms_));
    }

    // link rows on both sides go with the transaction
    std::set<std::string> partners;
    for (const auto& link : repository_->ListLinksForTransaction(tx_, t.id)) {
      journal_.Deleted(link);
      if (!link.counter_transaction_id.empty()) {
        partners.insert(link.counter_transaction_id);
      }
    }
    for (const auto& partner : partners) {
      for (const auto& link : repository_->ListLinksForTransaction(tx_, partner)) {
        if (link.counter_transaction_id == t.id) {
          journal_.Deleted(link);
        }
      }
    }

    db::ThrowIfDbError(repository_->DeleteExternalTransaction(tx_, t.id), "rollback batch " + batch_id);
    journal_.Deleted(t);
    counts_.set_transactions_deleted(counts_.transactions_deleted() + 1);
  }

  RECON_LOG_WARN("import batch rolled back", {observability::StringField("batch_id", batch_id),
                                              observability::IntField("transactions", static_cast<int64_t>(transactions.size())),
                                              observability::BoolField("applied", applied_)});
}

void PlanRunner::Import(const ingest::ImportBatch& batch) {
  const auto result = importer_.Import(tx_, batch, now_ms_);

  counts_.set_imported(counts_.imported() + result.imported);
  counts_.set_duplicates_skipped(counts_.duplicates_skipped() + result.duplicates_skipped);
  counts_.set_quarantined(counts_.quarantined() + result.quarantined);

  for (const auto& entry : result.quarantine) {
    AddIssue(report::ISSUE_MISSING_FIELD, entry.id, entry.reason, entry.import_batch_id, entry.line_number);
  }
}

void PlanRunner::Unlink(const std::string& transaction_id) {
  try {
    RecordUnlink(ledger_.Unlink(tx_, transaction_id, now_ms_));
  } catch (const util::NotFound& e) {
    AddIssue(report::ISSUE_NOT_FOUND, transaction_id, e.what());
  }
}

void PlanRunner::MatchUnlinked() {
  observability::SpanScope span("recon.match");

  const auto                      unlinked = repository_->ListUnlinkedExternalTransactions(tx_);
  std::unordered_set<std::string> settled;

  for (const auto& t : unlinked) {
    if (settled.count(t.id) == 0) {
      MatchOne(t, unlinked, settled);
    }
  }

  span.SetAttribute("transactions", static_cast<std::int64_t>(unlinked.size()));
}

void PlanRunner::MatchOne(const ExternalTransactionRecord& t, const std::vector<ExternalTransactionRecord>& unlinked,
                          std::unordered_set<std::string>& settled) {
  match::CandidateGenerator generator(policy_);
  match::Resolver           resolver(policy_);

  auto* outcome = change_set_.add_outcomes();
  outcome->set_transaction_id(t.id);

  const auto finish = [&](const match::MatchOutcome& result) {
    outcome->set_kind(ToProto(result.kind));
    outcome->set_confidence(result.confidence);
    for (const auto& id : result.candidate_ids) {
      outcome->add_candidate_ids(id);
    }
    observability::Metrics::Instance().RecordMatchOutcome(match::ToString(result.kind));
  };

  // offsetting lines are settled against each other, never against records
  std::vector<ExternalTransactionRecord> counters;
  for (const auto& other : unlinked) {
    if (other.amount_cents == -t.amount_cents && settled.count(other.id) == 0) {
      counters.push_back(other);
    }
  }

  if (auto reversal = resolver.ResolveReversal(t, counters)) {
    finish(*reversal);
    if (reversal->kind != match::OutcomeKind::kReversalPair) {
      return;
    }

    const auto& counter = *reversal->counter_transaction;
    outcome->set_counter_transaction_id(counter.id);
    outcome->set_match_type(std::string(db::model::ToString(reversal->match_type)));

    const auto links = ledger_.LinkReversalPair(tx_, t.id, counter.id, now_ms_);
    RecordLink(links[0], *outcome);

    auto* counter_outcome = change_set_.add_outcomes();
    counter_outcome->set_transaction_id(counter.id);
    counter_outcome->set_kind(report::OUTCOME_REVERSAL_PAIR);
    counter_outcome->set_counter_transaction_id(t.id);
    counter_outcome->set_match_type(outcome->match_type());
    counter_outcome->set_confidence(reversal->confidence);
    counter_outcome->add_candidate_ids(t.id);
    RecordLink(links[1], *counter_outcome);

    settled.insert(t.id);
    settled.insert(counter.id);
    return;
  }

  const auto [from, to] = generator.PoolWindow(t);
  const auto pool       = repository_->ListFinancialRecordsInRange(tx_, from, to);

  std::unordered_set<std::string> linked_records;
  for (const auto& record : pool) {
    if (!repository_->ListActiveLinksForRecord(tx_, record.id).empty()) {
      linked_records.insert(record.id);
    }
  }

  const auto result = resolver.Resolve(t, generator.Candidates(t, pool, linked_records));
  finish(result);
  if (result.kind != match::OutcomeKind::kSingleMatch) {
    return;
  }

  const auto& record = *result.record;
  outcome->set_record_id(record.id);
  outcome->set_match_type(std::string(db::model::ToString(result.match_type)));

  try {
    RecordLink(ledger_.Link(tx_, t.id, record.id, result.match_type, result.confidence, now_ms_), *outcome);
  } catch (const util::AmbiguousLinkConflict& e) {
    AddIssue(report::ISSUE_AMBIGUOUS_LINK_CONFLICT, e.TransactionId(), e.what());
    return;
  }

  settled.insert(t.id);
  if (record.booking_id) {
    dirty_bookings_.insert(*record.booking_id);
  }
}

void PlanRunner::Recompute(const std::vector<std::string>& explicit_booking_ids) {
  std::set<std::string> bookings(explicit_booking_ids.begin(), explicit_booking_ids.end());
  bookings.insert(dirty_bookings_.begin(), dirty_bookings_.end());

  for (const auto& booking_id : bookings) {
    ledger::BookingBalance balance;
    try {
      balance = recalculator_.Recompute(tx_, booking_id, now_ms_);
    } catch (const util::IncompleteBookingError& e) {
      AddIssue(report::ISSUE_INCOMPLETE_BOOKING, e.BookingId(), e.what());
      continue;
    } catch (const util::NotFound& e) {
      AddIssue(report::ISSUE_NOT_FOUND, booking_id, e.what());
      continue;
    }

    if (!balance.charges_consistent) {
      AddIssue(report::ISSUE_CHARGE_MISMATCH, booking_id,
               "charges total " + util::FormatCents(balance.charges_total_cents) + " differs from total due " +
                   util::FormatCents(balance.total_due_cents));
    }

    if (!balance.changed) {
      continue;
    }

    auto* change = change_set_.add_balance_changes();
    change->set_booking_id(booking_id);
    change->set_old_paid_cents(balance.old_paid_cents);
    change->set_new_paid_cents(balance.paid_cents);
    change->set_old_balance_cents(balance.old_balance_cents);
    change->set_new_balance_cents(balance.balance_cents);
    change->set_total_due_cents(balance.total_due_cents);
    change->set_charges_total_cents(balance.charges_total_cents);
    change->set_charges_consistent(balance.charges_consistent);
    counts_.set_balance_changes(counts_.balance_changes() + 1);
  }
}

} // namespace

Controller::Controller(std::shared_ptr<db::Repository> repository, match::MatchPolicy policy, std::shared_ptr<backup::SnapshotSink> snapshot_sink,
                       RunRequest request, ControllerOptions options)
    : repository_(std::move(repository)),
      policy_(std::move(policy)),
      snapshot_sink_(std::move(snapshot_sink)),
      request_(std::move(request)),
      options_(std::move(options)),
      run_id_(util::NewId()) {
  if (!repository_) {
    throw std::invalid_argument("controller requires a repository");
  }
  if (!snapshot_sink_) {
    throw std::invalid_argument("controller requires a snapshot sink");
  }
}

Controller::Execution Controller::Execute(db::Transaction& tx, report::RunMode mode) {
  Execution exec;
  exec.change_set.set_run_id(run_id_);
  exec.change_set.set_mode(mode);
  *exec.change_set.mutable_generated_at() = util::ToProto(util::Now());
  exec.change_set.mutable_counts();

  PlanRunner plan(repository_, tx, policy_, exec.journal, exec.change_set, options_, run_id_);

  for (const auto& batch_id : request_.rollback_batch_ids) {
    plan.RollbackBatch(batch_id);
  }
  for (const auto& batch : request_.imports) {
    plan.Import(batch);
  }
  for (const auto& transaction_id : request_.unlink_transaction_ids) {
    plan.Unlink(transaction_id);
  }
  if (request_.match_unlinked) {
    plan.MatchUnlinked();
  }
  plan.Recompute(request_.recompute_booking_ids);

  const auto& rows  = exec.journal.Rows();
  const auto  limit = std::min<size_t>(rows.size(), options_.sample_limit);
  for (size_t i = 0; i < limit; ++i) {
    *exec.change_set.add_samples() = rows[i];
  }

  return exec;
}

report::ChangeSet Controller::Preview() {
  if (state_ == ControllerState::kApplied) {
    throw util::InvalidState("run " + run_id_ + " was already applied");
  }

  observability::SpanScope span("recon.preview");
  span.SetAttribute("run_id", run_id_);
  const auto start = std::chrono::steady_clock::now();

  auto tx   = repository_->Begin();
  auto exec = Execute(*tx, report::RUN_MODE_PREVIEW);
  tx->Rollback();

  preview_counts_ = exec.change_set.counts();

  const auto elapsed = ElapsedMs(start);
  observability::Metrics::Instance().ObserveRunDurationMs("preview", elapsed);
  RECON_LOG_INFO("preview computed", {observability::StringField("run_id", run_id_),
                                      observability::StringField("counts", CountsText(exec.change_set.counts())),
                                      observability::IntField("issues", exec.change_set.issues_size()),
                                      observability::DoubleField("duration_ms", elapsed)});
  return std::move(exec.change_set);
}

report::ChangeSet Controller::Apply() {
  if (state_ == ControllerState::kApplied) {
    throw util::InvalidState("run " + run_id_ + " was already applied; undo needs a reversing run");
  }
  if (!preview_counts_) {
    throw util::InvalidState("apply requires a preview of the same run");
  }

  observability::SpanScope span("recon.apply");
  span.SetAttribute("run_id", run_id_);
  const auto start = std::chrono::steady_clock::now();

  auto tx = repository_->Begin();

  const auto fail = [&](const std::string& reason) {
    observability::Metrics::Instance().RecordApplyAbort();
    span.RecordException(reason);
    preview_counts_.reset();
    if (!tx->IsCommitted()) {
      try {
        tx->Rollback();
      } catch (const std::exception& e) {
        RECON_LOG_ERROR("rollback after aborted apply failed", {observability::StringField("run_id", run_id_),
                                                                 observability::StringField("error", e.what())});
      }
    }
    RECON_LOG_ERROR("apply aborted", {observability::StringField("run_id", run_id_), observability::StringField("reason", reason)});
    return util::ApplyAbortError("apply aborted: " + reason);
  };

  std::optional<Execution> exec;
  try {
    exec.emplace(Execute(*tx, report::RUN_MODE_APPLIED));
  } catch (const std::exception& e) {
    throw fail(std::string("mutation failed: ") + e.what());
  }

  auto& change_set = exec->change_set;
  if (!google::protobuf::util::MessageDifferencer::Equals(change_set.counts(), *preview_counts_)) {
    throw fail("state changed since preview (preview " + CountsText(*preview_counts_) + ", apply " + CountsText(change_set.counts()) + ")");
  }

  if (exec->journal.Size() > 0) {
    report::BackupSnapshot snapshot;
    snapshot.set_snapshot_id(util::NewId());
    snapshot.set_run_id(run_id_);
    *snapshot.mutable_taken_at() = util::ToProto(util::Now());
    for (const auto& row : exec->journal.Rows()) {
      *snapshot.add_rows() = row;
    }

    try {
      change_set.set_snapshot_location(snapshot_sink_->Write(snapshot));
    } catch (const std::exception& e) {
      throw fail(std::string("backup snapshot failed: ") + e.what());
    }
  }

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    throw fail(std::string("commit failed: ") + e.what());
  }

  state_ = ControllerState::kApplied;

  const auto elapsed = ElapsedMs(start);
  observability::Metrics::Instance().ObserveRunDurationMs("apply", elapsed);
  RECON_LOG_INFO("run applied", {observability::StringField("run_id", run_id_),
                                 observability::StringField("counts", CountsText(change_set.counts())),
                                 observability::StringField("snapshot", change_set.snapshot_location()),
                                 observability::DoubleField("duration_ms", elapsed)});
  return std::move(change_set);
}

} // namespace recon::reconcile
