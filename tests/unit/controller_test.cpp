#include "internal/reconcile/controller.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fingerprint/fingerprint.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace recon;
namespace report = recon::report::v1;

using reconcile::Controller;
using reconcile::ControllerState;
using reconcile::RunRequest;

class RecordingSink final : public backup::SnapshotSink {
 public:
  std::string Write(const report::BackupSnapshot& snapshot) override {
    snapshots.push_back(snapshot);
    return "memory://" + snapshot.run_id();
  }

  std::vector<report::BackupSnapshot> snapshots;
};

class FailingSink final : public backup::SnapshotSink {
 public:
  std::string Write(const report::BackupSnapshot&) override {
    throw std::runtime_error("disk full");
  }
};

void Commit(db::Repository& repo, const std::function<void(db::Transaction&)>& fn) {
  auto tx = repo.Begin();
  fn(*tx);
  tx->Commit();
}

void SeedBookingWithPayment(db::Repository& repo, const std::string& payment_id) {
  Commit(repo, [&](db::Transaction& tx) {
    if (!repo.GetBooking(tx, "X")) {
      db::model::BookingRecord booking;
      booking.id              = "X";
      booking.total_due_cents = 120000;
      booking.balance_cents   = 120000;
      const auto r            = repo.InsertBooking(tx, booking);
      assert(r);
    }

    db::model::FinancialRecord payment;
    payment.id           = payment_id;
    payment.kind         = db::model::RecordKind::kPayment;
    payment.amount_cents = 50000;
    payment.date         = *util::ParseDate("2024-05-01");
    payment.description  = "CHARTER PAYMENT";
    payment.booking_id   = "X";
    const auto r         = repo.InsertFinancialRecord(tx, payment);
    assert(r);
  });
}

ingest::ImportBatch Feed(const std::string& csv, const std::string& batch_id) {
  std::istringstream in(csv);
  return ingest::CsvFeedReader::Parse(in, "cibc8362.csv", "0228362", batch_id);
}

RunRequest ImportRequest(const std::string& batch_id = "b1") {
  RunRequest request;
  request.imports.push_back(Feed("2024-05-01,DEPOSIT,,500.00\n", batch_id));
  return request;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

size_t ImportedCount(db::Repository& repo, const std::string& batch_id = "b1") {
  auto tx = repo.Begin();
  return repo.ListExternalTransactionsByBatch(*tx, batch_id).size();
}

util::Cents PaidOf(db::Repository& repo, const std::string& booking_id) {
  auto tx = repo.Begin();
  return repo.GetBooking(*tx, booking_id)->paid_cents;
}

void TestPreviewHasNoSideEffects() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<RecordingSink>();
  SeedBookingWithPayment(*repo, "p1");

  Controller controller(repo, match::MatchPolicy{}, sink, ImportRequest());

  const auto first  = controller.Preview();
  const auto second = controller.Preview();

  assert(first.mode() == report::RUN_MODE_PREVIEW);
  assert(first.counts().imported() == 1);
  assert(first.counts().links_created() == 1);
  assert(first.counts().balance_changes() == 1);
  assert(first.links_created_size() == 0);
  assert(first.outcomes_size() == 1);
  assert(first.outcomes(0).kind() == report::OUTCOME_SINGLE_MATCH);
  assert(first.outcomes(0).record_id() == "p1");
  assert(first.outcomes(0).link_id().empty());
  assert(first.balance_changes(0).new_paid_cents() == 50000);
  assert(first.balance_changes(0).new_balance_cents() == 70000);
  assert(first.samples_size() > 0);
  assert(first.snapshot_location().empty());

  assert(second.counts().SerializeAsString() == first.counts().SerializeAsString());
  assert(ImportedCount(*repo) == 0);
  assert(PaidOf(*repo, "X") == 0);
  assert(sink->snapshots.empty());
  assert(controller.State() == ControllerState::kPreview);
}

void TestApplyCommitsWhatWasPreviewed() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<RecordingSink>();
  SeedBookingWithPayment(*repo, "p1");

  Controller controller(repo, match::MatchPolicy{}, sink, ImportRequest());

  assert(Throws<util::InvalidState>([&] { controller.Apply(); }));

  const auto preview = controller.Preview();
  const auto applied = controller.Apply();

  assert(applied.mode() == report::RUN_MODE_APPLIED);
  assert(applied.run_id() == controller.RunId());
  assert(applied.counts().SerializeAsString() == preview.counts().SerializeAsString());
  assert(applied.links_created_size() == 1);
  assert(applied.outcomes(0).link_id() == applied.links_created(0));
  assert(applied.snapshot_location() == "memory://" + controller.RunId());
  assert(controller.State() == ControllerState::kApplied);

  assert(sink->snapshots.size() == 1);
  const auto& snapshot = sink->snapshots[0];
  assert(snapshot.run_id() == controller.RunId());

  bool booking_before_image = false;
  for (const auto& row : snapshot.rows()) {
    if (row.table() == "bookings") {
      booking_before_image = row.existed_before() && row.before().fields().at("paid_cents").number_value() == 0;
    }
  }
  assert(booking_before_image);

  assert(PaidOf(*repo, "X") == 50000);
  {
    auto tx     = repo->Begin();
    auto lines  = repo->ListExternalTransactionsByBatch(*tx, "b1");
    auto active = repo->GetActiveLinkForTransaction(*tx, lines.at(0).id);
    assert(active && active->record_id == "p1");
    assert(active->run_id == controller.RunId());
  }

  // one-way: a second apply or preview is refused
  assert(Throws<util::InvalidState>([&] { controller.Apply(); }));
  assert(Throws<util::InvalidState>([&] { controller.Preview(); }));
}

void TestApplyAbortsWhenStateMoved() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<RecordingSink>();
  SeedBookingWithPayment(*repo, "p1");

  Controller controller(repo, match::MatchPolicy{}, sink, ImportRequest());
  const auto preview = controller.Preview();
  assert(preview.counts().links_created() == 1);

  // a twin payment makes the match ambiguous
  SeedBookingWithPayment(*repo, "p2");

  assert(Throws<util::ApplyAbortError>([&] { controller.Apply(); }));
  assert(ImportedCount(*repo) == 0);
  assert(PaidOf(*repo, "X") == 0);
  assert(sink->snapshots.empty());
  assert(controller.State() == ControllerState::kPreview);

  // the aborted apply consumed the preview
  assert(Throws<util::InvalidState>([&] { controller.Apply(); }));

  const auto fresh = controller.Preview();
  assert(fresh.counts().links_created() == 0);
  assert(fresh.outcomes(0).kind() == report::OUTCOME_AMBIGUOUS);
  assert(fresh.outcomes(0).candidate_ids_size() == 2);

  const auto applied = controller.Apply();
  assert(applied.counts().imported() == 1);
  assert(PaidOf(*repo, "X") == 0);
}

// two same-day lines of one feed compete for two equal payments; the
// line with the matching description decides which one the other gets
void TestSameBatchLinesMatchInTheSameOrderTwice() {
  std::vector<std::string> first_links;

  for (int round = 0; round < 5; ++round) {
    auto repo = std::make_shared<db::memory::MemoryRepository>();
    auto sink = std::make_shared<RecordingSink>();

    Commit(*repo, [&](db::Transaction& tx) {
      for (const auto& [id, description] : {std::pair{"r1", "ACME"}, std::pair{"r2", ""}}) {
        db::model::FinancialRecord payment;
        payment.id           = id;
        payment.kind         = db::model::RecordKind::kPayment;
        payment.amount_cents = 30000;
        payment.date         = *util::ParseDate("2024-05-01");
        payment.description  = description;
        const auto r         = repo->InsertFinancialRecord(tx, payment);
        assert(r);
      }
    });

    RunRequest request;
    request.imports.push_back(Feed("2024-05-01,ACME,,300.00\n2024-05-01,ZED,,300.00\n", "b1"));

    Controller controller(repo, match::MatchPolicy{}, sink, std::move(request));

    const auto preview = controller.Preview();
    const auto applied = controller.Apply();

    assert(preview.counts().imported() == 2);
    assert(applied.counts().SerializeAsString() == preview.counts().SerializeAsString());
    assert(applied.outcomes_size() == preview.outcomes_size());

    auto tx = repo->Begin();
    for (int i = 0; i < preview.outcomes_size(); ++i) {
      const auto& planned = preview.outcomes(i);
      assert(applied.outcomes(i).transaction_id() == planned.transaction_id());
      assert(applied.outcomes(i).kind() == planned.kind());
      assert(applied.outcomes(i).record_id() == planned.record_id());

      const auto row = repo->GetExternalTransaction(*tx, planned.transaction_id());
      assert(row);
      assert(row->id == fingerprint::TransactionId(row->fingerprint));
    }

    std::vector<std::string> links;
    for (const auto& row : repo->ListExternalTransactionsByBatch(*tx, "b1")) {
      const auto active = repo->GetActiveLinkForTransaction(*tx, row.id);
      links.push_back(row.description + "=" + (active ? active->record_id : std::string("-")));
    }

    if (round == 0) {
      first_links = links;
    }
    assert(links == first_links);
  }
}

void TestSnapshotFailureAbortsApply() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  SeedBookingWithPayment(*repo, "p1");

  Controller controller(repo, match::MatchPolicy{}, std::make_shared<FailingSink>(), ImportRequest());
  controller.Preview();

  assert(Throws<util::ApplyAbortError>([&] { controller.Apply(); }));
  assert(ImportedCount(*repo) == 0);
  assert(PaidOf(*repo, "X") == 0);
}

void TestNothingToDoWritesNoSnapshot() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<RecordingSink>();

  Controller controller(repo, match::MatchPolicy{}, sink, RunRequest{});
  controller.Preview();
  const auto applied = controller.Apply();

  assert(applied.snapshot_location().empty());
  assert(sink->snapshots.empty());
}

void TestBatchRollbackUndoesImportAndBalance() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<RecordingSink>();
  SeedBookingWithPayment(*repo, "p1");

  {
    Controller run(repo, match::MatchPolicy{}, sink, ImportRequest());
    run.Preview();
    run.Apply();
  }
  assert(PaidOf(*repo, "X") == 50000);

  RunRequest request;
  request.rollback_batch_ids = {"b1", "never-imported"};

  Controller run(repo, match::MatchPolicy{}, sink, request);
  run.Preview();
  const auto applied = run.Apply();

  assert(applied.counts().transactions_deleted() == 1);
  assert(applied.counts().links_removed() == 1);
  assert(applied.counts().records_detached() == 1);
  assert(applied.counts().balance_changes() == 1);
  assert(applied.issues_size() == 1);
  assert(applied.issues(0).kind() == report::ISSUE_NOT_FOUND);
  assert(applied.issues(0).subject_id() == "never-imported");

  auto tx = repo->Begin();
  assert(repo->ListExternalTransactionsByBatch(*tx, "b1").empty());
  assert(!repo->GetFinancialRecord(*tx, "p1")->booking_id);
  assert(repo->GetBooking(*tx, "X")->paid_cents == 0);
}

void TestPerRecordProblemsBecomeIssues() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto sink = std::make_shared<RecordingSink>();

  Commit(*repo, [&](db::Transaction& tx) {
    db::model::BookingRecord booking;
    booking.id   = "Y";
    const auto r = repo->InsertBooking(tx, booking);
    assert(r);
  });

  RunRequest request;
  request.imports.push_back(Feed("2024-05-01,DEPOSIT,,\n2024-05-02,WIRE IN,,10.00\n", "b2"));
  request.unlink_transaction_ids = {"no-such-transaction"};
  request.recompute_booking_ids  = {"Y"};

  Controller controller(repo, match::MatchPolicy{}, sink, request);
  const auto preview = controller.Preview();

  assert(preview.counts().quarantined() == 1);
  assert(preview.counts().imported() == 1);

  std::vector<report::IssueKind> kinds;
  for (const auto& issue : preview.issues()) {
    kinds.push_back(issue.kind());
  }
  assert((kinds == std::vector<report::IssueKind>{report::ISSUE_MISSING_FIELD, report::ISSUE_NOT_FOUND, report::ISSUE_INCOMPLETE_BOOKING}));
  assert(preview.issues(0).batch_id() == "b2");
  assert(preview.issues(0).line_number() == 1);

  // nothing to match against
  assert(preview.outcomes_size() == 1);
  assert(preview.outcomes(0).kind() == report::OUTCOME_NO_MATCH);

  const auto applied = controller.Apply();
  auto       tx      = repo->Begin();
  assert(repo->ListQuarantine(*tx).size() == 1);
  assert(applied.issues_size() == 3);
}

void TestConstructorRejectsMissingCollaborators() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  assert(Throws<std::invalid_argument>([&] { Controller c(nullptr, match::MatchPolicy{}, std::make_shared<RecordingSink>(), RunRequest{}); }));
  assert(Throws<std::invalid_argument>([&] { Controller c(repo, match::MatchPolicy{}, nullptr, RunRequest{}); }));
}

} // namespace

int main() {
  TestPreviewHasNoSideEffects();
  TestApplyCommitsWhatWasPreviewed();
  TestApplyAbortsWhenStateMoved();
  TestSameBatchLinesMatchInTheSameOrderTwice();
  TestSnapshotFailureAbortsApply();
  TestNothingToDoWritesNoSnapshot();
  TestBatchRollbackUndoesImportAndBalance();
  TestPerRecordProblemsBecomeIssues();
  TestConstructorRejectsMissingCollaborators();

  std::cout << "recon_unit_controller: pass\n";
  return 0;
}
