#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/backup/snapshot_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/csv_feed.hpp"
#include "internal/match/match_policy.hpp"
#include "recon/report/v1/report.pb.h"

namespace recon::reconcile {

/*
  What one run does. Execution order is fixed:

      batch rollbacks -> imports -> unlinks -> matching -> recompute

  Links are always written before any balance is recomputed.
*/
struct RunRequest {
  std::vector<std::string>         rollback_batch_ids;
  std::vector<ingest::ImportBatch> imports;
  std::vector<std::string>         unlink_transaction_ids;
  bool                             match_unlinked = true;
  std::vector<std::string>         recompute_booking_ids;
};

struct ControllerOptions {
  std::string process_tag  = "recon-run";
  uint32_t    sample_limit = 20;
};

enum class ControllerState {
  kPreview,
  kApplied,
};

/*
  Controller

  Dry-run / apply state machine for one RunRequest.

  Preview() runs the plan in a storage transaction that is always
  rolled back and returns the change-set. It may be called any number
  of times while in kPreview.

  Apply() requires a prior Preview(), re-runs the plan in a fresh
  transaction and commits only when
    - the change counts equal those of the last preview
    - the before-images of every mutated row were persisted
  Any failure rolls back and throws util::ApplyAbortError. Apply() is
  one-way: afterwards both calls throw util::InvalidState.
*/
class Controller {
 public:
  Controller(std::shared_ptr<db::Repository> repository, match::MatchPolicy policy, std::shared_ptr<backup::SnapshotSink> snapshot_sink,
             RunRequest request, ControllerOptions options = {});

  recon::report::v1::ChangeSet Preview();

  recon::report::v1::ChangeSet Apply();

  ControllerState State() const {
    return state_;
  }

  const std::string& RunId() const {
    return run_id_;
  }

 private:
  struct Execution;

  Execution Execute(db::Transaction& tx, recon::report::v1::RunMode mode);

  std::shared_ptr<db::Repository>       repository_;
  match::MatchPolicy                    policy_;
  std::shared_ptr<backup::SnapshotSink> snapshot_sink_;
  RunRequest                            request_;
  ControllerOptions                     options_;

  std::string                                   run_id_;
  ControllerState                               state_ = ControllerState::kPreview;
  std::optional<recon::report::v1::ChangeCounts> preview_counts_;
};

} // namespace recon::reconcile
