#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "mutation_journal.hpp"

namespace recon::ledger {

struct LinkResult {
  std::string link_id;
  bool        created = false; // false when the same link already existed

  // booking given back to a payment that an earlier unlink of this
  // same pair had detached; needs a balance recompute
  std::optional<std::string> reattached_booking_id;
};

struct UnlinkResult {
  std::vector<std::string> superseded_link_ids;

  // payments whose booking reference was cleared
  std::vector<std::string> detached_record_ids;

  // bookings that need a balance recompute
  std::vector<std::string> affected_booking_ids;
};

/*
  LinkLedger

  Append-only association store on top of the repository.

  - Link() with the pair that is already active is a no-op returning
    the existing link id.
  - Link() with a different counterpart for an actively linked
    transaction throws util::AmbiguousLinkConflict.
  - Unlink() supersedes the active link (and the partner link of a
    reversal pair) and detaches a linked payment from its booking.
  - Link() of a pair whose latest superseded link detached a payment
    reattaches that booking when the payment has none.

  All writes go through the caller's transaction and are journaled.
*/
class LinkLedger {
 public:
  LinkLedger(std::shared_ptr<db::Repository> repository, MutationJournal& journal, std::string created_by, std::string run_id);

  LinkResult Link(db::Transaction& tx, const std::string& transaction_id, const std::string& record_id, db::model::MatchType match_type,
                  double confidence, uint64_t now_ms);

  // Links both sides of a reversal to each other. Returns {first, second}.
  std::vector<LinkResult> LinkReversalPair(db::Transaction& tx, const std::string& first_id, const std::string& second_id, uint64_t now_ms);

  // Throws util::NotFound when the transaction has no active link.
  UnlinkResult Unlink(db::Transaction& tx, const std::string& transaction_id, uint64_t now_ms);

 private:
  LinkResult Append(db::Transaction& tx, db::model::LinkRecord link);

  std::optional<std::string> Reattach(db::Transaction& tx, const std::string& transaction_id, const db::model::FinancialRecord& record);

  void Supersede(db::Transaction& tx, const db::model::LinkRecord& link, uint64_t now_ms, const std::optional<std::string>& detached_booking_id);

  std::shared_ptr<db::Repository> repository_;
  MutationJournal&                journal_;
  std::string                     created_by_;
  std::string                     run_id_;
};

} // namespace recon::ledger
