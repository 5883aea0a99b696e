#include "link_ledger.hpp"

#include <stdexcept>

#include "internal/db/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace recon::ledger {

using db::model::LinkRecord;
using db::model::MatchType;

namespace {

const std::string& Counterpart(const LinkRecord& link) {
  return link.record_id.empty() ? link.counter_transaction_id : link.record_id;
}

} // namespace

LinkLedger::LinkLedger(std::shared_ptr<db::Repository> repository, MutationJournal& journal, std::string created_by, std::string run_id)
    : repository_(std::move(repository)), journal_(journal), created_by_(std::move(created_by)), run_id_(std::move(run_id)) {
}

LinkResult LinkLedger::Link(db::Transaction& tx, const std::string& transaction_id, const std::string& record_id, MatchType match_type,
                            double confidence, uint64_t now_ms) {
  if (match_type == MatchType::kReversalPair) {
    throw std::invalid_argument("reversal pairs are linked with LinkReversalPair");
  }
  if (!repository_->GetExternalTransaction(tx, transaction_id)) {
    throw util::NotFound("external transaction not found: " + transaction_id);
  }
  auto record = repository_->GetFinancialRecord(tx, record_id);
  if (!record) {
    throw util::NotFound("financial record not found: " + record_id);
  }

  LinkRecord link;
  link.transaction_id = transaction_id;
  link.record_id      = record_id;
  link.match_type     = match_type;
  link.confidence     = confidence;
  link.created_at_ms  = now_ms;

  auto result = Append(tx, std::move(link));
  if (result.created) {
    result.reattached_booking_id = Reattach(tx, transaction_id, *record);
  }
  return result;
}

std::optional<std::string> LinkLedger::Reattach(db::Transaction& tx, const std::string& transaction_id, const db::model::FinancialRecord& record) {
  if (record.kind != db::model::RecordKind::kPayment || record.booking_id) {
    return std::nullopt;
  }

  // history is oldest first
  const auto history = repository_->ListLinksForTransaction(tx, transaction_id);
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (!it->superseded || it->record_id != record.id) {
      continue;
    }
    if (!it->detached_booking_id || !repository_->GetBooking(tx, *it->detached_booking_id)) {
      return std::nullopt;
    }

    auto updated       = record;
    updated.booking_id = it->detached_booking_id;
    db::ThrowIfDbError(repository_->UpdateFinancialRecord(tx, updated), "reattach payment");
    journal_.Updated(record, updated);

    RECON_LOG_INFO("payment reattached", {observability::StringField("record_id", record.id),
                                          observability::StringField("booking_id", *updated.booking_id)});
    return updated.booking_id;
  }
  return std::nullopt;
}

std::vector<LinkResult> LinkLedger::LinkReversalPair(db::Transaction& tx, const std::string& first_id, const std::string& second_id,
                                                     uint64_t now_ms) {
  if (first_id == second_id) {
    throw std::invalid_argument("a transaction cannot reverse itself");
  }

  std::vector<LinkResult> results;
  for (const auto& [self, other] : {std::pair{first_id, second_id}, std::pair{second_id, first_id}}) {
    if (!repository_->GetExternalTransaction(tx, self)) {
      throw util::NotFound("external transaction not found: " + self);
    }

    LinkRecord link;
    link.transaction_id         = self;
    link.counter_transaction_id = other;
    link.match_type             = MatchType::kReversalPair;
    link.confidence             = 1.0;
    link.created_at_ms          = now_ms;
    results.push_back(Append(tx, std::move(link)));
  }
  return results;
}

LinkResult LinkLedger::Append(db::Transaction& tx, LinkRecord link) {
  if (link.confidence < 0.0 || link.confidence > 1.0) {
    throw std::invalid_argument("link confidence must be within [0, 1]");
  }

  if (auto active = repository_->GetActiveLinkForTransaction(tx, link.transaction_id)) {
    const auto& requested = link.record_id.empty() ? link.counter_transaction_id : link.record_id;
    if (Counterpart(*active) == requested) {
      return {active->link_id, false};
    }
    throw util::AmbiguousLinkConflict(link.transaction_id, active->link_id,
                                      "transaction " + link.transaction_id + " is already linked to " + Counterpart(*active));
  }

  link.link_id    = util::NewId();
  link.created_by = created_by_;
  link.run_id     = run_id_;
  link.superseded = false;

  db::ThrowIfDbError(repository_->InsertLink(tx, link), "insert link");
  journal_.Inserted(link);

  RECON_LOG_INFO("link created", {observability::StringField("link_id", link.link_id),
                                  observability::StringField("transaction_id", link.transaction_id),
                                  observability::StringField("counterpart", Counterpart(link)),
                                  observability::StringField("match_type", db::model::ToString(link.match_type)),
                                  observability::DoubleField("confidence", link.confidence)});
  return {link.link_id, true};
}

void LinkLedger::Supersede(db::Transaction& tx, const LinkRecord& link, uint64_t now_ms, const std::optional<std::string>& detached_booking_id) {
  db::ThrowIfDbError(repository_->SupersedeLink(tx, link.link_id, now_ms, detached_booking_id), "supersede link");

  auto after                = link;
  after.superseded          = true;
  after.superseded_at_ms    = now_ms;
  after.detached_booking_id = detached_booking_id;
  journal_.Updated(link, after);
}

UnlinkResult LinkLedger::Unlink(db::Transaction& tx, const std::string& transaction_id, uint64_t now_ms) {
  auto active = repository_->GetActiveLinkForTransaction(tx, transaction_id);
  if (!active) {
    throw util::NotFound("no active link for transaction " + transaction_id);
  }

  UnlinkResult result;

  if (!active->record_id.empty()) {
    std::optional<std::string> detached;

    auto record = repository_->GetFinancialRecord(tx, active->record_id);
    if (record && record->kind == db::model::RecordKind::kPayment && record->booking_id) {
      detached = record->booking_id;

      auto updated       = *record;
      updated.booking_id = std::nullopt;
      db::ThrowIfDbError(repository_->UpdateFinancialRecord(tx, updated), "detach payment");
      journal_.Updated(*record, updated);

      result.detached_record_ids.push_back(record->id);
      result.affected_booking_ids.push_back(*detached);
    }

    Supersede(tx, *active, now_ms, detached);
    result.superseded_link_ids.push_back(active->link_id);
  } else {
    Supersede(tx, *active, now_ms, std::nullopt);
    result.superseded_link_ids.push_back(active->link_id);

    auto partner = repository_->GetActiveLinkForTransaction(tx, active->counter_transaction_id);
    if (partner && partner->counter_transaction_id == transaction_id) {
      Supersede(tx, *partner, now_ms, std::nullopt);
      result.superseded_link_ids.push_back(partner->link_id);
    }
  }

  RECON_LOG_INFO("transaction unlinked", {observability::StringField("transaction_id", transaction_id),
                                          observability::IntField("links_superseded", static_cast<int64_t>(result.superseded_link_ids.size())),
                                          observability::IntField("payments_detached", static_cast<int64_t>(result.detached_record_ids.size()))});
  return result;
}

} // namespace recon::ledger
