#include "importer.hpp"

#include "internal/db/db_errors.hpp"
#include "internal/fingerprint/fingerprint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace recon::ingest {

namespace {

fingerprint::FingerprintInput ToFingerprintInput(const ImportLine& line) {
  fingerprint::FingerprintInput input;
  input.posted_on    = line.posted_on;
  input.amount_cents = line.amount_cents;
  input.description  = line.description;
  input.account_id   = line.account_id;
  return input;
}

} // namespace

Importer::Importer(std::shared_ptr<db::Repository> repository, ledger::MutationJournal& journal)
    : repository_(std::move(repository)), journal_(journal) {
}

ImportResult Importer::Import(db::Transaction& tx, const ImportBatch& batch, uint64_t now_ms) {
  observability::SpanScope span("recon.import");
  span.SetAttribute("batch_id", batch.batch_id);

  ImportResult result;
  result.batch_id = batch.batch_id;

  fingerprint::OccurrenceCounter occurrences;

  for (const auto& line : batch.lines) {
    auto                        input = ToFingerprintInput(line);
    fingerprint::FingerprintKey key;

    try {
      input.occurrence = occurrences.Next(input);
      key              = fingerprint::Fingerprint(input);
    } catch (const util::MissingFieldError& e) {
      db::model::QuarantineRecord entry;
      entry.id              = util::NewId();
      entry.import_batch_id = batch.batch_id;
      entry.source_file     = batch.source_file;
      entry.line_number     = line.line_number;
      entry.reason          = e.Field() + ": " + e.what();
      entry.raw_line        = line.raw;
      entry.created_at_ms   = now_ms;

      db::ThrowIfDbError(repository_->InsertQuarantine(tx, entry), "quarantine line");
      journal_.Inserted(entry);

      RECON_LOG_WARN("import line quarantined", {observability::StringField("batch_id", batch.batch_id),
                                                 observability::IntField("line", line.line_number),
                                                 observability::StringField("field", e.Field())});
      result.quarantine.push_back(std::move(entry));
      ++result.quarantined;
      continue;
    }

    if (repository_->FindExternalTransactionByFingerprint(tx, key)) {
      ++result.duplicates_skipped;
      continue;
    }

    db::model::ExternalTransactionRecord record;
    record.id              = fingerprint::TransactionId(key);
    record.fingerprint     = key;
    record.posted_on       = *line.posted_on;
    record.amount_cents    = *line.amount_cents;
    record.description     = line.description;
    record.account_id      = line.account_id;
    record.import_batch_id = batch.batch_id;
    record.source_file     = batch.source_file;
    record.counterparty    = line.counterparty;
    record.imported_at_ms  = now_ms;

    auto inserted = repository_->InsertExternalTransaction(tx, record);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      ++result.duplicates_skipped;
      continue;
    }
    db::ThrowIfDbError(inserted, "import external transaction");
    journal_.Inserted(record);

    result.imported_ids.push_back(record.id);
    ++result.imported;
  }

  observability::Metrics::Instance().RecordImportLines("imported", result.imported);
  observability::Metrics::Instance().RecordImportLines("duplicate", result.duplicates_skipped);
  observability::Metrics::Instance().RecordImportLines("quarantined", result.quarantined);

  RECON_LOG_INFO("import batch processed", {observability::StringField("batch_id", batch.batch_id),
                                            observability::StringField("source_file", batch.source_file),
                                            observability::IntField("imported", static_cast<int64_t>(result.imported)),
                                            observability::IntField("duplicates", static_cast<int64_t>(result.duplicates_skipped)),
                                            observability::IntField("quarantined", static_cast<int64_t>(result.quarantined))});
  return result;
}

} // namespace recon::ingest
