#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "csv_feed.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/mutation_journal.hpp"

namespace recon::ingest {

struct ImportResult {
  std::string batch_id;

  uint64_t imported           = 0;
  uint64_t duplicates_skipped = 0;
  uint64_t quarantined        = 0;

  std::vector<std::string>                 imported_ids;
  std::vector<db::model::QuarantineRecord> quarantine;
};

/*
  Importer

  The one import path. Every line is fingerprinted:
    - incomplete line  -> quarantine queue, run continues
    - known fingerprint -> skipped as already present
    - otherwise         -> inserted as an external transaction

  Importing the same feed twice inserts nothing the second time.
*/
class Importer {
 public:
  Importer(std::shared_ptr<db::Repository> repository, ledger::MutationJournal& journal);

  ImportResult Import(db::Transaction& tx, const ImportBatch& batch, uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
  ledger::MutationJournal&        journal_;
};

} // namespace recon::ingest
