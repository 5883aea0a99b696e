#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace recon::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<RepeatableReadWork>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      RECON_LOG_WARN("postgres rollback on destruction failed", {observability::StringField("error", e.what())});
    }
  }
  // the transaction object must go before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw std::runtime_error("transaction already finished");
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace recon::db::postgres
