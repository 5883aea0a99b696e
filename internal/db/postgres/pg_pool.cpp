#include "pg_pool.hpp"

namespace recon::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("find_tx_by_fingerprint",
               "SELECT id,fingerprint,to_char(posted_on,'YYYY-MM-DD'),amount_cents,description,account_id,import_batch_id,"
               "source_file,counterparty,imported_at_ms FROM external_transactions WHERE fingerprint=$1");

  conn.prepare("insert_external_transaction",
               "INSERT INTO external_transactions(id,fingerprint,posted_on,amount_cents,description,account_id,import_batch_id,"
               "source_file,counterparty,imported_at_ms) VALUES($1,$2,$3::date,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("get_booking_for_update",
               "SELECT id,total_due_cents,paid_cents,balance_cents,status,updated_at_ms FROM bookings WHERE id=$1 FOR UPDATE");

  conn.prepare("get_active_link_for_update",
               "SELECT link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,created_at_ms,created_by,"
               "run_id,superseded,superseded_at_ms,detached_booking_id FROM ledger_links "
               "WHERE transaction_id=$1 AND NOT superseded FOR UPDATE");

  conn.prepare("insert_link",
               "INSERT INTO ledger_links(link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,"
               "created_at_ms,created_by,run_id,superseded,superseded_at_ms,detached_booking_id) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");

  conn.prepare("supersede_link",
               "UPDATE ledger_links SET superseded=TRUE,superseded_at_ms=$2,detached_booking_id=$3 "
               "WHERE link_id=$1 AND NOT superseded");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace recon::db::postgres
