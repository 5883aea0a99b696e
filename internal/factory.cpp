#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if RECON_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RECON_DB_POSTGRES
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace recon::factory {

namespace {

constexpr const char* kDefaultBackupDirectory = "./recon-backups";

} // namespace

#if RECON_DB_SQLITE
void BootstrapSqliteSchema(db::sqlite::SqliteDB& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS external_transactions (id TEXT PRIMARY KEY, fingerprint TEXT NOT NULL UNIQUE, posted_on TEXT NOT NULL, amount_cents INTEGER NOT NULL, description TEXT NOT NULL, account_id TEXT NOT NULL, import_batch_id TEXT NOT NULL, source_file TEXT NOT NULL, counterparty TEXT, imported_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS financial_records (id TEXT PRIMARY KEY, kind TEXT NOT NULL CHECK (kind IN ('receipt','payment')), amount_cents INTEGER NOT NULL, record_date TEXT NOT NULL, description TEXT NOT NULL, booking_id TEXT, source_fingerprint TEXT);",
      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, total_due_cents INTEGER, paid_cents INTEGER NOT NULL DEFAULT 0, balance_cents INTEGER NOT NULL DEFAULT 0, status TEXT NOT NULL CHECK (status IN ('active','cancelled','closed')), updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS booking_charges (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL REFERENCES bookings(id) ON DELETE CASCADE, description TEXT NOT NULL, amount_cents INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ledger_links (link_id TEXT PRIMARY KEY, transaction_id TEXT NOT NULL REFERENCES external_transactions(id) ON DELETE CASCADE, record_id TEXT REFERENCES financial_records(id) ON DELETE CASCADE, counter_transaction_id TEXT REFERENCES external_transactions(id) ON DELETE CASCADE, match_type TEXT NOT NULL, confidence REAL NOT NULL CHECK (confidence >= 0 AND confidence <= 1), created_at_ms INTEGER NOT NULL, created_by TEXT NOT NULL, run_id TEXT NOT NULL, superseded INTEGER NOT NULL DEFAULT 0, superseded_at_ms INTEGER NOT NULL DEFAULT 0, detached_booking_id TEXT, CHECK ((record_id IS NULL) <> (counter_transaction_id IS NULL)));",
      "CREATE UNIQUE INDEX IF NOT EXISTS ledger_links_one_active ON ledger_links(transaction_id) WHERE superseded=0;",
      "CREATE INDEX IF NOT EXISTS ledger_links_record ON ledger_links(record_id);",
      "CREATE INDEX IF NOT EXISTS external_transactions_posted_on ON external_transactions(posted_on);",
      "CREATE INDEX IF NOT EXISTS external_transactions_batch ON external_transactions(import_batch_id);",
      "CREATE INDEX IF NOT EXISTS financial_records_date ON financial_records(record_date);",
      "CREATE INDEX IF NOT EXISTS financial_records_booking ON financial_records(booking_id);",
      "CREATE TABLE IF NOT EXISTS import_quarantine (id TEXT PRIMARY KEY, import_batch_id TEXT NOT NULL, source_file TEXT NOT NULL, line_number INTEGER NOT NULL, reason TEXT NOT NULL, raw_line TEXT NOT NULL, created_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db.Exec(sql);
  }

  sqlite_db.Exec("SELECT id,fingerprint,posted_on,amount_cents,description,account_id,import_batch_id,source_file,counterparty,imported_at_ms FROM external_transactions LIMIT 1;");
  sqlite_db.Exec("SELECT id,kind,amount_cents,record_date,description,booking_id,source_fingerprint FROM financial_records LIMIT 1;");
  sqlite_db.Exec("SELECT link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,created_at_ms,created_by,run_id,superseded,superseded_at_ms,detached_booking_id FROM ledger_links LIMIT 1;");
}
#endif

#if RECON_DB_POSTGRES
void BootstrapPostgresSchema(db::postgres::PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS external_transactions (id TEXT PRIMARY KEY, fingerprint TEXT NOT NULL UNIQUE, posted_on DATE NOT NULL, amount_cents BIGINT NOT NULL, description TEXT NOT NULL, account_id TEXT NOT NULL, import_batch_id TEXT NOT NULL, source_file TEXT NOT NULL, counterparty TEXT, imported_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS financial_records (id TEXT PRIMARY KEY, kind TEXT NOT NULL CHECK (kind IN ('receipt','payment')), amount_cents BIGINT NOT NULL, record_date DATE NOT NULL, description TEXT NOT NULL, booking_id TEXT, source_fingerprint TEXT);");
  tx.exec("CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, total_due_cents BIGINT, paid_cents BIGINT NOT NULL DEFAULT 0, balance_cents BIGINT NOT NULL DEFAULT 0, status TEXT NOT NULL CHECK (status IN ('active','cancelled','closed')), updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS booking_charges (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL REFERENCES bookings(id) ON DELETE CASCADE, description TEXT NOT NULL, amount_cents BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS ledger_links (seq BIGSERIAL UNIQUE, link_id TEXT PRIMARY KEY, transaction_id TEXT NOT NULL REFERENCES external_transactions(id) ON DELETE CASCADE, record_id TEXT REFERENCES financial_records(id) ON DELETE CASCADE, counter_transaction_id TEXT REFERENCES external_transactions(id) ON DELETE CASCADE, match_type TEXT NOT NULL, confidence DOUBLE PRECISION NOT NULL CHECK (confidence >= 0 AND confidence <= 1), created_at_ms BIGINT NOT NULL, created_by TEXT NOT NULL, run_id TEXT NOT NULL, superseded BOOLEAN NOT NULL DEFAULT FALSE, superseded_at_ms BIGINT NOT NULL DEFAULT 0, detached_booking_id TEXT, CHECK ((record_id IS NULL) <> (counter_transaction_id IS NULL)));");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS ledger_links_one_active ON ledger_links(transaction_id) WHERE NOT superseded;");
  tx.exec("CREATE INDEX IF NOT EXISTS ledger_links_record ON ledger_links(record_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS external_transactions_posted_on ON external_transactions(posted_on);");
  tx.exec("CREATE INDEX IF NOT EXISTS external_transactions_batch ON external_transactions(import_batch_id);");
  tx.exec("CREATE INDEX IF NOT EXISTS financial_records_date ON financial_records(record_date);");
  tx.exec("CREATE INDEX IF NOT EXISTS financial_records_booking ON financial_records(booking_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS import_quarantine (seq BIGSERIAL UNIQUE, id TEXT PRIMARY KEY, import_batch_id TEXT NOT NULL, source_file TEXT NOT NULL, line_number INTEGER NOT NULL, reason TEXT NOT NULL, raw_line TEXT NOT NULL, created_at_ms BIGINT NOT NULL);");

  tx.exec("SELECT id,fingerprint,posted_on,amount_cents,description,account_id,import_batch_id,source_file,counterparty,imported_at_ms FROM external_transactions LIMIT 1;");
  tx.exec("SELECT seq,link_id,transaction_id,record_id,counter_transaction_id,match_type,confidence,created_at_ms,created_by,run_id,superseded,superseded_at_ms,detached_booking_id FROM ledger_links LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const recon::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RECON_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(*sqlite_db);
    RECON_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RECON_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 4u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(*pool);
    RECON_LOG_INFO("repository ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RECON_LOG_WARN("no database configured, using the in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const recon::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  runtime.repository = BuildRepository(config);
  runtime.policy     = match::MatchPolicy::FromConfig(config.matching());

  const auto& backup_dir = config.backup().directory();
  runtime.snapshot_sink  = std::make_shared<backup::FileSnapshotSink>(backup_dir.empty() ? kDefaultBackupDirectory : backup_dir);

  if (!config.run().process_tag().empty()) {
    runtime.controller_options.process_tag = config.run().process_tag();
  }
  if (config.run().sample_limit() > 0) {
    runtime.controller_options.sample_limit = config.run().sample_limit();
  }

  return runtime;
}

} // namespace recon::factory
