#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/backup/snapshot_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/match/match_policy.hpp"
#include "internal/reconcile/controller.hpp"

#if RECON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if RECON_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace recon::factory {

/*
  Runtime

  Owns every long-lived object of one recon-run process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<backup::SnapshotSink> snapshot_sink;

  match::MatchPolicy             policy;
  reconcile::ControllerOptions   controller_options;
};

/*
  BuildRuntime

  Composition root. It is the ONLY place allowed to know concrete
  DB types; every component receives the repository explicitly.
*/
Runtime BuildRuntime(const recon::runtime::config::RuntimeConfig& config);

// Memory backend when no database section is present.
std::shared_ptr<db::Repository> BuildRepository(const recon::runtime::config::RuntimeConfig& config);

#if RECON_DB_SQLITE
void BootstrapSqliteSchema(db::sqlite::SqliteDB& sqlite_db);
#endif

#if RECON_DB_POSTGRES
void BootstrapPostgresSchema(db::postgres::PgPool& pool);
#endif

} // namespace recon::factory
