#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace recon::db::postgres {

/*
  REPEATABLE READ: the run sees one snapshot from its first statement;
  bookings and active links are additionally locked FOR UPDATE as read.
*/
using RepeatableReadWork = pqxx::transaction<pqxx::isolation_level::repeatable_read>;

class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  RepeatableReadWork& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection>   conn_;
  std::unique_ptr<RepeatableReadWork> tx_;
  bool                                committed_ = false;
  bool                                finished_  = false;
};

} // namespace recon::db::postgres
