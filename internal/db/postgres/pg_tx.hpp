#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace livetv::db::postgres {

// Owns one leased connection and a pqxx::work on it. The work is torn
// down before the lease so the connection goes back to the pool idle.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(PgPool& pool);
  ~PgTransaction() override;

  pqxx::work& Work();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  PgLease                     lease_;
  std::unique_ptr<pqxx::work> work_;
  bool                        committed_ = false;
};

} // namespace livetv::db::postgres
