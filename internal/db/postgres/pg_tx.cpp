#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace livetv::db::postgres {

PgTransaction::PgTransaction(PgPool& pool) : lease_(pool.Acquire()), work_(std::make_unique<pqxx::work>(*lease_)) {
}

PgTransaction::~PgTransaction() {
  if (!work_) return;
  try {
    work_->abort();
  } catch (const std::exception& e) {
    LIVETV_LOG_WARN("Abandoned postgres transaction did not roll back", {livetv::observability::StringField("error", e.what())});
  }
  work_.reset();
}

pqxx::work& PgTransaction::Work() {
  if (!work_) throw std::runtime_error("postgres transaction already finished");
  return *work_;
}

void PgTransaction::Commit() {
  Work().commit();
  work_.reset();
  committed_ = true;
}

void PgTransaction::Rollback() {
  Work().abort();
  work_.reset();
}

} // namespace livetv::db::postgres
