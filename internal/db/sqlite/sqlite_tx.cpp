#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace livetv::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), open_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_.owns_lock()) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    LIVETV_LOG_WARN("Abandoned sqlite transaction did not roll back",
                    {livetv::observability::StringField("path", db_->Path()), livetv::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Finish(const char* statement) {
  if (!open_.owns_lock()) {
    throw std::runtime_error("sqlite transaction already finished");
  }
  db_->Exec(statement);
  open_.unlock();
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

} // namespace livetv::db::sqlite
