#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace livetv::db::sqlite {

/*
  BEGIN IMMEDIATE on construction so a second writer process fails fast
  with SQLITE_BUSY (after busy_timeout) instead of on the first write.
  Holds the connection's transaction mutex until Commit, Rollback or
  destruction.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void Finish(const char* statement);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> open_;
  bool                         committed_ = false;
};

} // namespace livetv::db::sqlite
