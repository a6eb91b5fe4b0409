#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace livetv::db::sqlite {

/*
  One sqlite3 connection shared by the broker, the admin history queries
  and startup restore. sqlite allows a single open transaction per
  connection, so transactions take TxMutex() for their whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements; throws std::runtime_error on failure.
  void Exec(const std::string& sql);

 private:
  void ApplyPragmas(bool wal_mode, std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Prepared statement, finalized on scope exit. A failed prepare leaves
// Prepared() false and Step() returning the prepare error code.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return prepare_rc_ == SQLITE_OK;
  }

  Statement& BindText(int index, const std::string& value);
  Statement& BindInt(int index, int value);
  Statement& BindInt64(int index, int64_t value);

  int Step();

  std::string Text(int column) const;
  int         Int(int column) const;
  uint64_t    UInt64(int column) const;

 private:
  sqlite3_stmt* stmt_       = nullptr;
  int           prepare_rc_ = SQLITE_OK;
};

} // namespace livetv::db::sqlite
