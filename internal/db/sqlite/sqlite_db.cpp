#include "sqlite_db.hpp"

#include <stdexcept>

namespace livetv::db::sqlite {

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  constexpr int kFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, kFlags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open session store " + path_ + ": " + reason);
  }

  try {
    ApplyPragmas(wal_mode, busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) == SQLITE_OK) return;

  const std::string reason = error ? error : sqlite3_errmsg(db_);
  sqlite3_free(error);
  throw std::runtime_error("sqlite: " + reason);
}

void SqliteDB::ApplyPragmas(bool wal_mode, std::chrono::milliseconds busy_timeout) {
  // in-memory databases cannot switch to WAL
  if (wal_mode && path_ != ":memory:") {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

Statement::Statement(sqlite3* db, const char* sql) {
  prepare_rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
}

Statement::~Statement() {
  sqlite3_finalize(stmt_);
}

Statement& Statement::BindText(int index, const std::string& value) {
  if (stmt_) sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::BindInt(int index, int value) {
  if (stmt_) sqlite3_bind_int(stmt_, index, value);
  return *this;
}

Statement& Statement::BindInt64(int index, int64_t value) {
  if (stmt_) sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  return *this;
}

int Statement::Step() {
  return stmt_ ? sqlite3_step(stmt_) : prepare_rc_;
}

std::string Statement::Text(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  if (!text) return {};
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

int Statement::Int(int column) const {
  return sqlite3_column_int(stmt_, column);
}

uint64_t Statement::UInt64(int column) const {
  return static_cast<uint64_t>(sqlite3_column_int64(stmt_, column));
}

} // namespace livetv::db::sqlite
