#include "sqlite_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_tx.hpp"

namespace livetv::db::sqlite {

namespace {

sqlite3* HandleOf(Transaction& tx) {
  return static_cast<SqliteTransaction&>(tx).Handle();
}

// Extended result codes keep the primary code in the low byte.
Result ToResult(sqlite3* db, int rc) {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return Result::Ok();
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

model::SessionRecord SessionRow(const Statement& row) {
  model::SessionRecord r;
  r.id                = row.Text(0);
  r.resource_kind     = static_cast<livetv::model::ResourceKind>(row.Int(1));
  r.resource_id       = row.UInt64(2);
  r.channel_key       = row.Text(3);
  r.user_id           = row.Text(4);
  r.stream_url        = row.Text(5);
  r.started_at_ms     = row.UInt64(6);
  r.last_heartbeat_ms = row.UInt64(7);
  r.priority          = row.Int(8);
  r.device_type       = row.Text(9);
  r.ip_address        = row.Text(10);
  r.queue_ticket      = row.Text(11);
  return r;
}

model::ViewingHistoryRecord HistoryRow(const Statement& row) {
  model::ViewingHistoryRecord r;
  r.id               = row.UInt64(0);
  r.user_id          = row.Text(1);
  r.channel_key      = row.Text(2);
  r.resource_kind    = static_cast<livetv::model::ResourceKind>(row.Int(3));
  r.resource_id      = row.UInt64(4);
  r.started_at_ms    = row.UInt64(5);
  r.ended_at_ms      = row.UInt64(6);
  r.duration_seconds = row.UInt64(7);
  r.end_reason       = static_cast<livetv::model::EndReason>(row.Int(8));
  r.device_type      = row.Text(9);
  r.ip_address       = row.Text(10);
  return r;
}

int64_t Signed(uint64_t value) {
  return static_cast<int64_t>(value);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteRepository::UpsertSession(Transaction& tx, const model::SessionRecord& r) {
  auto*     db = HandleOf(tx);
  Statement st(db, sql::UPSERT_SESSION);
  st.BindText(1, r.id)
      .BindInt(2, static_cast<int>(r.resource_kind))
      .BindInt64(3, Signed(r.resource_id))
      .BindText(4, r.channel_key)
      .BindText(5, r.user_id)
      .BindText(6, r.stream_url)
      .BindInt64(7, Signed(r.started_at_ms))
      .BindInt64(8, Signed(r.last_heartbeat_ms))
      .BindInt(9, r.priority)
      .BindText(10, r.device_type)
      .BindText(11, r.ip_address)
      .BindText(12, r.queue_ticket);
  return ToResult(db, st.Step());
}

Result SqliteRepository::TouchSession(Transaction& tx, const std::string& id, uint64_t last_heartbeat_ms) {
  auto*     db = HandleOf(tx);
  Statement st(db, sql::TOUCH_SESSION);
  st.BindInt64(1, Signed(last_heartbeat_ms)).BindText(2, id);

  auto result = ToResult(db, st.Step());
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + id);
  }
  return result;
}

Result SqliteRepository::DeleteSession(Transaction& tx, const std::string& id) {
  auto*     db = HandleOf(tx);
  Statement st(db, sql::DELETE_SESSION);
  st.BindText(1, id);
  return ToResult(db, st.Step());
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& tx, const std::string& id) {
  Statement st(HandleOf(tx), sql::SELECT_SESSION);
  st.BindText(1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return SessionRow(st);
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& tx) {
  std::vector<model::SessionRecord> out;
  Statement                         st(HandleOf(tx), sql::SELECT_SESSIONS);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(SessionRow(st));
  }
  return out;
}

Result SqliteRepository::InsertViewingHistory(Transaction& tx, model::ViewingHistoryRecord& r) {
  auto*     db = HandleOf(tx);
  Statement st(db, sql::INSERT_HISTORY);
  st.BindText(1, r.user_id)
      .BindText(2, r.channel_key)
      .BindInt(3, static_cast<int>(r.resource_kind))
      .BindInt64(4, Signed(r.resource_id))
      .BindInt64(5, Signed(r.started_at_ms))
      .BindInt64(6, Signed(r.ended_at_ms))
      .BindInt64(7, Signed(r.duration_seconds))
      .BindInt(8, static_cast<int>(r.end_reason))
      .BindText(9, r.device_type)
      .BindText(10, r.ip_address);

  auto result = ToResult(db, st.Step());
  if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::ViewingHistoryRecord> SqliteRepository::ListViewingHistory(Transaction& tx, const std::string& user_id, uint32_t limit) {
  Statement st(HandleOf(tx), user_id.empty() ? sql::SELECT_HISTORY_ALL : sql::SELECT_HISTORY_FOR_USER);

  // sqlite treats a negative LIMIT as unbounded
  const int64_t bound = limit == 0 ? -1 : static_cast<int64_t>(limit);
  if (user_id.empty()) {
    st.BindInt64(1, bound);
  } else {
    st.BindText(1, user_id).BindInt64(2, bound);
  }

  std::vector<model::ViewingHistoryRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(HistoryRow(st));
  }
  return out;
}

} // namespace livetv::db::sqlite
