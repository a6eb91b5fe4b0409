#include "pg_repository.hpp"

#include <optional>

namespace livetv::db::postgres {

namespace {

pqxx::work& Work(Transaction& tx) {
  return static_cast<PgTransaction&>(tx).Work();
}

Result ToResult(const pqxx::sql_error& e) {
  const std::string state = e.sqlstate();
  // class 23: integrity constraint violation
  if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (state == "40001" || state == "40P01") return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (state == "55P03" || state == "57014") return Result::Err(ErrorCode::Busy, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

model::SessionRecord SessionRow(const pqxx::row& row) {
  model::SessionRecord r;
  r.id                = row[0].as<std::string>();
  r.resource_kind     = static_cast<livetv::model::ResourceKind>(row[1].as<int>());
  r.resource_id       = row[2].as<uint64_t>();
  r.channel_key       = row[3].as<std::string>();
  r.user_id           = row[4].as<std::string>();
  r.stream_url        = row[5].as<std::string>();
  r.started_at_ms     = row[6].as<uint64_t>();
  r.last_heartbeat_ms = row[7].as<uint64_t>();
  r.priority          = row[8].as<int32_t>();
  r.device_type       = row[9].as<std::string>();
  r.ip_address        = row[10].as<std::string>();
  r.queue_ticket      = row[11].as<std::string>();
  return r;
}

model::ViewingHistoryRecord HistoryRow(const pqxx::row& row) {
  model::ViewingHistoryRecord r;
  r.id               = row[0].as<uint64_t>();
  r.user_id          = row[1].as<std::string>();
  r.channel_key      = row[2].as<std::string>();
  r.resource_kind    = static_cast<livetv::model::ResourceKind>(row[3].as<int>());
  r.resource_id      = row[4].as<uint64_t>();
  r.started_at_ms    = row[5].as<uint64_t>();
  r.ended_at_ms      = row[6].as<uint64_t>();
  r.duration_seconds = row[7].as<uint64_t>();
  r.end_reason       = static_cast<livetv::model::EndReason>(row[8].as<int>());
  r.device_type      = row[9].as<std::string>();
  r.ip_address       = row[10].as<std::string>();
  return r;
}

// Connection loss and SQL errors become Results; anything else propagates.
template <typename Fn>
Result Guard(Fn&& fn) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  } catch (const pqxx::sql_error& e) {
    return ToResult(e);
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(*pool_);
}

Result PgRepository::UpsertSession(Transaction& tx, const model::SessionRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "session id is empty");
  return Guard([&] {
    Work(tx).exec_prepared("upsert_session", r.id, static_cast<int>(r.resource_kind), r.resource_id, r.channel_key, r.user_id, r.stream_url,
                           r.started_at_ms, r.last_heartbeat_ms, r.priority, r.device_type, r.ip_address, r.queue_ticket);
    return Result::Ok();
  });
}

Result PgRepository::TouchSession(Transaction& tx, const std::string& id, uint64_t last_heartbeat_ms) {
  return Guard([&] {
    const auto res = Work(tx).exec_prepared("touch_session", last_heartbeat_ms, id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "session not found: " + id);
    return Result::Ok();
  });
}

Result PgRepository::DeleteSession(Transaction& tx, const std::string& id) {
  return Guard([&] {
    Work(tx).exec_prepared("delete_session", id);
    return Result::Ok();
  });
}

std::optional<model::SessionRecord> PgRepository::GetSession(Transaction& tx, const std::string& id) {
  const auto res = Work(tx).exec_prepared("get_session", id);
  if (res.empty()) return std::nullopt;
  return SessionRow(res[0]);
}

std::vector<model::SessionRecord> PgRepository::ListSessions(Transaction& tx) {
  const auto res = Work(tx).exec_prepared("list_sessions");

  std::vector<model::SessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(SessionRow(row));
  return out;
}

Result PgRepository::InsertViewingHistory(Transaction& tx, model::ViewingHistoryRecord& r) {
  return Guard([&] {
    const auto res = Work(tx).exec_prepared("insert_history", r.user_id, r.channel_key, static_cast<int>(r.resource_kind), r.resource_id,
                                            r.started_at_ms, r.ended_at_ms, r.duration_seconds, static_cast<int>(r.end_reason), r.device_type,
                                            r.ip_address);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  });
}

std::vector<model::ViewingHistoryRecord> PgRepository::ListViewingHistory(Transaction& tx, const std::string& user_id, uint32_t limit) {
  // LIMIT NULL is unbounded
  std::optional<int64_t> bound;
  if (limit > 0) bound = limit;

  const auto res = user_id.empty() ? Work(tx).exec_prepared("list_history", bound) : Work(tx).exec_prepared("list_user_history", user_id, bound);

  std::vector<model::ViewingHistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(HistoryRow(row));
  return out;
}

} // namespace livetv::db::postgres
