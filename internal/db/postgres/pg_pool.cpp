#include "pg_pool.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/sql/sql_queries.hpp"

namespace livetv::db::postgres {

namespace {

struct NamedStatement {
  const char* name;
  std::string text;
};

std::string ReturningId(std::string text) {
  while (!text.empty() && (text.back() == ';' || text.back() == ' ')) text.pop_back();
  return text + " RETURNING id";
}

const std::vector<NamedStatement>& BrokerStatements() {
  static const std::vector<NamedStatement> statements = {
      {"upsert_session", sql::NumberedParams(sql::UPSERT_SESSION)},
      {"touch_session", sql::NumberedParams(sql::TOUCH_SESSION)},
      {"delete_session", sql::NumberedParams(sql::DELETE_SESSION)},
      {"get_session", sql::NumberedParams(sql::SELECT_SESSION)},
      {"list_sessions", sql::NumberedParams(sql::SELECT_SESSIONS)},
      {"insert_history", ReturningId(sql::NumberedParams(sql::INSERT_HISTORY))},
      {"list_history", sql::NumberedParams(sql::SELECT_HISTORY_ALL)},
      {"list_user_history", sql::NumberedParams(sql::SELECT_HISTORY_FOR_USER)},
  };
  return statements;
}

} // namespace

PgLease::PgLease(std::shared_ptr<PgPool> pool, std::unique_ptr<pqxx::connection> conn) : pool_(std::move(pool)), conn_(std::move(conn)) {
}

PgLease::~PgLease() {
  if (pool_ && conn_) pool_->Return(std::move(conn_));
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), acquire_timeout_(acquire_timeout) {
}

PgLease PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool       ready = returned_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || open_connections_ < max_connections_; });
  if (!ready) {
    throw std::runtime_error("postgres pool exhausted: " + std::to_string(max_connections_) + " connections in use");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return PgLease(shared_from_this(), std::move(conn));
  }

  ++open_connections_;
  lock.unlock();
  try {
    return PgLease(shared_from_this(), Open());
  } catch (...) {
    lock.lock();
    --open_connections_;
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& statement : BrokerStatements()) {
    conn->prepare(statement.name, statement.text);
  }
  return conn;
}

void PgPool::Return(std::unique_ptr<pqxx::connection> conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.push_back(std::move(conn));
    } else {
      --open_connections_;
    }
  }
  returned_.notify_one();
}

} // namespace livetv::db::postgres
