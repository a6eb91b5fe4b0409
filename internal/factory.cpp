#include "factory.hpp"

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/broker_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/broker_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if LIVETV_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LIVETV_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace livetv::factory {

using livetv::runtime::config::RuntimeConfig;
using observability::IntField;
using observability::StringField;
using observability::UrlField;

namespace {

constexpr std::chrono::milliseconds kDefaultSweepInterval{std::chrono::seconds(30)};
constexpr uint32_t                  kDefaultMaxFailures     = 3;
constexpr uint32_t                  kDefaultEvictionLogSize = 1024;

#if LIVETV_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,resource_kind,resource_id,channel_key,user_id,last_heartbeat_ms FROM broker_session LIMIT 1;");
  sqlite_db->Exec("SELECT id,user_id,channel_key,ended_at_ms,end_reason FROM viewing_history LIMIT 1;");
  sqlite_db->Exec("SELECT version FROM broker_schema_migrations LIMIT 1;");
}
#endif

#if LIVETV_DB_POSTGRES
// Runs on a direct connection: pooled connections prepare statements
// against tables that may not exist yet.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,resource_kind,resource_id,channel_key,user_id,last_heartbeat_ms FROM broker_session LIMIT 1;");
  tx.exec("SELECT id,user_id,channel_key,ended_at_ms,end_reason FROM viewing_history LIMIT 1;");
  tx.exec("SELECT version FROM broker_schema_migrations LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LIVETV_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    LIVETV_LOG_INFO("Using sqlite session store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LIVETV_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    LIVETV_LOG_INFO("Using postgres session store",
                    {UrlField("uri", database.postgres().connection_uri()), IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

void ValidateConfig(const RuntimeConfig& config) {
  std::set<uint64_t> ids;
  for (const auto& credential : config.credentials()) {
    if (credential.id() == 0) {
      throw util::InvalidArgument("credential id must be non-zero");
    }
    if (!ids.insert(credential.id()).second) {
      throw util::InvalidArgument("duplicate credential id " + std::to_string(credential.id()));
    }
    if (credential.max_connections() == 0) {
      throw util::InvalidArgument("credential " + std::to_string(credential.id()) + " has max_connections = 0");
    }
  }

  const auto& stale = config.liveness().stale_threshold();
  if (config.liveness().has_stale_threshold() && (stale.seconds() < 0 || (stale.seconds() == 0 && stale.nanos() <= 0))) {
    throw util::InvalidArgument("liveness.stale_threshold must be positive");
  }
}

core::BrokerOptions BuildBrokerOptions(const RuntimeConfig& config) {
  core::BrokerOptions options;
  options.tuner_count = config.tuners().count();

  for (const auto& credential : config.credentials()) {
    model::CredentialSlot slot;
    slot.id              = credential.id();
    slot.provider_id     = credential.provider_id();
    slot.name            = credential.name();
    slot.max_connections = credential.max_connections();
    options.credentials.push_back(std::move(slot));
  }

  const auto& liveness    = config.liveness();
  options.stale_threshold = util::FromProto(liveness.stale_threshold(), options.stale_threshold);
  options.queue_timeout   = util::FromProto(liveness.queue_timeout(), options.queue_timeout);
  options.failed_cooldown = util::FromProto(config.tuners().failed_cooldown(), std::chrono::milliseconds(0));

  options.max_failures      = config.tuners().max_failures() == 0 ? kDefaultMaxFailures : config.tuners().max_failures();
  options.eviction_log_size = liveness.eviction_log_size() == 0 ? kDefaultEvictionLogSize : liveness.eviction_log_size();

  const auto& priorities = config.priorities();
  if (priorities.has_admin()) options.priorities.admin = priorities.admin();
  if (priorities.has_premium()) options.priorities.premium = priorities.premium();
  if (priorities.has_standard()) options.priorities.standard = priorities.standard();

  return options;
}

resolver::ResolverOptions BuildResolverOptions(const RuntimeConfig& config) {
  resolver::ResolverOptions options;
  options.hdhomerun_url = config.tuners().hdhomerun_url();
  options.stream_port   = config.tuners().stream_port() == 0 ? 5004 : config.tuners().stream_port();
  options.hls_output    = config.tuners().hls_output();

  for (const auto& credential : config.credentials()) {
    resolver::XtreamAccount account;
    account.server_url       = credential.server_url();
    account.username         = credential.username();
    account.password         = credential.password();
    account.stream_extension = credential.stream_extension();
    options.accounts.emplace(credential.id(), std::move(account));
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  ValidateConfig(config);

  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto resolver = std::make_shared<resolver::ConfiguredStreamUrlResolver>(BuildResolverOptions(config));
  app.broker    = std::make_shared<core::TunerBroker>(BuildBrokerOptions(config), resolver, app.repository);

  if (config.database().restore_sessions()) {
    app.broker->RestoreSessions();
  }

  LIVETV_LOG_INFO("Broker configured", {IntField("tuners", config.tuners().count()), IntField("credentials", config.credentials_size())});

  // ------------------------------------------------------------------
  // Liveness
  // ------------------------------------------------------------------
  auto monitor =
      std::make_shared<liveness::LivenessMonitor>(app.broker, util::FromProto(config.liveness().sweep_interval(), kDefaultSweepInterval));
  monitor->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.broker     = app.broker;
  ctx.repository = app.repository;

  auto broker_service = std::make_shared<service::BrokerService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BrokerServer>(broker_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(monitor);

  return app;
}

} // namespace livetv::factory
