#pragma once

#include <string>
#include <vector>

namespace livetv::db::sql {

/*
  Bootstrap DDL, applied in order at startup. Every statement is idempotent.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS broker_session (id TEXT PRIMARY KEY, resource_kind INTEGER NOT NULL, resource_id INTEGER NOT NULL, channel_key TEXT NOT NULL, user_id TEXT NOT NULL, stream_url TEXT NOT NULL DEFAULT '', started_at_ms INTEGER NOT NULL, last_heartbeat_ms INTEGER NOT NULL, priority INTEGER NOT NULL DEFAULT 0, device_type TEXT NOT NULL DEFAULT '', ip_address TEXT NOT NULL DEFAULT '', queue_ticket TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS broker_session_user_idx ON broker_session(user_id);",
      "CREATE TABLE IF NOT EXISTS viewing_history (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, channel_key TEXT NOT NULL, resource_kind INTEGER NOT NULL, resource_id INTEGER NOT NULL, started_at_ms INTEGER NOT NULL, ended_at_ms INTEGER NOT NULL, duration_seconds INTEGER NOT NULL, end_reason INTEGER NOT NULL, device_type TEXT NOT NULL DEFAULT '', ip_address TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS viewing_history_user_idx ON viewing_history(user_id, ended_at_ms);",
      "CREATE TABLE IF NOT EXISTS broker_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS broker_session (id TEXT PRIMARY KEY, resource_kind SMALLINT NOT NULL, resource_id BIGINT NOT NULL, channel_key TEXT NOT NULL, user_id TEXT NOT NULL, stream_url TEXT NOT NULL DEFAULT '', started_at_ms BIGINT NOT NULL, last_heartbeat_ms BIGINT NOT NULL, priority INTEGER NOT NULL DEFAULT 0, device_type TEXT NOT NULL DEFAULT '', ip_address TEXT NOT NULL DEFAULT '', queue_ticket TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS broker_session_user_idx ON broker_session(user_id);",
      "CREATE TABLE IF NOT EXISTS viewing_history (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, channel_key TEXT NOT NULL, resource_kind SMALLINT NOT NULL, resource_id BIGINT NOT NULL, started_at_ms BIGINT NOT NULL, ended_at_ms BIGINT NOT NULL, duration_seconds BIGINT NOT NULL, end_reason SMALLINT NOT NULL, device_type TEXT NOT NULL DEFAULT '', ip_address TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS viewing_history_user_idx ON viewing_history(user_id, ended_at_ms);",
      "CREATE TABLE IF NOT EXISTS broker_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());"};
  return kSchema;
}

} // namespace livetv::db::sql
