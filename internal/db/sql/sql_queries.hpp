#pragma once

#include <string>
#include <string_view>

namespace livetv::db::sql {

/*
  Statements shared by both SQL backends. They are written with '?'
  placeholders for sqlite; postgres prepares NumberedParams(...) of the
  same text, so parameter order is identical across backends.
*/

// sessions

static constexpr const char* UPSERT_SESSION =
    "INSERT INTO broker_session(id,resource_kind,resource_id,channel_key,user_id,stream_url,"
    "started_at_ms,last_heartbeat_ms,priority,device_type,ip_address,queue_ticket)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " resource_kind=excluded.resource_kind,"
    " resource_id=excluded.resource_id,"
    " channel_key=excluded.channel_key,"
    " user_id=excluded.user_id,"
    " stream_url=excluded.stream_url,"
    " started_at_ms=excluded.started_at_ms,"
    " last_heartbeat_ms=excluded.last_heartbeat_ms,"
    " priority=excluded.priority,"
    " device_type=excluded.device_type,"
    " ip_address=excluded.ip_address,"
    " queue_ticket=excluded.queue_ticket;";

static constexpr const char* TOUCH_SESSION =
    "UPDATE broker_session SET last_heartbeat_ms=? WHERE id=?;";

static constexpr const char* DELETE_SESSION =
    "DELETE FROM broker_session WHERE id=?;";

static constexpr const char* SELECT_SESSION =
    "SELECT id,resource_kind,resource_id,channel_key,user_id,stream_url,"
    "started_at_ms,last_heartbeat_ms,priority,device_type,ip_address,queue_ticket"
    " FROM broker_session WHERE id=?;";

static constexpr const char* SELECT_SESSIONS =
    "SELECT id,resource_kind,resource_id,channel_key,user_id,stream_url,"
    "started_at_ms,last_heartbeat_ms,priority,device_type,ip_address,queue_ticket"
    " FROM broker_session ORDER BY id;";

// viewing history

static constexpr const char* INSERT_HISTORY =
    "INSERT INTO viewing_history(user_id,channel_key,resource_kind,resource_id,"
    "started_at_ms,ended_at_ms,duration_seconds,end_reason,device_type,ip_address)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_HISTORY_ALL =
    "SELECT id,user_id,channel_key,resource_kind,resource_id,started_at_ms,ended_at_ms,"
    "duration_seconds,end_reason,device_type,ip_address"
    " FROM viewing_history ORDER BY ended_at_ms DESC, id DESC LIMIT ?;";

static constexpr const char* SELECT_HISTORY_FOR_USER =
    "SELECT id,user_id,channel_key,resource_kind,resource_id,started_at_ms,ended_at_ms,"
    "duration_seconds,end_reason,device_type,ip_address"
    " FROM viewing_history WHERE user_id=? ORDER BY ended_at_ms DESC, id DESC LIMIT ?;";

// Rewrites each '?' outside string literals as $1, $2, ...
inline std::string NumberedParams(std::string_view sql) {
  std::string out;
  out.reserve(sql.size() + 16);
  int  next     = 1;
  bool in_quote = false;
  for (char c : sql) {
    if (c == '\'') in_quote = !in_quote;
    if (c == '?' && !in_quote) {
      out += '$' + std::to_string(next++);
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace livetv::db::sql
