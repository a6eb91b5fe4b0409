#pragma once

#include <cstdint>
#include <string>

#include "internal/model/resource_kind.hpp"

namespace livetv::db::model {

/*
  Persistent row for a live session.

  Written after the grant leaves the broker's critical section and deleted
  when the session ends. Rows surviving a restart are offered to
  TunerBroker::RestoreSessions.
*/
struct SessionRecord {
  std::string id;

  livetv::model::ResourceKind resource_kind = livetv::model::ResourceKind::kTuner;
  uint64_t                    resource_id   = 0;

  std::string channel_key;
  std::string user_id;
  std::string stream_url;

  uint64_t started_at_ms     = 0;
  uint64_t last_heartbeat_ms = 0;
  int32_t  priority          = 0;

  std::string device_type;
  std::string ip_address;
  std::string queue_ticket;
};

} // namespace livetv::db::model
