#pragma once

#include <cstdint>
#include <string>

#include "internal/model/resource_kind.hpp"
#include "internal/util/time.hpp"

namespace livetv::model {

struct StreamSession {
  std::string     id;
  ResourceKind    resource_kind = ResourceKind::kTuner;
  uint64_t        resource_id   = 0;
  std::string     channel_key;
  std::string     user_id;
  std::string     stream_url;
  util::TimePoint started_at{};
  util::TimePoint last_heartbeat{};
  int32_t         priority = 0;

  // analytics only
  std::string device_type;
  std::string ip_address;

  // set when the session was created by queue promotion
  std::string queue_ticket;
};

} // namespace livetv::model
