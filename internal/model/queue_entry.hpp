#pragma once

#include <cstdint>
#include <string>

#include "internal/model/resource_kind.hpp"
#include "internal/util/time.hpp"

namespace livetv::model {

struct QueueEntry {
  std::string     ticket_id;
  std::string     user_id;
  std::string     channel_key;
  ResourceKind    kind = ResourceKind::kTuner;
  std::string     provider_id; // credential pool; empty = any provider
  util::TimePoint requested_at{};
  int32_t         priority = 0;
  uint64_t        sequence = 0; // global admission order, final tie-breaker

  std::string device_type;
  std::string ip_address;
};

} // namespace livetv::model
