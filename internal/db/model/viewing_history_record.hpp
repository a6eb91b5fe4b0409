#pragma once

#include <cstdint>
#include <string>

#include "internal/model/resource_kind.hpp"

namespace livetv::db::model {

// One row per ended session.
struct ViewingHistoryRecord {
  uint64_t id = 0; // assigned on insert

  std::string user_id;
  std::string channel_key;

  livetv::model::ResourceKind resource_kind = livetv::model::ResourceKind::kTuner;
  uint64_t                    resource_id   = 0;

  uint64_t started_at_ms    = 0;
  uint64_t ended_at_ms      = 0;
  uint64_t duration_seconds = 0;

  livetv::model::EndReason end_reason = livetv::model::EndReason::kReleased;

  std::string device_type;
  std::string ip_address;
};

} // namespace livetv::db::model
