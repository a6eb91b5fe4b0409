#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "internal/model/tuner_status.hpp"
#include "internal/util/time.hpp"

namespace livetv::model {

/*
  Physical HDHomeRun tuner.

  In service: busy <=> session_ids non-empty <=> tuned_channel set.
  Failed and maintenance tuners carry no sessions and no channel.
*/
struct Tuner {
  uint32_t              id = 0;
  std::string           tuned_channel;
  TunerStatus           status = TunerStatus::kAvailable;
  std::set<std::string> session_ids;
  uint32_t              failure_count = 0;
  util::TimePoint       last_activity{};
  util::TimePoint       failed_at{};
};

} // namespace livetv::model
