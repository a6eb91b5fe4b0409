#pragma once

#include <cstdint>
#include <string_view>

namespace livetv::model {

enum class TunerStatus : std::uint8_t {
  kAvailable   = 1,
  kBusy        = 2,
  kFailed      = 3,
  kMaintenance = 4,
};

constexpr std::string_view ToString(TunerStatus status) {
  switch (status) {
    case TunerStatus::kAvailable:
      return "available";
    case TunerStatus::kBusy:
      return "busy";
    case TunerStatus::kFailed:
      return "failed";
    case TunerStatus::kMaintenance:
      return "maintenance";
    default:
      return "unspecified";
  }
}

constexpr bool IsOutOfService(TunerStatus status) {
  return status == TunerStatus::kFailed || status == TunerStatus::kMaintenance;
}

constexpr bool CanTransition(TunerStatus from, TunerStatus to) {
  if (from == to) {
    return true;
  }
  switch (from) {
    case TunerStatus::kAvailable:
    case TunerStatus::kBusy:
      return true;
    case TunerStatus::kFailed:
      return to == TunerStatus::kAvailable;
    case TunerStatus::kMaintenance:
      return to == TunerStatus::kAvailable || to == TunerStatus::kFailed;
  }
  return false;
}

} // namespace livetv::model
