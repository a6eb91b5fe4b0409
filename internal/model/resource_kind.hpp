#pragma once

#include <cstdint>
#include <string_view>

namespace livetv::model {

enum class ResourceKind : std::uint8_t {
  kTuner      = 1,
  kCredential = 2,
};

constexpr std::string_view ToString(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::kTuner:
      return "tuner";
    case ResourceKind::kCredential:
      return "credential";
    default:
      return "unspecified";
  }
}

enum class UserClass : std::uint8_t {
  kStandard = 1,
  kPremium  = 2,
  kAdmin    = 3,
};

// Why a session or queue ticket stopped existing.
enum class EndReason : std::uint8_t {
  kReleased          = 1,
  kExpired           = 2,
  kResourceFailed    = 3,
  kMaintenance       = 4,
  kAdmin             = 5,
  kStreamSetupFailed = 6,
  kQueueTimeout      = 7,
};

constexpr std::string_view ToString(EndReason reason) {
  switch (reason) {
    case EndReason::kReleased:
      return "released";
    case EndReason::kExpired:
      return "expired";
    case EndReason::kResourceFailed:
      return "resource_failed";
    case EndReason::kMaintenance:
      return "maintenance";
    case EndReason::kAdmin:
      return "admin";
    case EndReason::kStreamSetupFailed:
      return "stream_setup_failed";
    case EndReason::kQueueTimeout:
      return "queue_timeout";
    default:
      return "unspecified";
  }
}

// The viewer should re-request rather than give up.
constexpr bool IsRetryable(EndReason reason) {
  return reason == EndReason::kResourceFailed || reason == EndReason::kMaintenance || reason == EndReason::kStreamSetupFailed;
}

} // namespace livetv::model
