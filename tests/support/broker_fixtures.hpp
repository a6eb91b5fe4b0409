#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/core/tuner_broker.hpp"
#include "internal/resolver/stream_url_resolver.hpp"
#include "internal/util/errors.hpp"

namespace livetv::testing {

// Manually advanced wall clock shared between a test and the broker.
class FakeClock {
 public:
  FakeClock() : now_(util::FromUnixMillis(1'700'000'000'000ULL)) {
  }

  util::TimePoint Now() const {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Advance(std::chrono::milliseconds delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
  }

  util::ClockFn Fn() {
    return [this] { return Now(); };
  }

 private:
  mutable std::mutex mutex_;
  util::TimePoint    now_;
};

// Resolves "fake://<kind>/<resource>/<channel>" unless the channel is marked broken.
class FakeResolver final : public resolver::StreamUrlResolver {
 public:
  std::string Resolve(const model::StreamSession& session) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    if (broken_channels_.contains(session.channel_key)) {
      throw util::ResourceFailed("fake resolver: channel " + session.channel_key + " is broken");
    }
    return "fake://" + std::string(model::ToString(session.resource_kind)) + "/" + std::to_string(session.resource_id) + "/" +
           session.channel_key;
  }

  void Break(const std::string& channel_key) {
    std::lock_guard lock(mutex_);
    broken_channels_.insert(channel_key);
  }

  void Fix(const std::string& channel_key) {
    std::lock_guard lock(mutex_);
    broken_channels_.erase(channel_key);
  }

  int Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex    mutex_;
  std::set<std::string> broken_channels_;
  int                   calls_ = 0;
};

inline model::CredentialSlot MakeCredential(uint64_t id, const std::string& provider_id, uint32_t max_connections) {
  model::CredentialSlot slot;
  slot.id              = id;
  slot.provider_id     = provider_id;
  slot.name            = provider_id + " #" + std::to_string(id);
  slot.max_connections = max_connections;
  return slot;
}

inline core::BrokerOptions MakeOptions(uint32_t tuners, std::vector<model::CredentialSlot> credentials = {}) {
  core::BrokerOptions options;
  options.tuner_count     = tuners;
  options.credentials     = std::move(credentials);
  options.stale_threshold = std::chrono::seconds(90);
  options.queue_timeout   = std::chrono::minutes(5);
  return options;
}

inline core::ChannelRequest TunerRequest(const std::string& user_id, const std::string& channel_key) {
  core::ChannelRequest request;
  request.user_id     = user_id;
  request.channel_key = channel_key;
  request.kind        = model::ResourceKind::kTuner;
  return request;
}

inline core::ChannelRequest CredentialRequest(const std::string& user_id, const std::string& stream_id, const std::string& provider_id = {}) {
  core::ChannelRequest request;
  request.user_id     = user_id;
  request.channel_key = stream_id;
  request.kind        = model::ResourceKind::kCredential;
  request.provider_id = provider_id;
  return request;
}

// Checks the resource invariants against a status snapshot.
inline bool ResourcesConsistent(const core::BrokerStatus& status) {
  std::set<std::string> channels;
  for (const auto& tuner : status.tuners) {
    const bool busy = tuner.status == model::TunerStatus::kBusy;
    if (busy != !tuner.session_ids.empty()) return false;
    if (busy != !tuner.tuned_channel.empty()) return false;
    if (busy && !channels.insert(tuner.tuned_channel).second) return false;
  }
  if (channels.size() > status.tuners.size()) return false;

  for (const auto& slot : status.credentials) {
    if (slot.active_connections > slot.max_connections) return false;
  }

  for (const auto& session : status.sessions) {
    if (session.resource_kind != model::ResourceKind::kTuner) continue;
    const auto& tuner = status.tuners.at(session.resource_id - 1);
    if (!tuner.session_ids.contains(session.id) || tuner.tuned_channel != session.channel_key) return false;
  }
  return true;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace livetv::testing
