#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/stream_session.hpp"

namespace livetv::session {

/*
  Active viewer sessions with secondary indexes by user and by resource.

  Not internally synchronized; the broker serializes access.
*/
class SessionTable {
 public:
  const model::StreamSession& Insert(model::StreamSession session);

  std::optional<model::StreamSession> Remove(const std::string& session_id);

  model::StreamSession*       Find(const std::string& session_id);
  const model::StreamSession* Find(const std::string& session_id) const;

  model::StreamSession* FindByUserChannel(const std::string& user_id, const std::string& channel_key, model::ResourceKind kind);

  std::vector<std::string> ForUser(const std::string& user_id) const;
  std::vector<std::string> ForResource(model::ResourceKind kind, uint64_t resource_id) const;

  // Ids of sessions whose last heartbeat is older than the threshold.
  std::vector<std::string> Stale(util::TimePoint now, std::chrono::milliseconds threshold) const;

  std::vector<model::StreamSession> Snapshot() const;

  std::size_t Size() const {
    return sessions_.size();
  }

  static bool IsStale(const model::StreamSession& session, util::TimePoint now, std::chrono::milliseconds threshold);

 private:
  static std::string ResourceKey(model::ResourceKind kind, uint64_t resource_id);
  static void        EraseIndex(std::unordered_multimap<std::string, std::string>& index, const std::string& key, const std::string& session_id);

  std::unordered_map<std::string, model::StreamSession> sessions_;
  std::unordered_multimap<std::string, std::string>     by_user_;
  std::unordered_multimap<std::string, std::string>     by_resource_;
};

} // namespace livetv::session
