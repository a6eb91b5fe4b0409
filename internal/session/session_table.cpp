#include "session_table.hpp"

#include <algorithm>

namespace livetv::session {

std::string SessionTable::ResourceKey(model::ResourceKind kind, uint64_t resource_id) {
  return std::string(model::ToString(kind)) + ":" + std::to_string(resource_id);
}

void SessionTable::EraseIndex(std::unordered_multimap<std::string, std::string>& index, const std::string& key, const std::string& session_id) {
  auto range = index.equal_range(key);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second == session_id) {
      index.erase(it);
      return;
    }
  }
}

bool SessionTable::IsStale(const model::StreamSession& session, util::TimePoint now, std::chrono::milliseconds threshold) {
  return now - session.last_heartbeat > threshold;
}

const model::StreamSession& SessionTable::Insert(model::StreamSession session) {
  if (auto existing = sessions_.find(session.id); existing != sessions_.end()) {
    EraseIndex(by_user_, existing->second.user_id, session.id);
    EraseIndex(by_resource_, ResourceKey(existing->second.resource_kind, existing->second.resource_id), session.id);
  }

  by_user_.emplace(session.user_id, session.id);
  by_resource_.emplace(ResourceKey(session.resource_kind, session.resource_id), session.id);

  const auto id = session.id;
  auto&      slot = sessions_[id];
  slot           = std::move(session);
  return slot;
}

std::optional<model::StreamSession> SessionTable::Remove(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return std::nullopt;

  EraseIndex(by_user_, it->second.user_id, session_id);
  EraseIndex(by_resource_, ResourceKey(it->second.resource_kind, it->second.resource_id), session_id);

  auto removed = std::move(it->second);
  sessions_.erase(it);
  return removed;
}

model::StreamSession* SessionTable::Find(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : &it->second;
}

const model::StreamSession* SessionTable::Find(const std::string& session_id) const {
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : &it->second;
}

model::StreamSession* SessionTable::FindByUserChannel(const std::string& user_id, const std::string& channel_key, model::ResourceKind kind) {
  auto range = by_user_.equal_range(user_id);
  for (auto it = range.first; it != range.second; ++it) {
    auto* session = Find(it->second);
    if (session && session->channel_key == channel_key && session->resource_kind == kind) return session;
  }
  return nullptr;
}

std::vector<std::string> SessionTable::ForUser(const std::string& user_id) const {
  std::vector<std::string> ids;
  auto                     range = by_user_.equal_range(user_id);
  for (auto it = range.first; it != range.second; ++it) {
    ids.push_back(it->second);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<std::string> SessionTable::ForResource(model::ResourceKind kind, uint64_t resource_id) const {
  std::vector<std::string> ids;
  auto                     range = by_resource_.equal_range(ResourceKey(kind, resource_id));
  for (auto it = range.first; it != range.second; ++it) {
    ids.push_back(it->second);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<std::string> SessionTable::Stale(util::TimePoint now, std::chrono::milliseconds threshold) const {
  std::vector<std::string> ids;
  for (const auto& [id, session] : sessions_) {
    if (IsStale(session, now, threshold)) ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<model::StreamSession> SessionTable::Snapshot() const {
  std::vector<model::StreamSession> out;
  out.reserve(sessions_.size());
  for (const auto& [_, session] : sessions_) {
    out.push_back(session);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.started_at != b.started_at ? a.started_at < b.started_at : a.id < b.id;
  });
  return out;
}

} // namespace livetv::session
