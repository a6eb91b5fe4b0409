#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace livetv::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSession(Transaction& t, const model::SessionRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "session id is empty");
  TX(t).Mutable().sessions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::TouchSession(Transaction& t, const std::string& id, uint64_t last_heartbeat_ms) {
  auto& tx = TX(t);
  if (!tx.View().sessions.count(id)) return Result::Err(ErrorCode::NotFound, "session not found: " + id);
  tx.Mutable().sessions.at(id).last_heartbeat_ms = last_heartbeat_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (tx.View().sessions.count(id)) tx.Mutable().sessions.erase(id);
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  return records;
}

// ------------------------------------------------------------------
// Viewing history
// ------------------------------------------------------------------

Result MemoryRepository::InsertViewingHistory(Transaction& t, model::ViewingHistoryRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_history_id++;
  s.history.push_back(r);
  return Result::Ok();
}

std::vector<model::ViewingHistoryRecord> MemoryRepository::ListViewingHistory(Transaction& t, const std::string& user_id, uint32_t limit) {
  const auto&                              s = TX(t).View();
  std::vector<model::ViewingHistoryRecord> out;
  for (const auto& record : s.history) {
    if (user_id.empty() || record.user_id == user_id) out.push_back(record);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.ended_at_ms != b.ended_at_ms ? a.ended_at_ms > b.ended_at_ms : a.id > b.id;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

} // namespace livetv::db::memory
