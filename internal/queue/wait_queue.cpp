#include "wait_queue.hpp"

#include <iterator>

#include "internal/util/errors.hpp"

namespace livetv::queue {

uint32_t WaitQueue::Push(model::QueueEntry entry) {
  if (by_ticket_.contains(entry.ticket_id)) {
    throw util::InvalidState("ticket already queued: " + entry.ticket_id);
  }

  const auto key = KeyOf(entry);
  auto [it, inserted] = entries_.emplace(key, std::move(entry));
  if (!inserted) {
    throw util::InvalidState("duplicate queue order key");
  }
  by_ticket_.emplace(it->second.ticket_id, key);
  return static_cast<uint32_t>(std::distance(entries_.begin(), it)) + 1;
}

bool WaitQueue::Cancel(const std::string& ticket_id) {
  auto it = by_ticket_.find(ticket_id);
  if (it == by_ticket_.end()) return false;

  entries_.erase(it->second);
  by_ticket_.erase(it);
  return true;
}

const model::QueueEntry* WaitQueue::Head() const {
  return entries_.empty() ? nullptr : &entries_.begin()->second;
}

std::optional<model::QueueEntry> WaitQueue::PopHead() {
  if (entries_.empty()) return std::nullopt;

  auto head = std::move(entries_.begin()->second);
  entries_.erase(entries_.begin());
  by_ticket_.erase(head.ticket_id);
  return head;
}

std::optional<uint32_t> WaitQueue::PositionOf(const std::string& ticket_id) const {
  auto it = by_ticket_.find(ticket_id);
  if (it == by_ticket_.end()) return std::nullopt;

  auto entry = entries_.find(it->second);
  return static_cast<uint32_t>(std::distance(entries_.begin(), entry)) + 1;
}

const model::QueueEntry* WaitQueue::Find(const std::string& ticket_id) const {
  auto it = by_ticket_.find(ticket_id);
  if (it == by_ticket_.end()) return nullptr;
  return &entries_.at(it->second);
}

const model::QueueEntry* WaitQueue::FindByUserChannel(const std::string& user_id, const std::string& channel_key) const {
  for (const auto& [_, entry] : entries_) {
    if (entry.user_id == user_id && entry.channel_key == channel_key) return &entry;
  }
  return nullptr;
}

std::vector<model::QueueEntry> WaitQueue::RemoveOlderThan(util::TimePoint cutoff) {
  std::vector<model::QueueEntry> removed;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.requested_at < cutoff) {
      by_ticket_.erase(it->second.ticket_id);
      removed.push_back(std::move(it->second));
      it = entries_.erase(it);
      continue;
    }
    ++it;
  }
  return removed;
}

std::vector<model::QueueEntry> WaitQueue::TakeForChannel(const std::string& channel_key) {
  std::vector<model::QueueEntry> taken;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.channel_key == channel_key) {
      by_ticket_.erase(it->second.ticket_id);
      taken.push_back(std::move(it->second));
      it = entries_.erase(it);
      continue;
    }
    ++it;
  }
  return taken;
}

std::vector<model::QueueEntry> WaitQueue::Snapshot() const {
  std::vector<model::QueueEntry> out;
  out.reserve(entries_.size());
  for (const auto& [_, entry] : entries_) {
    out.push_back(entry);
  }
  return out;
}

} // namespace livetv::queue
