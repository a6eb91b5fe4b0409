#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/model/queue_entry.hpp"

namespace livetv::queue {

// Ascending priority, then arrival time, then admission sequence.
struct OrderKey {
  int32_t         priority = 0;
  util::TimePoint requested_at{};
  uint64_t        sequence = 0;

  bool operator<(const OrderKey& other) const {
    return std::tie(priority, requested_at, sequence) < std::tie(other.priority, other.requested_at, other.sequence);
  }
};

inline OrderKey KeyOf(const model::QueueEntry& entry) {
  return {entry.priority, entry.requested_at, entry.sequence};
}

/*
  Priority / FIFO wait queue for one resource class.

  Cancelling from the middle is O(log n) and never blocks the entries
  behind it. Not internally synchronized.
*/
class WaitQueue {
 public:
  // Returns the 1-based position of the new entry.
  uint32_t Push(model::QueueEntry entry);

  // False when the ticket is not queued here.
  bool Cancel(const std::string& ticket_id);

  const model::QueueEntry*         Head() const;
  std::optional<model::QueueEntry> PopHead();

  std::optional<uint32_t> PositionOf(const std::string& ticket_id) const;

  const model::QueueEntry* Find(const std::string& ticket_id) const;
  const model::QueueEntry* FindByUserChannel(const std::string& user_id, const std::string& channel_key) const;

  // Removes entries requested strictly before the cutoff.
  std::vector<model::QueueEntry> RemoveOlderThan(util::TimePoint cutoff);

  // Removes every entry waiting for the channel, in queue order.
  std::vector<model::QueueEntry> TakeForChannel(const std::string& channel_key);

  std::vector<model::QueueEntry> Snapshot() const;

  std::size_t Size() const {
    return entries_.size();
  }

  bool Empty() const {
    return entries_.empty();
  }

 private:
  std::map<OrderKey, model::QueueEntry>     entries_;
  std::unordered_map<std::string, OrderKey> by_ticket_;
};

} // namespace livetv::queue
