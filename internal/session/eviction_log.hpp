#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/resource_kind.hpp"

namespace livetv::session {

/*
  Bounded record of why recent sessions and tickets ended, so a late
  heartbeat or poll gets a precise error. Oldest entries fall off first.
*/
class EvictionLog {
 public:
  explicit EvictionLog(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  void Record(const std::string& id, model::EndReason reason);

  std::optional<model::EndReason> Lookup(const std::string& id) const;

  std::size_t Size() const {
    return reasons_.size();
  }

 private:
  std::size_t                                       capacity_;
  std::deque<std::string>                           order_;
  std::unordered_map<std::string, model::EndReason> reasons_;
};

inline void EvictionLog::Record(const std::string& id, model::EndReason reason) {
  if (auto it = reasons_.find(id); it != reasons_.end()) {
    it->second = reason;
    return;
  }

  while (reasons_.size() >= capacity_ && !order_.empty()) {
    reasons_.erase(order_.front());
    order_.pop_front();
  }
  order_.push_back(id);
  reasons_.emplace(id, reason);
}

inline std::optional<model::EndReason> EvictionLog::Lookup(const std::string& id) const {
  auto it = reasons_.find(id);
  if (it == reasons_.end()) return std::nullopt;
  return it->second;
}

} // namespace livetv::session
