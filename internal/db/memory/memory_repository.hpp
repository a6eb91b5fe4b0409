#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace livetv::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertSession(Transaction&, const model::SessionRecord&) override;
  Result TouchSession(Transaction&, const std::string& id, uint64_t last_heartbeat_ms) override;
  Result DeleteSession(Transaction&, const std::string& id) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&) override;

  Result InsertViewingHistory(Transaction&, model::ViewingHistoryRecord&) override;
  std::vector<model::ViewingHistoryRecord> ListViewingHistory(
      Transaction&, const std::string& user_id, uint32_t limit) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::SessionRecord> sessions;
    std::vector<model::ViewingHistoryRecord> history;
    uint64_t next_history_id = 1;
  };

  // Published states are immutable; a writing transaction copies the one
  // it started from and swaps its copy in on commit.
  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
};

}
