#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"

namespace livetv::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                              UpsertSession(Transaction& tx, const model::SessionRecord& record) override;
  Result                              TouchSession(Transaction& tx, const std::string& id, uint64_t last_heartbeat_ms) override;
  Result                              DeleteSession(Transaction& tx, const std::string& id) override;
  std::optional<model::SessionRecord> GetSession(Transaction& tx, const std::string& id) override;
  std::vector<model::SessionRecord>   ListSessions(Transaction& tx) override;

  Result InsertViewingHistory(Transaction& tx, model::ViewingHistoryRecord& record) override;
  std::vector<model::ViewingHistoryRecord> ListViewingHistory(Transaction& tx, const std::string& user_id, uint32_t limit) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace livetv::db::sqlite
