#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace livetv::db::postgres {

// Runs the statements PgPool prepares on every connection. libpqxx
// reports failures as exceptions; they are folded into Result codes here.
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                              UpsertSession(Transaction&, const model::SessionRecord&) override;
  Result                              TouchSession(Transaction&, const std::string& id, uint64_t last_heartbeat_ms) override;
  Result                              DeleteSession(Transaction&, const std::string& id) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) override;
  std::vector<model::SessionRecord>   ListSessions(Transaction&) override;

  Result                                   InsertViewingHistory(Transaction&, model::ViewingHistoryRecord&) override;
  std::vector<model::ViewingHistoryRecord> ListViewingHistory(Transaction&, const std::string& user_id, uint32_t limit) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace livetv::db::postgres
