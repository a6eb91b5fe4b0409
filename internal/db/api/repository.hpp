#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/viewing_history_record.hpp"

namespace livetv::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Backends never throw for expected failures; they return Result

  The broker's in-memory tables are the source of truth for admission.
  The DB mirrors live sessions (for restart) and keeps viewing history.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Live sessions
  // ---------------------------------------------------------------------

  virtual Result UpsertSession(Transaction&, const model::SessionRecord&) = 0;

  // NotFound when the row does not exist.
  virtual Result TouchSession(Transaction&, const std::string& id, uint64_t last_heartbeat_ms) = 0;

  // Deleting a missing row is not an error.
  virtual Result DeleteSession(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Viewing history
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertViewingHistory(Transaction&, model::ViewingHistoryRecord& record) = 0;

  // Newest first. Empty user_id lists every user; limit 0 means no limit.
  virtual std::vector<model::ViewingHistoryRecord> ListViewingHistory(Transaction&, const std::string& user_id, uint32_t limit) = 0;
};

} // namespace livetv::db
