#pragma once

namespace livetv::db {

/*
  Unit of work against the session store. Every backend guarantees:

  - writes stay private until Commit()
  - Rollback(), or destruction without Commit(), discards them
  - Commit() or Rollback() on a finished transaction throws

  Per backend: sqlite runs BEGIN IMMEDIATE on one shared connection,
  postgres wraps a pqxx::work on a pooled connection, and the memory
  store swaps in a copy-on-write snapshot.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace livetv::db
