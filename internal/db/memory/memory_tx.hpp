#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace livetv::db::memory {

/*
  Optimistic transaction over MemoryRepository.

  Reads go to the state published when the transaction began. The first
  write copies that state; Commit publishes the copy unless another
  writer committed in between, in which case it throws and nothing is
  applied. Read-only transactions never conflict.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const {
    return draft_ ? *draft_ : *base_;
  }

 private:
  void EnsureOpen() const;

  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> base_;
  std::shared_ptr<MemoryRepository::State>       draft_;
  bool                                           committed_ = false;
  bool                                           finished_  = false;
};

} // namespace livetv::db::memory
