#include "memory_tx.hpp"

#include <stdexcept>

namespace livetv::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::lock_guard lock(repo_.mutex_);
  base_ = repo_.committed_;
}

void MemoryTransaction::EnsureOpen() const {
  if (finished_) {
    throw std::runtime_error("memory transaction already finished");
  }
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  EnsureOpen();
  if (!draft_) {
    draft_ = std::make_shared<MemoryRepository::State>(*base_);
  }
  return *draft_;
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  finished_ = true;
  if (!draft_) {
    committed_ = true;
    return;
  }

  std::lock_guard lock(repo_.mutex_);
  if (repo_.committed_ != base_) {
    throw std::runtime_error("memory transaction conflict: session store changed since the transaction began");
  }
  repo_.committed_ = std::move(draft_);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  EnsureOpen();
  finished_ = true;
  draft_.reset();
}

} // namespace livetv::db::memory
