#include "memory_tx.hpp"

#include <stdexcept>

namespace fraudit::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  if (read_only_) {
    read_lock_ = std::shared_lock<std::shared_mutex>(repo_.mutex_);
  } else {
    write_lock_ = std::unique_lock<std::shared_mutex>(repo_.mutex_);
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw std::logic_error("write through a read-only transaction");
  }
  return repo_.state_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  undo_.clear();
  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_.clear();
  rolled_back_ = true;
  Release();
}

void MemoryTransaction::Release() {
  if (write_lock_.owns_lock()) write_lock_.unlock();
  if (read_lock_.owns_lock()) read_lock_.unlock();
}

} // namespace fraudit::db::memory
