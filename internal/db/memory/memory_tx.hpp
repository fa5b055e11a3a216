#pragma once

#include <mutex>
#include <shared_mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace fraudit::db::memory {

/*
  Write transaction = exclusive lock + undo log; read transaction = shared lock.

  Writes are applied to the live tables in place and each one records how to
  revert itself. Rollback replays the log backwards; Commit drops it. Like
  BEGIN IMMEDIATE, the writer lock is taken up front, so no reader ever sees
  an uncommitted row.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Throws std::logic_error on a read-only transaction.
  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return repo_.state_;
  }

  void OnRollback(MemoryRepository::Undo undo) {
    undo_.push_back(std::move(undo));
  }

 private:
  void Release();

  MemoryRepository&                   repo_;
  bool                                read_only_;
  std::unique_lock<std::shared_mutex> write_lock_;
  std::shared_lock<std::shared_mutex> read_lock_;
  std::vector<MemoryRepository::Undo> undo_;
  bool                                committed_   = false;
  bool                                rolled_back_ = false;
};

} // namespace fraudit::db::memory
