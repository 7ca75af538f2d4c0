#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace dispatch::db::memory {

/*
  Transaction = exclusive lock + snapshot.

  The repository mutex is held from construction until Commit/Rollback, so
  memory transactions are serialized the same way BEGIN IMMEDIATE serializes
  SQLite writers. Writes go to the snapshot and replace the committed state
  on Commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         finished_ = false;
};

} // namespace dispatch::db::memory
