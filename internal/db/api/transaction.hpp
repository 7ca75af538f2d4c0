#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace dispatch::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Write transactions are serialized; conditional updates evaluated
    inside one are atomic with respect to every other transaction

  SQLite: BEGIN IMMEDIATE (one writer per database)
  Postgres: pqxx::work, conditional UPDATE ... WHERE status = expected
  Memory: exclusive lock + snapshot copy, swapped in on commit

  A thread must never hold two transactions at once.

  AfterCommit hooks run in registration order once Commit() has succeeded
  and the backend lock is released; a rollback drops them.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;

  void AfterCommit(std::function<void()> hook) {
    after_commit_.push_back(std::move(hook));
  }

 protected:
  // Backends call this at the end of a successful Commit().
  void RunAfterCommit() {
    auto hooks = std::move(after_commit_);
    after_commit_.clear();
    for (auto& hook : hooks) hook();
  }

 private:
  std::vector<std::function<void()>> after_commit_;
};

} // namespace dispatch::db
