#pragma once

namespace valuegraph::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE (writes), BEGIN DEFERRED (reads), BEGIN EXCLUSIVE (migrations)
  Memory: shared immutable snapshot for reads, private copy for writes
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() succeeded; stays false after Rollback()
  virtual bool IsCommitted() const = 0;
};

}
