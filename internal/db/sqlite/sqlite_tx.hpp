#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace valuegraph::db::sqlite {

enum class TxMode {
  kDeferred,  // reads
  kImmediate, // writes: grabs write lock early
  kExclusive, // migrations: blocks readers on other connections too
};

/*
  SQLite transaction wrapper.

  Holds the connection's transaction mutex from BEGIN until COMMIT/ROLLBACK,
  so one thread must not open a second transaction while holding one.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode = TxMode::kImmediate);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_   = false;
  bool rolled_back_ = false;
};

}
