#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace valuegraph::db::sqlite {

namespace {

const char* BeginSql(TxMode mode) {
  switch (mode) {
    case TxMode::kDeferred:
      return "BEGIN DEFERRED;";
    case TxMode::kExclusive:
      return "BEGIN EXCLUSIVE;";
    case TxMode::kImmediate:
    default:
      return "BEGIN IMMEDIATE;";
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec(BeginSql(mode));
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_ || rolled_back_) return;

  // some errors (SQLITE_FULL, SQLITE_IOERR, ...) already rolled back
  if (sqlite3_get_autocommit(db_->Handle())) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    VALUEGRAPH_LOG_ERROR("Rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (committed_) return;
  if (rolled_back_) {
    throw std::logic_error("commit after rollback");
  }

  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (committed_ || rolled_back_) return;

  if (!sqlite3_get_autocommit(db_->Handle())) {
    db_->Exec("ROLLBACK;");
  }
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace valuegraph::db::sqlite
