#include "sqlite_db.hpp"

#include <stdexcept>

namespace valuegraph::db::sqlite {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(options);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt);
  ThrowIf(rc, db_, "sqlite prepare");
  return owned;
}

int64_t SqliteDB::QueryInt64(const std::string& sql) {
  auto st = Prepare(sql);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    return sqlite3_column_int64(st.get(), 0);
  }
  if (rc != SQLITE_DONE) {
    ThrowIf(rc, db_, "sqlite query");
  }
  return 0;
}

int32_t SqliteDB::UserVersion() {
  return static_cast<int32_t>(QueryInt64("PRAGMA user_version;"));
}

void SqliteDB::SetUserVersion(int32_t version) {
  // PRAGMA arguments cannot be bound
  Exec("PRAGMA user_version = " + std::to_string(version) + ";");
}

void SqliteDB::Configure(const SqliteOptions& options) {
  // WAL enables concurrent readers while writer holds lock; ignored for :memory:
  if (options.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  const std::string sync = options.synchronous.empty() ? "NORMAL" : options.synchronous;
  if (sync != "OFF" && sync != "NORMAL" && sync != "FULL" && sync != "EXTRA") {
    throw std::invalid_argument("unsupported sqlite synchronous mode: " + sync);
  }
  Exec("PRAGMA synchronous=" + sync + ";");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace valuegraph::db::sqlite
