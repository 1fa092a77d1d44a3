#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace valuegraph::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

struct SqliteOptions {
  bool        wal_mode        = true;
  int         busy_timeout_ms = 5000;
  std::string synchronous     = "NORMAL";
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is opened FULLMUTEX and shared by every transaction of
  the store; TxMutex() serializes transactions on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // First column of the first row as an integer; 0 when no row.
  int64_t QueryInt64(const std::string& sql);

  // PRAGMA user_version holds the schema generation.
  int32_t UserVersion();
  void    SetUserVersion(int32_t version);

  // Apply journal/sync/busy PRAGMAs
  void Configure(const SqliteOptions& options);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Throws std::runtime_error carrying sqlite3_errmsg unless rc is SQLITE_OK.
void ThrowIf(int rc, sqlite3* db, const char* what);

} // namespace valuegraph::db::sqlite
