#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace valuegraph::db::sqlite {

// Registers the SQL functions referenced by migration steps (vg_legacy_uuid).
void RegisterMigrationFunctions(SqliteDB& db);

/*
  MigrationExecutor over a SQLite connection.

  Generation lives in PRAGMA user_version, which is written inside the
  step's exclusive transaction and rolls back with it.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> BeginExclusive() override;

  void    ExecuteSQL(const std::string& sql) override;
  int64_t QueryCount(const std::string& sql) override;

  Generation ReadGeneration() override;
  void       WriteGeneration(Generation generation) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace valuegraph::db::sqlite
