#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace valuegraph::db::sqlite {

/*
  Repository over a generation-2 SQLite store.

  Construction fails unless the store is already migrated to
  kLatestGeneration.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;
  Generation SchemaGeneration(Transaction&) override;

  Result UpsertValue(Transaction&, const model::ValueRecord&) override;
  Result InsertValue(Transaction&, const model::ValueRecord&) override;
  std::optional<model::ValueRecord> GetValue(Transaction&, const util::UUID&) override;
  Result DeleteValue(Transaction&, const util::UUID&) override;
  std::vector<util::UUID> FindValuesByString(Transaction&, std::string_view) override;
  uint64_t CountValues(Transaction&) override;

  Result InsertLink(Transaction&, model::LinkRecord&) override;
  Result DeleteLink(Transaction&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesFrom(Transaction&, const util::UUID&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesFromWithKey(Transaction&, const util::UUID&, const util::UUID&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesByKey(Transaction&, const util::UUID&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesTo(Transaction&, const util::UUID&, model::EdgeHandle) override;
  uint64_t CountLinks(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  Result WriteValue(Transaction&, const char* sql, const model::ValueRecord&);
  std::unique_ptr<EdgeCursor> OpenCursor(Transaction&, const char* sql, model::EdgeHandle after,
                                         const util::UUID& first, const util::UUID* second = nullptr);
};

}
