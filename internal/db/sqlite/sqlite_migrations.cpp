#include "sqlite_migrations.hpp"

#include <string_view>

#include "internal/util/uuid.hpp"
#include "sqlite_schema.hpp"
#include "sqlite_tx.hpp"

namespace valuegraph::db::sqlite {

namespace {

// vg_legacy_uuid(x): NULL -> NULL, 16 byte BLOB -> unchanged, anything else -> util::LegacyUUID(text)
void LegacyUuid(sqlite3_context* ctx, int, sqlite3_value** argv) {
  sqlite3_value* arg = argv[0];

  switch (sqlite3_value_type(arg)) {
    case SQLITE_NULL:
      sqlite3_result_null(ctx);
      return;
    case SQLITE_BLOB:
      if (sqlite3_value_bytes(arg) == 16) {
        sqlite3_result_blob(ctx, sqlite3_value_blob(arg), 16, SQLITE_TRANSIENT);
        return;
      }
      break;
    default:
      break;
  }

  const auto* text = reinterpret_cast<const char*>(sqlite3_value_text(arg));
  if (text == nullptr) {
    sqlite3_result_error_nomem(ctx);
    return;
  }

  // exceptions must not cross back into sqlite
  try {
    const auto id = util::LegacyUUID(std::string_view(text, static_cast<size_t>(sqlite3_value_bytes(arg))));
    sqlite3_result_blob(ctx, id.data(), static_cast<int>(id.size()), SQLITE_TRANSIENT);
  } catch (const std::exception& e) {
    sqlite3_result_error(ctx, e.what(), -1);
  }
}

} // namespace

void RegisterMigrationFunctions(SqliteDB& db) {
  int rc = sqlite3_create_function(db.Handle(), kLegacyUuidFunction, 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr, &LegacyUuid,
                                   nullptr, nullptr);
  ThrowIf(rc, db.Handle(), "register vg_legacy_uuid");
}

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  RegisterMigrationFunctions(*db_);
}

std::unique_ptr<Transaction> SqliteMigrationExecutor::BeginExclusive() {
  return std::make_unique<SqliteTransaction>(db_, TxMode::kExclusive);
}

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_->Exec(sql);
}

int64_t SqliteMigrationExecutor::QueryCount(const std::string& sql) {
  return db_->QueryInt64(sql);
}

Generation SqliteMigrationExecutor::ReadGeneration() {
  return db_->UserVersion();
}

void SqliteMigrationExecutor::WriteGeneration(Generation generation) {
  db_->SetUserVersion(generation);
}

} // namespace valuegraph::db::sqlite
