#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"

namespace valuegraph::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

db::sqlite::SqliteOptions ToSqliteOptions(const valuegraph::runtime::config::SqliteConfig& sqlite) {
  db::sqlite::SqliteOptions options;
  options.wal_mode = sqlite.wal_mode();
  if (sqlite.busy_timeout_ms() != 0) {
    options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
  }
  if (!sqlite.synchronous().empty()) {
    options.synchronous = sqlite.synchronous();
  }
  return options;
}

std::shared_ptr<db::Repository> BuildSqliteRepository(const valuegraph::runtime::config::RuntimeConfig& config,
                                                      db::sql::MigrationOutcome&                        outcome) {
  const auto& sqlite = config.database().sqlite();
  if (sqlite.path().empty()) {
    throw std::runtime_error("database.sqlite.path is required");
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), ToSqliteOptions(sqlite));

  db::sql::MigrationOptions options;
  options.integrity_check = !config.migration().skip_integrity_check();

  db::sqlite::SqliteMigrationExecutor executor(sqlite_db);
  outcome = db::sql::RunMigrations(executor, db::sqlite::MigrationSteps(), options);

  VALUEGRAPH_LOG_INFO("Store ready", {StringField("path", sqlite.path()), IntField("from", outcome.from), IntField("generation", outcome.to),
                                      IntField("steps", static_cast<int64_t>(outcome.applied.size())),
                                      BoolField("integrity_clean", outcome.integrity.Clean())});

  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

std::shared_ptr<db::Repository> BuildRepository(const valuegraph::runtime::config::RuntimeConfig& config,
                                                db::sql::MigrationOutcome&                        outcome) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    return BuildSqliteRepository(config, outcome);
  }

  outcome      = {};
  outcome.from = db::kLatestGeneration;
  outcome.to   = db::kLatestGeneration;
  VALUEGRAPH_LOG_INFO("Store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

std::unique_ptr<core::GraphStore> OpenStore(const valuegraph::runtime::config::RuntimeConfig& config) {
  return OpenStore(config, nullptr);
}

std::unique_ptr<core::GraphStore> OpenStore(const valuegraph::runtime::config::RuntimeConfig& config,
                                            db::sql::MigrationOutcome*                        outcome) {
  db::sql::MigrationOutcome local;
  auto                      repository = BuildRepository(config, outcome ? *outcome : local);
  return std::make_unique<core::GraphStore>(std::move(repository));
}

} // namespace valuegraph::factory
