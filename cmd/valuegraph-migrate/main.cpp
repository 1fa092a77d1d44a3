#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/generation.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"

namespace sql    = valuegraph::db::sql;
namespace sqlite = valuegraph::db::sqlite;

namespace {

constexpr int kExitUsage           = 1;
constexpr int kExitError           = 2;
constexpr int kExitAlreadyMigrated = 3;

void Usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " <path-to-database> [--target <generation>] [--skip-integrity-check]" << std::endl;
}

bool ParseGeneration(const std::string& text, valuegraph::db::Generation* out) {
  char* end   = nullptr;
  long  value = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || value < valuegraph::db::kEmptyGeneration || value > valuegraph::db::kLatestGeneration) {
    return false;
  }
  *out = static_cast<valuegraph::db::Generation>(value);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::string          path;
  sql::MigrationOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--target" && i + 1 < argc) {
      if (!ParseGeneration(argv[++i], &options.target)) {
        std::cerr << "invalid target generation: " << argv[i] << std::endl;
        return kExitUsage;
      }
    } else if (arg == "--skip-integrity-check") {
      options.integrity_check = false;
    } else if (path.empty() && arg.rfind("--", 0) != 0) {
      path = arg;
    } else {
      Usage(argv[0]);
      return kExitUsage;
    }
  }

  if (path.empty()) {
    Usage(argv[0]);
    return kExitUsage;
  }

  // migrating never creates a store
  if (!std::filesystem::exists(path)) {
    std::cerr << "No database found at " << path << std::endl;
    return kExitError;
  }

  valuegraph::runtime::config::RuntimeConfig config;
  valuegraph::observability::InitializeLogging(config);

  try {
    std::cout << "Opening database at " << path << std::endl;
    sqlite::SqliteOptions sqlite_options;
    sqlite_options.wal_mode = false;
    auto db = std::make_shared<sqlite::SqliteDB>(path, sqlite_options);

    sqlite::SqliteMigrationExecutor executor(db);

    const auto current = executor.ReadGeneration();
    std::cout << "Current schema generation: " << current << std::endl;
    std::cout << "Target schema generation: " << options.target << std::endl;
    if (current == options.target) {
      std::cerr << "Already migrated" << std::endl;
      valuegraph::observability::ShutdownLogging();
      return kExitAlreadyMigrated;
    }

    std::cout << "Migrating..." << std::endl;
    auto outcome = sql::RunMigrations(executor, sqlite::MigrationSteps(), options);
    for (auto generation : outcome.applied) {
      std::cout << "Migrated to generation " << generation << std::endl;
    }
    for (const auto& warning : outcome.integrity.warnings) {
      std::cout << "Integrity warning: " << warning.probe << " (" << warning.count << " rows)" << std::endl;
    }
    std::cout << "Done" << std::endl;

    std::cout << "Checking schema generation..." << std::endl;
    const auto now = executor.ReadGeneration();
    std::cout << "Schema generation now: " << now << std::endl;
    if (now != options.target) {
      std::cerr << "Schema generation mismatch: current=" << now << ", target=" << options.target << std::endl;
      valuegraph::observability::ShutdownLogging();
      return kExitError;
    }

    std::cout << "Migration successful" << std::endl;
  } catch (const std::exception& e) {
    VALUEGRAPH_LOG_ERROR("Fatal error", {valuegraph::observability::StringField("error", e.what())});
    valuegraph::observability::ShutdownLogging();
    return kExitError;
  }

  valuegraph::observability::ShutdownLogging();
  return 0;
}
