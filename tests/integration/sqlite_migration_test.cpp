#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace sql    = valuegraph::db::sql;
namespace sqlite = valuegraph::db::sqlite;

using valuegraph::db::EdgeCursor;
using valuegraph::db::model::LinkRecord;
using valuegraph::db::model::kNoEdge;
using valuegraph::util::LegacyUUID;

constexpr const char* kCanonicalId = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

uint64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

class TempStore {
 public:
  explicit TempStore(const std::string& test_name)
      : path_((std::filesystem::temp_directory_path() / ("valuegraph_migration_" + test_name + "_" + std::to_string(NowNs()) + ".db")).string()) {
  }

  ~TempStore() {
    std::filesystem::remove(path_);
    std::filesystem::remove(path_ + "-wal");
    std::filesystem::remove(path_ + "-shm");
  }

  const std::string& Path() const {
    return path_;
  }

  std::shared_ptr<sqlite::SqliteDB> Open() const {
    return std::make_shared<sqlite::SqliteDB>(path_);
  }

 private:
  std::string path_;
};

std::vector<LinkRecord> Drain(std::unique_ptr<EdgeCursor> cursor) {
  std::vector<LinkRecord> out;
  while (auto edge = cursor->Next()) {
    out.push_back(*edge);
  }
  return out;
}

int64_t CountObjects(sqlite::SqliteDB& db, const std::string& name) {
  return db.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE name = '" + name + "';");
}

// Generation-1 store with text ids, the way older builds wrote it.
void SeedGeneration1(const std::shared_ptr<sqlite::SqliteDB>& store) {
  sqlite::SqliteMigrationExecutor executor(store);
  auto&                           db = *store;

  sql::MigrationOptions options;
  options.target = 1;
  auto outcome   = sql::RunMigrations(executor, sqlite::MigrationSteps(), options);
  assert(outcome.to == 1);

  db.Exec("INSERT INTO `values` (`id`, `str`) VALUES ('alice', 'Alice');");
  db.Exec("INSERT INTO `values` (`id`, `i64`) VALUES ('bob', -5);");
  db.Exec("INSERT INTO `values` (`id`, `str`) VALUES ('likes', 'likes');");
  db.Exec(std::string("INSERT INTO `values` (`id`, `u32`) VALUES ('") + kCanonicalId + "', 7);");
  // u64 max, bit-cast into the signed column
  db.Exec("INSERT INTO `values` (`id`, `u64`) VALUES ('big', -1);");

  db.Exec("INSERT INTO `links` (`source_id`, `key_id`, `target_id`) VALUES ('alice', 'likes', 'bob');");
  db.Exec("INSERT INTO `links` (`source_id`, `key_id`, `target_id`) VALUES ('alice', 'likes', 'bob');");
  db.Exec("INSERT INTO `links` (`source_id`, `key_id`, `target_id`) VALUES ('bob', NULL, 'alice');");
  db.Exec(std::string("INSERT INTO `links` (`source_id`, `key_id`, `target_id`) VALUES ('alice', 'likes', '") + kCanonicalId + "');");
  db.Exec("INSERT INTO `links` (`source_id`, `key_id`, `target_id`) VALUES ('alice', 'likes', 'ghost');");
}

void TestEmptyStoreReachesLatestGeneration() {
  TempStore store("empty");
  auto      db = store.Open();

  sqlite::SqliteMigrationExecutor executor(db);
  assert(executor.ReadGeneration() == valuegraph::db::kEmptyGeneration);

  auto outcome = sql::RunMigrations(executor, sqlite::MigrationSteps());
  assert(outcome.from == 0);
  assert(outcome.to == valuegraph::db::kLatestGeneration);
  assert((outcome.applied == std::vector<valuegraph::db::Generation>{1, 2}));
  assert(outcome.integrity.Clean());

  assert(db->UserVersion() == valuegraph::db::kLatestGeneration);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `values`;") == 0);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `links`;") == 0);

  // running again has nothing to do
  auto again = sql::RunMigrations(executor, sqlite::MigrationSteps());
  assert(again.applied.empty());
  assert(again.to == valuegraph::db::kLatestGeneration);
}

void TestEmptyGeneration1StoreMigrates() {
  TempStore store("empty_gen1");
  auto      db = store.Open();

  sqlite::SqliteMigrationExecutor executor(db);
  sql::MigrationOptions           to_gen1;
  to_gen1.target = 1;
  sql::RunMigrations(executor, sqlite::MigrationSteps(), to_gen1);
  assert(db->UserVersion() == 1);

  auto outcome = sql::RunMigrations(executor, sqlite::MigrationSteps());
  assert(outcome.from == 1);
  assert((outcome.applied == std::vector<valuegraph::db::Generation>{2}));
  assert(db->UserVersion() == 2);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `values`;") == 0);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `links`;") == 0);
}

void TestGeneration1ReinitializationIsNoop() {
  TempStore store("reinit");
  auto      db = store.Open();
  SeedGeneration1(db);

  const auto values_before = db->QueryInt64("SELECT COUNT(*) FROM `values`;");
  const auto links_before  = db->QueryInt64("SELECT COUNT(*) FROM `links`;");

  sqlite::SqliteMigrationExecutor executor(db);
  auto                            report = sql::ApplyStep(executor, sqlite::Generation1Step());
  assert(report.Clean());

  assert(db->UserVersion() == 1);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `values`;") == values_before);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `links`;") == links_before);
  assert(CountObjects(*db, "links_keyed") == 1);
}

void TestGeneration1DataIsRekeyedConsistently() {
  TempStore store("rekey");
  auto      db = store.Open();
  SeedGeneration1(db);

  const auto values_before = db->QueryInt64("SELECT COUNT(*) FROM `values`;");
  const auto links_before  = db->QueryInt64("SELECT COUNT(*) FROM `links`;");

  sqlite::SqliteMigrationExecutor executor(db);
  auto                            outcome = sql::RunMigrations(executor, sqlite::MigrationSteps());
  assert(outcome.from == 1);
  assert(outcome.to == 2);

  // 'ghost' was never a value
  assert(outcome.integrity.warnings.size() == 1);
  assert(outcome.integrity.warnings[0].probe == "dangling_target");
  assert(outcome.integrity.warnings[0].count == 1);
  assert(outcome.integrity.warnings[0].generation == 2);

  assert(db->QueryInt64("SELECT COUNT(*) FROM `values`;") == values_before);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `links`;") == links_before);
  assert(CountObjects(*db, "values_next") == 0);
  assert(CountObjects(*db, "links_next") == 0);
  assert(CountObjects(*db, "links_source_id") == 0);
  assert(CountObjects(*db, "data_strs") == 1);
  assert(CountObjects(*db, "links_target") == 1);
  assert(CountObjects(*db, "links_keyed") == 1);

  sqlite::SqliteRepository repo(db);
  auto                     tx = repo.BeginRead();

  const auto alice     = LegacyUUID("alice");
  const auto bob       = LegacyUUID("bob");
  const auto likes     = LegacyUUID("likes");
  const auto canonical = valuegraph::util::FromString(kCanonicalId);
  assert(LegacyUUID(kCanonicalId) == canonical);

  assert(std::get<std::string>(repo.GetValue(*tx, alice)->value) == "Alice");
  assert(std::get<int64_t>(repo.GetValue(*tx, bob)->value) == -5);
  assert(std::get<uint32_t>(repo.GetValue(*tx, canonical)->value) == 7);
  assert(std::get<uint64_t>(repo.GetValue(*tx, LegacyUUID("big"))->value) == std::numeric_limits<uint64_t>::max());

  auto likes_ids = repo.FindValuesByString(*tx, "likes");
  assert(likes_ids.size() == 1 && likes_ids[0] == likes);

  auto alice_likes = Drain(repo.EdgesFromWithKey(*tx, alice, likes, kNoEdge));
  assert(alice_likes.size() == 4);
  assert(alice_likes[0].target == bob);
  assert(alice_likes[1].target == bob);
  assert(alice_likes[0].handle != alice_likes[1].handle);
  assert(alice_likes[2].target == canonical);
  assert(alice_likes[3].target == LegacyUUID("ghost"));

  auto to_bob = Drain(repo.EdgesTo(*tx, bob, kNoEdge));
  assert(to_bob.size() == 2);
  for (const auto& edge : to_bob) {
    assert(edge.source == alice);
    assert(edge.key == likes);
  }

  auto from_bob = Drain(repo.EdgesFrom(*tx, bob, kNoEdge));
  assert(from_bob.size() == 1);
  assert(!from_bob[0].key.has_value());
  assert(from_bob[0].target == alice);

  assert(Drain(repo.EdgesByKey(*tx, likes, kNoEdge)).size() == 4);
  tx->Commit();
}

void TestFailedMigrationKeepsGeneration1() {
  TempStore store("collision");
  auto      db = store.Open();
  SeedGeneration1(db);

  // both spellings of the same UUID map to one identifier
  db->Exec("INSERT INTO `values` (`id`, `bool`) VALUES ('00000000-0000-0000-0000-000000000001', 1);");
  db->Exec("INSERT INTO `values` (`id`, `bool`) VALUES ('00000000000000000000000000000001', 0);");
  const auto values_before = db->QueryInt64("SELECT COUNT(*) FROM `values`;");

  sqlite::SqliteMigrationExecutor executor(db);
  bool                            threw = false;
  try {
    sql::RunMigrations(executor, sqlite::MigrationSteps());
  } catch (const valuegraph::util::MigrationFailed&) {
    threw = true;
  }
  assert(threw && "colliding identifiers must fail the step");

  assert(db->UserVersion() == 1);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `values` WHERE `id` IS NOT NULL;") == values_before);
  assert(db->QueryInt64("SELECT COUNT(*) FROM `links` WHERE `source_id` = 'alice';") == 4);
  assert(CountObjects(*db, "values_next") == 0);
  assert(CountObjects(*db, "links_source_id") == 1);

  bool repo_threw = false;
  try {
    sqlite::SqliteRepository repo(db);
  } catch (const std::runtime_error&) {
    repo_threw = true;
  }
  assert(repo_threw && "repository must refuse a generation-1 store");
}

void TestNewerGenerationIsRefused() {
  TempStore store("newer");
  {
    auto db = store.Open();
    db->SetUserVersion(valuegraph::db::kLatestGeneration + 1);

    sqlite::SqliteMigrationExecutor executor(db);
    bool                            threw = false;
    try {
      sql::RunMigrations(executor, sqlite::MigrationSteps());
    } catch (const valuegraph::util::MigrationFailed&) {
      threw = true;
    }
    assert(threw);
    assert(db->UserVersion() == valuegraph::db::kLatestGeneration + 1);
  }

  valuegraph::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(store.Path());

  bool threw = false;
  try {
    valuegraph::factory::OpenStore(config);
  } catch (const valuegraph::util::MigrationFailed&) {
    threw = true;
  }
  assert(threw && "OpenStore must not open a store from a newer build");
}

void TestOpenStoreMigratesGeneration1() {
  TempStore store("open_store");
  {
    auto db = store.Open();
    SeedGeneration1(db);
  }

  valuegraph::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(store.Path());
  config.mutable_migration()->set_skip_integrity_check(true);

  sql::MigrationOutcome outcome;
  auto                  graph = valuegraph::factory::OpenStore(config, &outcome);
  assert(outcome.from == 1);
  assert(outcome.to == 2);
  assert(outcome.integrity.Clean());
  assert(graph->Generation() == 2);

  assert(graph->Values().Count() == 5);
  assert(graph->Links().Count() == 5);
  assert(std::get<std::string>(graph->Values().Get(LegacyUUID("alice"))) == "Alice");
  assert(graph->Links().EdgesTo(LegacyUUID("alice")).ToVector().size() == 1);
}

} // namespace

int main() {
  TestEmptyStoreReachesLatestGeneration();
  TestEmptyGeneration1StoreMigrates();
  TestGeneration1ReinitializationIsNoop();
  TestGeneration1DataIsRekeyedConsistently();
  TestFailedMigrationKeepsGeneration1();
  TestNewerGenerationIsRefused();
  TestOpenStoreMigratesGeneration1();

  std::cout << "valuegraph_integration_sqlite_migration: pass\n";
  return 0;
}
