#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "valuegraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSqliteSectionIsLoaded() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(database:
  sqlite:
    path: "/var/lib/valuegraph/store.db"
    wal_mode: true
    busy_timeout_ms: 2500
    synchronous: FULL
migration:
  skip_integrity_check: true
logging:
  level: debug
)");

  auto config = valuegraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/valuegraph/store.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.database().sqlite().synchronous() == "FULL");
  assert(config.migration().skip_integrity_check());
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\valuegraph\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = valuegraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\valuegraph\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = valuegraph::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "1234"
logging:
  pattern: "line1\nline2☃"
)");
  assert(config.database().sqlite().path() == "1234");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestMemoryBackendAndEmptyDocument() {
  auto memory = valuegraph::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(memory.database().has_memory());
  assert(!memory.database().has_sqlite());

  auto empty = valuegraph::config::ConfigLoader::LoadFromYamlString("");
  assert(!empty.has_database());
  assert(!empty.migration().skip_integrity_check());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/data"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)valuegraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)valuegraph::config::ConfigLoader::LoadFromYaml("/nonexistent/valuegraph.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSqliteSectionIsLoaded();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestMemoryBackendAndEmptyDocument();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "valuegraph_unit_config_loader: pass\n";
  return 0;
}
