#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using caretask::config::ConfigLoader;
using caretask::runtime::config::CacheConfig;
using caretask::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "caretask_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/tmp/caretask.db"
    wal_mode: true
cache:
  memory: {}
logging:
  level: "debug"
observability:
  metrics_enabled: true
  collection_interval_ms: 5000
scheduler:
  hydrate_on_start: true
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "/tmp/caretask.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.cache().backend_case() == CacheConfig::kMemory);
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().collection_interval_ms() == 5000);
  assert(config.scheduler().hydrate_on_start());
}

void TestMissingSectionsFallBackToDefaults() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(logging:
  level: "warn"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == ConfigLoader::kDefaultBindAddress);
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
  assert(config.cache().backend_case() == CacheConfig::kMemory);
  assert(!config.scheduler().hydrate_on_start());
}

void TestQuotedNumericScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(database:
  sqlite:
    path: "2025"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "2025");
  assert(!config.database().sqlite().wal_mode());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEmptyDatabaseLocationIsRejected() {
  const auto sqlite_path = WriteYaml("empty_sqlite_path",
                                     R"(database:
  sqlite:
    wal_mode: true
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(sqlite_path.string());
  } catch (const caretask::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto postgres_path = WriteYaml("empty_postgres_uri",
                                       R"(database:
  postgres:
    max_connections: 4
)");

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(postgres_path.string());
  } catch (const caretask::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/caretask.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestMissingSectionsFallBackToDefaults();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestEmptyDatabaseLocationIsRejected();
  TestMissingFileIsReported();

  std::cout << "caretask_unit_config_loader: pass\n";
  return 0;
}
