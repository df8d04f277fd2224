#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using rollback::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "rollback_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
snapshots:
  sqlite:
    path: "/tmp/rollback/snapshots.db"
    wal_mode: true
  compression: none
engine:
  max_history_entries: 50
  affected_services: [documents, calculations]
  restore_bytes_per_second: 1048576
  base_restore_downtime_ms: 250
  parallel_rollback: true
observability:
  tracing_enabled: false
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_GRPC
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.snapshots().has_sqlite());
  assert(config.snapshots().sqlite().path() == "/tmp/rollback/snapshots.db");
  assert(config.snapshots().sqlite().wal_mode());
  assert(config.engine().max_history_entries() == 50);
  assert(config.engine().affected_services_size() == 2);
  assert(config.engine().affected_services(1) == "calculations");
  assert(config.engine().restore_bytes_per_second() == 1048576);
  assert(config.engine().base_restore_downtime_ms() == 250);
  assert(config.engine().parallel_rollback());
  assert(config.observability().otlp_endpoint() == "localhost:4317");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.snapshots().has_sqlite());
  assert(config.engine().max_history_entries() == 0);
  assert(!config.engine().parallel_rollback());
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(snapshots:
  memory: {}
  compression: "123"
)");
  assert(config.snapshots().has_memory());
  assert(config.snapshots().compression() == "123");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(engine:
  max_history_entries: 1
  unknown_field: 123
)");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Invalid configuration: ", 0) == 0;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/rollback-engine/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Failed to load YAML config: ", 0) == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyDocumentYieldsDefaults();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "rollback_engine_unit_config_loader: pass\n";
  return 0;
}
