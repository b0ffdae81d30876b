#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "flowstore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Throws(const std::filesystem::path& yaml_path) {
  try {
    (void)flowstore::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(store:
  root_path: "/var/lib/flowstore/projects"
  fsync: true
properties_cache:
  max_entries: 50
  idle_seconds: 30
logging:
  level: "debug"
  pattern: "[%l] %v"
observability:
  tracing_enabled: false
  otlp_endpoint: "http://localhost:4318/v1/traces"
)");

  auto config = flowstore::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().root_path() == "/var/lib/flowstore/projects");
  assert(config.store().fsync());
  assert(config.properties_cache().max_entries() == 50);
  assert(config.properties_cache().idle_seconds() == 30);
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.observability().otlp_endpoint() == "http://localhost:4318/v1/traces");
}

void TestCacheDefaultsApplied() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(store:
  root_path: "/tmp/flowstore"
)");

  auto config = flowstore::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.store().fsync());
  assert(config.properties_cache().max_entries() == 2000);
  assert(config.properties_cache().idle_seconds() == 120);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(store:
  root_path: "C:\\flowstore\\\"quoted\"\\projects"
)");

  auto config = flowstore::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().root_path() == "C:\\flowstore\\\"quoted\"\\projects");
}

void TestMissingRootPathIsRejected() {
  const auto yaml_path = WriteYaml("missing_root",
                                   R"(properties_cache:
  max_entries: 10
)");
  assert(Throws(yaml_path) && "ConfigLoader must require store.root_path.");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(store:
  root_path: "/tmp/flowstore"
unknown_field: 123
)");
  assert(Throws(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  assert(Throws(std::filesystem::temp_directory_path() / "flowstore_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestFullConfig();
  TestCacheDefaultsApplied();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMissingRootPathIsRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "flowstore_unit_config_loader: pass\n";
  return 0;
}
