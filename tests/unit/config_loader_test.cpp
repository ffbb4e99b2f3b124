#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "projmgr_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFieldsAreLoaded() {
  const auto yaml_path = WriteYaml("fields",
                                   R"(projects_dir: "/srv/projmgr"
logging:
  level: debug
status_check:
  max_attempts: 3
  interval_ms: 250
credentials:
  global_credential_file: "/etc/projmgr/pat"
  trusted_hosts:
    - github.com
    - git.example.org
self_update:
  repo_url: "https://github.com/acme/projmgr.git"
  build_command: ["cmake", "--build", "build"]
logs:
  default_lines: 50
)");

  auto config = projmgr::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.projects_dir() == "/srv/projmgr");
  assert(config.logging().level() == "debug");
  assert(config.status_check().max_attempts() == 3);
  assert(config.status_check().interval_ms() == 250);
  assert(config.credentials().trusted_hosts_size() == 2);
  assert(config.credentials().trusted_hosts(1) == "git.example.org");
  assert(config.self_update().build_command_size() == 3);
  assert(config.self_update().build_command(1) == "--build");
  assert(config.logs().default_lines() == 50);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(projects_dir: "C:\\projmgr\\\"quoted\"\\projects"
)");

  auto config = projmgr::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.projects_dir() == "C:\\projmgr\\\"quoted\"\\projects");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(projects_dir: "/tmp/projects"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)projmgr::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDefaultsResolveAgainstInstallDir() {
  const auto missing = std::filesystem::temp_directory_path() / "projmgr_config_loader_tests" / "does_not_exist.yaml";
  std::filesystem::remove(missing);

  auto config = projmgr::config::ConfigLoader::Load(missing, "/opt/projmgr");
  assert(config.projects_dir() == "/opt/projmgr/projects");
  assert(config.credentials().global_credential_file() == "/opt/projmgr/global-pat.txt");
  assert(config.credentials().trusted_hosts_size() == 1);
  assert(config.credentials().trusted_hosts(0) == "github.com");
  assert(config.status_check().max_attempts() == 10);
  assert(config.status_check().interval_ms() == 100);
  assert(config.self_update().install_dir() == "/opt/projmgr");
  assert(config.service().unit_dir() == "/etc/systemd/system");
  assert(config.logs().default_lines() == 10);
  assert(!config.container().default_base_image().empty());
}

void TestExplicitZeroAttemptsIsKept() {
  const auto yaml_path = WriteYaml("zero_attempts",
                                   R"(projects_dir: "relative/projects"
status_check:
  max_attempts: 0
)");

  auto config = projmgr::config::ConfigLoader::Load(yaml_path, "/opt/projmgr");
  assert(config.projects_dir() == "/opt/projmgr/relative/projects");
  assert(config.status_check().max_attempts() == 0);
  assert(config.status_check().interval_ms() == 100);
}

} // namespace

int main() {
  TestFieldsAreLoaded();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestDefaultsResolveAgainstInstallDir();
  TestExplicitZeroAttemptsIsKept();

  std::cout << "projmgr_unit_config_loader: pass\n";
  return 0;
}
