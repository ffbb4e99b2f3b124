#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace projmgr::config {

namespace {

constexpr char kDefaultProjectsDir[]    = "projects";
constexpr char kDefaultCredentialFile[] = "global-pat.txt";
constexpr char kDefaultTrustedHost[]    = "github.com";
constexpr char kDefaultUnitDir[]        = "/etc/systemd/system";
constexpr char kDefaultBaseImage[]      = "node:22-alpine3.20";
constexpr uint32_t kDefaultMaxAttempts  = 10;
constexpr uint32_t kDefaultIntervalMs   = 100;
constexpr uint32_t kDefaultLogLines     = 10;

std::string ResolveAgainst(const std::filesystem::path& base, const std::string& value) {
  std::filesystem::path path(value);
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal().string();
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

projmgr::runtime::config::ManagerConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  projmgr::runtime::config::ManagerConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

projmgr::runtime::config::ManagerConfig ConfigLoader::Load(const std::filesystem::path& path, const std::filesystem::path& install_dir) {
  projmgr::runtime::config::ManagerConfig config;
  if (!path.empty() && std::filesystem::exists(path)) {
    config = LoadFromYaml(path.string());
  }
  ApplyDefaults(&config, install_dir);
  return config;
}

void ConfigLoader::ApplyDefaults(projmgr::runtime::config::ManagerConfig* config, const std::filesystem::path& install_dir) {
  config->set_projects_dir(ResolveAgainst(install_dir, config->projects_dir().empty() ? kDefaultProjectsDir : config->projects_dir()));

  auto* credentials = config->mutable_credentials();
  credentials->set_global_credential_file(ResolveAgainst(
      install_dir, credentials->global_credential_file().empty() ? kDefaultCredentialFile : credentials->global_credential_file()));
  if (credentials->trusted_hosts().empty()) {
    credentials->add_trusted_hosts(kDefaultTrustedHost);
  }

  auto* status_check = config->mutable_status_check();
  if (!status_check->has_max_attempts()) {
    status_check->set_max_attempts(kDefaultMaxAttempts);
  }
  if (!status_check->has_interval_ms()) {
    status_check->set_interval_ms(kDefaultIntervalMs);
  }

  auto* self_update = config->mutable_self_update();
  self_update->set_install_dir(self_update->install_dir().empty() ? install_dir.string() : ResolveAgainst(install_dir, self_update->install_dir()));

  if (config->container().default_base_image().empty()) {
    config->mutable_container()->set_default_base_image(kDefaultBaseImage);
  }
  if (config->service().unit_dir().empty()) {
    config->mutable_service()->set_unit_dir(kDefaultUnitDir);
  }
  if (!config->logs().has_default_lines()) {
    config->mutable_logs()->set_default_lines(kDefaultLogLines);
  }
}

} // namespace projmgr::config
