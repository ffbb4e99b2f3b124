#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace projmgr::config {

/*
  Loads ManagerConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled by ApplyDefaults; relative paths resolve against the install dir.
*/
class ConfigLoader {
 public:
  static projmgr::runtime::config::ManagerConfig LoadFromYaml(const std::string& path);

  // Config file when present, defaults otherwise.
  static projmgr::runtime::config::ManagerConfig Load(const std::filesystem::path& path, const std::filesystem::path& install_dir);

  static void ApplyDefaults(projmgr::runtime::config::ManagerConfig* config, const std::filesystem::path& install_dir);
};

} // namespace projmgr::config
