#pragma once

#include <filesystem>
#include <string>

#include "internal/model/project_record.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::store {

/*
  File layout of the managed directory:

    <id>.env                         record
    <id>.docker-compose.yml[.bak|.bak2]
    <id>.service
    <id>-fullgitrepo/                private clone when a sub-path is selected
*/

inline constexpr char kRecordSuffix[] = ".env";

inline void ValidateProjectId(const std::string& id) {
  if (!model::IsValidProjectId(id)) {
    throw util::ValidationError("Project name '" + id +
                                "' must start with a lowercase letter or underscore and contain only lowercase letters, numbers, and "
                                "underscores.");
  }
}

inline std::filesystem::path RecordPath(const std::filesystem::path& root, const std::string& id) {
  ValidateProjectId(id);
  return root / (id + kRecordSuffix);
}

inline std::filesystem::path ComposeArtifactPath(const std::filesystem::path& root, const std::string& id) {
  return root / (id + ".docker-compose.yml");
}

inline std::filesystem::path ServiceArtifactPath(const std::filesystem::path& root, const std::string& id) {
  return root / (id + ".service");
}

inline std::filesystem::path BackupPath(const std::filesystem::path& artifact, int generation) {
  return artifact.string() + (generation <= 1 ? ".bak" : ".bak2");
}

inline std::filesystem::path FullCloneDir(const std::filesystem::path& root, const std::string& id) {
  return root / (id + "-fullgitrepo");
}

} // namespace projmgr::store
