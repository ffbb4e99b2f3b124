#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/project_record.hpp"
#include "internal/store/project_selector.hpp"

namespace projmgr::store {

class EnvFile;

/*
  Directory-backed project records, one <id>.env file per project.

  The store is the only owner of ProjectRecord files. Saving rewrites the known
  keys in place and keeps everything else in the file untouched.
*/
class ProjectStore {
 public:
  explicit ProjectStore(std::filesystem::path root);

  const std::filesystem::path& root() const {
    return root_;
  }

  bool Exists(const std::string& id) const;

  std::optional<model::ProjectRecord> Find(const std::string& id) const;

  // Throws util::NotFound.
  model::ProjectRecord Load(const std::string& id) const;

  // Throws util::NotFound when the record does not exist yet.
  void Save(const model::ProjectRecord& record);

  void SetEnabled(const std::string& id, bool enabled);

  // Sorted by id.
  std::vector<std::string> List(const ProjectSelector& selector) const;

  // Always persists enabled=false. Throws util::ValidationError / util::AlreadyExists.
  model::ProjectRecord Create(model::ProjectRecord record);

  // Throws util::InvalidState while enabled. Removes the record, artifacts and backups.
  void Delete(const std::string& id);

 private:
  static model::ProjectRecord FromEnv(const std::string& id, const EnvFile& env);
  static void                 ToEnv(const model::ProjectRecord& record, EnvFile* env);

  std::filesystem::path root_;
};

} // namespace projmgr::store
