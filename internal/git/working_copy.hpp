#pragma once

#include <filesystem>
#include <memory>

#include "internal/git/credential_store.hpp"
#include "internal/git/git_engine.hpp"
#include "internal/model/op_result.hpp"
#include "internal/model/project_context.hpp"

namespace projmgr::git {

/*
  Makes a project's source tree available at its path.

  Without a sub-path the checkout lives at the project path itself. With one,
  a private full clone lives in the managed directory and the project path is a
  symlink into <clone>/<sub_path>.
*/
class WorkingCopy {
 public:
  WorkingCopy(std::shared_ptr<GitEngine> git, std::shared_ptr<CredentialResolver> credentials);

  // <managed>/<id>-fullgitrepo with a sub-path, the project path otherwise.
  static std::filesystem::path GitPath(const model::ProjectRecord& record, const std::filesystem::path& managed_dir);

  model::OpResult Prepare(const model::ProjectContext& ctx);

 private:
  model::OpResult MigrateToPrivateClone(const model::ProjectContext& ctx);
  model::OpResult LinkSubPath(const model::ProjectContext& ctx);

  std::shared_ptr<GitEngine>          git_;
  std::shared_ptr<CredentialResolver> credentials_;
};

} // namespace projmgr::git
