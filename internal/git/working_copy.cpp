#include "working_copy.hpp"

#include "internal/observability/logging.hpp"
#include "internal/store/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::git {

namespace fs = std::filesystem;

using model::OpResult;
using model::ProjectContext;
using observability::StringField;

WorkingCopy::WorkingCopy(std::shared_ptr<GitEngine> git, std::shared_ptr<CredentialResolver> credentials)
    : git_(std::move(git)), credentials_(std::move(credentials)) {
}

fs::path WorkingCopy::GitPath(const model::ProjectRecord& record, const fs::path& managed_dir) {
  if (record.sub_path && !record.sub_path->empty()) {
    return store::FullCloneDir(managed_dir, record.id);
  }
  return record.path;
}

OpResult WorkingCopy::MigrateToPrivateClone(const ProjectContext& ctx) {
  std::error_code ec;
  if (fs::exists(ctx.gitpath, ec) || fs::is_symlink(ctx.path(), ec) || !fs::is_directory(ctx.path(), ec) ||
      !git_->IsWorkingCopy(ctx.path())) {
    return OpResult::Ok();
  }
  if (ctx.record.enabled) {
    return OpResult::Fatal("Found existing git repository at " + ctx.path().string() + ", cannot move to " + ctx.gitpath.string() +
                           " while project is enabled, please disable it first.");
  }
  PROJMGR_LOG_INFO("Moving existing git repository", {StringField("from", ctx.path().string()), StringField("to", ctx.gitpath.string())});
  fs::create_directories(ctx.gitpath.parent_path());
  fs::rename(ctx.path(), ctx.gitpath, ec);
  if (ec) {
    return OpResult::Fatal("Failed to move git repository: " + ec.message());
  }
  return OpResult::Ok();
}

OpResult WorkingCopy::LinkSubPath(const ProjectContext& ctx) {
  const auto target = ctx.gitpath / *ctx.record.sub_path;
  const auto alias  = ctx.path();

  std::error_code ec;
  if (!fs::is_directory(target, ec)) {
    return OpResult::Fatal("Specified subdirectory " + *ctx.record.sub_path + " not found in repository at " + ctx.gitpath.string() + ".");
  }

  if (fs::is_symlink(alias, ec)) {
    const auto current  = fs::weakly_canonical(alias, ec);
    const auto expected = fs::weakly_canonical(target, ec);
    if (current == expected) {
      return OpResult::Ok();
    }
    PROJMGR_LOG_INFO("Fixing symlink", {StringField("link", alias.string()), StringField("target", target.string())});
    fs::remove(alias, ec);
  } else if (fs::exists(alias, ec)) {
    // An empty directory is what removing a sub-path project leaves behind.
    if (!fs::is_directory(alias, ec) || !fs::is_empty(alias, ec)) {
      return OpResult::Fatal("Path " + alias.string() + " exists but is not a symlink, cannot link to specified repo subdir.");
    }
    fs::remove(alias, ec);
  } else {
    PROJMGR_LOG_INFO("Creating symlink", {StringField("link", alias.string()), StringField("target", target.string())});
  }

  if (alias.has_parent_path()) {
    fs::create_directories(alias.parent_path());
  }
  fs::create_directory_symlink(target, alias, ec);
  if (ec) {
    return OpResult::Fatal("Failed to link " + alias.string() + " to " + target.string() + ": " + ec.message());
  }
  return OpResult::Ok();
}

OpResult WorkingCopy::Prepare(const ProjectContext& ctx) {
  const bool has_sub_path = ctx.record.sub_path && !ctx.record.sub_path->empty();

  if (ctx.record.repo_url.empty()) {
    std::error_code ec;
    if (has_sub_path || !fs::is_directory(ctx.path(), ec)) {
      return OpResult::Fatal("No repository configured and " + ctx.path().string() + " does not exist.");
    }
    return OpResult::Ok();
  }

  if (has_sub_path) {
    auto migrated = MigrateToPrivateClone(ctx);
    if (!migrated) {
      return migrated;
    }
  }

  std::error_code ec;
  const bool      needs_clone = !fs::exists(ctx.gitpath, ec) || (fs::is_directory(ctx.gitpath, ec) && fs::is_empty(ctx.gitpath, ec));
  if (!needs_clone) {
    if (!git_->IsWorkingCopy(ctx.gitpath)) {
      return OpResult::Fatal("Directory " + ctx.gitpath.string() + " exists but is not a git repository.");
    }
  } else {
    // Credentials are only needed, and only prompted for, when cloning.
    std::optional<GitUrl> url;
    try {
      url = credentials_->Resolve(ctx.record, ctx.options);
    } catch (const util::UntrustedHost& e) {
      return OpResult::Fatal(std::string("Could not get repository URL: ") + e.what());
    } catch (const util::InvalidState& e) {
      return OpResult::Fatal(std::string("Could not get repository URL: ") + e.what());
    } catch (const util::ValidationError& e) {
      return OpResult::Fatal(std::string("Could not get repository URL: ") + e.what());
    }

    auto cloned = git_->CloneOrVerify(ctx.gitpath, *url);
    if (!cloned) {
      return cloned;
    }
  }

  if (has_sub_path) {
    return LinkSubPath(ctx);
  }
  return OpResult::Ok();
}

} // namespace projmgr::git
