#include "self_updater.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::core {

using observability::StringField;

SelfUpdater::SelfUpdater(std::shared_ptr<git::GitEngine> git, process::CommandRunnerPtr runner, std::filesystem::path install_dir,
                         std::string repo_url, std::vector<std::string> build_command, std::string version)
    : git_(std::move(git)),
      runner_(std::move(runner)),
      install_dir_(std::move(install_dir)),
      repo_url_(std::move(repo_url)),
      build_command_(std::move(build_command)),
      version_(std::move(version)) {
}

SelfUpdateOutcome SelfUpdater::Run(const model::RunOptions& options) {
  if (options.internal_recursive) {
    return {SelfUpdateStatus::kUpToDate, "Successfully updated projmgr to " + version_ + "."};
  }

  if (!git_->IsWorkingCopy(install_dir_)) {
    PROJMGR_LOG_WARN("Install directory is not a git repository, skipping self-update.", {StringField("path", install_dir_.string())});
    return {SelfUpdateStatus::kSkipped, {}};
  }

  std::optional<git::GitUrl> url;
  if (!repo_url_.empty()) {
    try {
      url = git::GitUrl::Parse(repo_url_);
    } catch (const util::ValidationError& e) {
      return {SelfUpdateStatus::kFailed, std::string("Failed to update projmgr: ") + e.what()};
    }
  }

  PROJMGR_LOG_INFO("Fetching updates ...", {StringField("path", install_dir_.string())});
  const auto pulled = git_->Pull(install_dir_, url);
  switch (pulled.status) {
    case git::PullStatus::kUpToDate:
      return {SelfUpdateStatus::kUpToDate, "projmgr is already up to date (" + version_ + ")!"};
    case git::PullStatus::kUpdated:
      break;
    case git::PullStatus::kFailed:
      return {SelfUpdateStatus::kFailed, "Failed to update projmgr: " + pulled.detail};
  }

  if (!build_command_.empty()) {
    const process::Command build{build_command_, install_dir_};
    PROJMGR_LOG_INFO("Rebuilding projmgr ...", {StringField("command", build.ToString())});
    const int exit_code = runner_->Passthrough(build);
    if (exit_code != 0) {
      return {SelfUpdateStatus::kFailed,
              "Pulled " + pulled.new_hash + " but rebuilding projmgr failed with exit code " + std::to_string(exit_code) + ", not restarting."};
    }
  }
  return {SelfUpdateStatus::kRestartRequested, "Self-update complete from " + pulled.old_hash + " to " + pulled.new_hash + "."};
}

} // namespace projmgr::core
