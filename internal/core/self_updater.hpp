#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/git/git_engine.hpp"
#include "internal/model/project_context.hpp"
#include "internal/process/command_runner.hpp"

namespace projmgr::core {

enum class SelfUpdateStatus {
  kUpToDate,
  kSkipped,           // install dir is not a working copy
  kRestartRequested,  // new code on disk, the running image is stale
  kFailed,            // pull or rebuild failed; nothing is relaunched
};

struct SelfUpdateOutcome {
  SelfUpdateStatus status = SelfUpdateStatus::kFailed;
  std::string      message;

  bool RestartRequested() const {
    return status == SelfUpdateStatus::kRestartRequested;
  }

  bool Failed() const {
    return status == SelfUpdateStatus::kFailed;
  }
};

/*
  Updates the manager's own checkout with the project git engine and, when a
  build command is configured, rebuilds the executable in place.

  Never relaunches anything itself: a hash change is reported as
  kRestartRequested and the process boundary (main) does the rest once every
  resource is released. Under the recursion guard it reports success and
  touches nothing.
*/
class SelfUpdater {
 public:
  SelfUpdater(std::shared_ptr<git::GitEngine> git, process::CommandRunnerPtr runner, std::filesystem::path install_dir, std::string repo_url,
              std::vector<std::string> build_command, std::string version);

  SelfUpdateOutcome Run(const model::RunOptions& options);

 private:
  std::shared_ptr<git::GitEngine> git_;
  process::CommandRunnerPtr       runner_;
  std::filesystem::path           install_dir_;
  std::string                     repo_url_;
  std::vector<std::string>        build_command_;
  std::string                     version_;
};

} // namespace projmgr::core
