#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>

#include "internal/git/git_url.hpp"
#include "internal/model/op_result.hpp"
#include "internal/process/command_runner.hpp"

namespace projmgr::git {

enum class UpstreamStatus {
  kUpToDate,
  kBehind,
  kNoUpstream,
  kError,
};

struct UpstreamComparison {
  UpstreamStatus status = UpstreamStatus::kError;
  // Only known when the upstream commit is already present locally.
  std::optional<std::uint32_t> behind;
  std::string                  detail;
};

enum class PullStatus {
  kUpToDate,
  kUpdated,
  kFailed,
};

struct PullResult {
  PullStatus    status = PullStatus::kFailed;
  std::string   old_hash;
  std::string   new_hash;
  std::uint32_t behind = 0;
  std::string   detail;  // failure reason and captured git output
};

/*
  The git operations the manager needs, on top of CommandRunner.

  Every command runs as `git -C <gitpath> ...`; nothing here changes the
  process working directory.
*/
class GitEngine {
 public:
  explicit GitEngine(process::CommandRunnerPtr runner);

  bool IsWorkingCopy(const std::filesystem::path& path);

  // Clones into an absent or empty directory; otherwise requires a working copy.
  model::OpResult CloneOrVerify(const std::filesystem::path& gitpath, const GitUrl& url);

  // Asks the remote for the tracked branch head without fetching or merging.
  UpstreamComparison CompareUpstream(const std::filesystem::path& gitpath);

  /*
    fetch, count commits behind the tracking branch, pull when behind.
    `url` overrides the remote URL (credentials); nullopt pulls from the
    configured upstream.
  */
  PullResult Pull(const std::filesystem::path& gitpath, const std::optional<GitUrl>& url);

 private:
  process::CommandResult Git(const std::filesystem::path& gitpath, std::initializer_list<std::string> args);

  process::CommandRunnerPtr runner_;
};

} // namespace projmgr::git
