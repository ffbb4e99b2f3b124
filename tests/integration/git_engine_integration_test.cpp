#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/git/git_engine.hpp"
#include "internal/process/command_runner.hpp"
#include "support/fakes.hpp"

namespace {

namespace fs = std::filesystem;

using projmgr::git::GitEngine;
using projmgr::git::GitUrl;
using projmgr::git::PullStatus;
using projmgr::git::UpstreamStatus;
using projmgr::process::Command;
using projmgr::process::PosixCommandRunner;
using projmgr::testing::TempDir;
using projmgr::testing::WriteFile;

void MustRun(PosixCommandRunner& runner, std::vector<std::string> argv) {
  const auto result = runner.Capture(Command{std::move(argv), {}});
  if (!result.Succeeded()) {
    std::cerr << result.output;
  }
  assert(result.Succeeded());
}

void Commit(PosixCommandRunner& runner, const fs::path& repo, const std::string& file, const std::string& content) {
  WriteFile(repo / file, content);
  MustRun(runner, {"git", "-C", repo.string(), "add", file});
  MustRun(runner, {"git", "-C", repo.string(), "-c", "user.name=projmgr", "-c", "user.email=projmgr@example.com", "-c", "commit.gpgsign=false",
                   "commit", "-q", "-m", "change " + file});
}

std::string Head(PosixCommandRunner& runner, const fs::path& repo) {
  const auto result = runner.Capture(Command{{"git", "-C", repo.string(), "rev-parse", "HEAD"}, {}});
  assert(result.Succeeded());
  return result.output;
}

void TestCloneAndPullAgainstLocalRemote(PosixCommandRunner& runner) {
  TempDir    dir("git_integration");
  const auto seed   = dir / "seed";
  const auto remote = dir / "remote.git";
  const auto work   = dir / "work/shop";

  MustRun(runner, {"git", "init", "-q", seed.string()});
  MustRun(runner, {"git", "-C", seed.string(), "symbolic-ref", "HEAD", "refs/heads/main"});
  Commit(runner, seed, "README.md", "shop\n");
  MustRun(runner, {"git", "clone", "-q", "--bare", seed.string(), remote.string()});

  auto      engine_runner = std::make_shared<PosixCommandRunner>();
  GitEngine git(engine_runner);

  assert(!git.IsWorkingCopy(work));
  assert(git.CloneOrVerify(work, GitUrl::Parse(remote.string())));
  assert(git.IsWorkingCopy(work));
  assert(fs::exists(work / "README.md"));

  // Existing checkout: verified, not cloned again.
  assert(git.CloneOrVerify(work, GitUrl::Parse(remote.string())));

  // Up to date: same HEAD, tracked files not rewritten.
  const auto head_before = Head(runner, work);
  const auto readme_time = fs::last_write_time(work / "README.md");

  auto pulled = git.Pull(work, std::nullopt);
  assert(pulled.status == PullStatus::kUpToDate);
  assert(pulled.behind == 0);
  assert(!pulled.old_hash.empty());
  assert(pulled.new_hash == pulled.old_hash);
  assert(Head(runner, work) == head_before);
  assert(fs::last_write_time(work / "README.md") == readme_time);
  assert(git.CompareUpstream(work).status == UpstreamStatus::kUpToDate);

  Commit(runner, seed, "CHANGELOG.md", "1.1\n");
  MustRun(runner, {"git", "-C", seed.string(), "push", "-q", remote.string(), "main"});

  assert(git.CompareUpstream(work).status == UpstreamStatus::kBehind);

  pulled = git.Pull(work, std::nullopt);
  assert(pulled.status == PullStatus::kUpdated);
  assert(pulled.behind == 1);
  assert(pulled.old_hash != pulled.new_hash);
  assert(fs::exists(work / "CHANGELOG.md"));

  assert(git.CompareUpstream(work).status == UpstreamStatus::kUpToDate);

  const auto updated_head   = Head(runner, work);
  const auto changelog_time = fs::last_write_time(work / "CHANGELOG.md");
  pulled                    = git.Pull(work, std::nullopt);
  assert(pulled.status == PullStatus::kUpToDate);
  assert(pulled.new_hash == pulled.old_hash);
  assert(Head(runner, work) == updated_head);
  assert(fs::last_write_time(work / "CHANGELOG.md") == changelog_time);
}

void TestPlainDirectoryIsNotAWorkingCopy() {
  TempDir dir("git_integration_plain");
  WriteFile(dir / "plain/README", "hello\n");

  GitEngine git(std::make_shared<PosixCommandRunner>());
  assert(!git.IsWorkingCopy(dir / "plain"));
  assert(git.CloneOrVerify(dir / "plain", GitUrl::Parse((dir / "nowhere.git").string())).IsFatal());
}

} // namespace

int main() {
  PosixCommandRunner runner;
  if (!runner.Capture(Command{{"git", "--version"}, {}}).Succeeded()) {
    std::cout << "skipping git integration suite: git not available\n";
    return 0;
  }

  TestCloneAndPullAgainstLocalRemote(runner);
  TestPlainDirectoryIsNotAWorkingCopy();

  std::cout << "projmgr_integration_git_engine: pass\n";
  return 0;
}
