#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/git/git_engine.hpp"
#include "support/fakes.hpp"

namespace {

using projmgr::git::GitEngine;
using projmgr::git::GitUrl;
using projmgr::git::PullStatus;
using projmgr::git::UpstreamStatus;
using projmgr::testing::FakeCommandRunner;
using projmgr::testing::TempDir;
using projmgr::testing::WriteFile;

void ScriptTrackingBranch(FakeCommandRunner& runner, const std::string& behind) {
  runner.On("fetch --quiet", 0);
  runner.On("rev-parse --abbrev-ref HEAD", 0, "main\n");
  runner.On("--symbolic-full-name @{u}", 0, "origin/main\n");
  runner.On("rev-list --count main..origin/main", 0, behind + "\n");
}

void TestUpToDateLeavesWorkingTreeAlone() {
  auto runner = std::make_shared<FakeCommandRunner>();
  ScriptTrackingBranch(*runner, "0");
  runner->On("rev-parse --short HEAD", 0, "abc1234\n");

  GitEngine  git(runner);
  const auto result = git.Pull("/srv/shop", std::nullopt);
  assert(result.status == PullStatus::kUpToDate);
  assert(result.old_hash == "abc1234");
  assert(result.new_hash == "abc1234");
  assert(result.behind == 0);
  assert(!runner->Ran(" pull"));

  // Every git call is scoped to the working copy.
  for (const auto& command : runner->commands) {
    assert(command.argv.size() >= 3);
    assert(command.argv[0] == "git" && command.argv[1] == "-C" && command.argv[2] == "/srv/shop");
  }
  assert(runner->IndexOf("fetch --quiet") == 0);
}

void TestBehindPullsWithCredentialedUrl() {
  auto runner = std::make_shared<FakeCommandRunner>();
  ScriptTrackingBranch(*runner, "3");
  runner->On("rev-parse --short HEAD", 0, "abc1234\n");
  runner->On("rev-parse --short HEAD", 0, "def5678\n");

  GitEngine  git(runner);
  const auto url    = GitUrl::WithCredential(GitUrl::Parse("https://github.com/acme/shop.git"), "tok", {"github.com"});
  const auto result = git.Pull("/srv/shop", url);
  assert(result.status == PullStatus::kUpdated);
  assert(result.old_hash == "abc1234");
  assert(result.new_hash == "def5678");
  assert(result.behind == 3);

  const auto pull = runner->IndexOf(" pull ");
  assert(pull < runner->commands.size());
  const auto& argv = runner->commands[pull].argv;
  assert(argv.size() == 6);
  assert(argv[4] == "https://tok@github.com/acme/shop.git");
  assert(argv[5] == "main");
}

void TestFetchFailureNeverPulls() {
  auto runner = std::make_shared<FakeCommandRunner>();
  runner->On("fetch --quiet", 128, "fatal: could not read from remote\n");

  GitEngine  git(runner);
  const auto result = git.Pull("/srv/shop", std::nullopt);
  assert(result.status == PullStatus::kFailed);
  assert(result.detail.find("could not read from remote") != std::string::npos);
  assert(runner->commands.size() == 1);
}

void TestPullFailureIsReported() {
  auto runner = std::make_shared<FakeCommandRunner>();
  ScriptTrackingBranch(*runner, "1");
  runner->On("rev-parse --short HEAD", 0, "abc1234\n");
  runner->On(" pull", 1, "merge conflict\n");

  GitEngine  git(runner);
  const auto result = git.Pull("/srv/shop", std::nullopt);
  assert(result.status == PullStatus::kFailed);
  assert(result.detail.find("merge conflict") != std::string::npos);
}

void TestCompareUpstream() {
  {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->On("@{u}", 0, "origin/main\n");
    runner->On("ls-remote --refs -q origin refs/heads/main", 0, "deadbeef\trefs/heads/main\n");
    runner->On("rev-parse HEAD", 0, "deadbeef\n");
    GitEngine git(runner);

    const auto comparison = git.CompareUpstream("/srv/shop");
    assert(comparison.status == UpstreamStatus::kUpToDate);
    assert(!runner->Ran("fetch"));
    assert(!runner->Ran("pull"));
  }
  {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->On("@{u}", 0, "origin/main\n");
    runner->On("ls-remote", 0, "deadbeef\trefs/heads/main\n");
    runner->On("rev-parse HEAD", 0, "cafebabe\n");
    runner->On("rev-list --count HEAD..deadbeef", 0, "2\n");
    GitEngine git(runner);

    const auto comparison = git.CompareUpstream("/srv/shop");
    assert(comparison.status == UpstreamStatus::kBehind);
    assert(comparison.behind && *comparison.behind == 2);
  }
  {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->On("@{u}", 0, "origin/main\n");
    runner->On("ls-remote", 0, "deadbeef\trefs/heads/main\n");
    runner->On("rev-parse HEAD", 0, "cafebabe\n");
    runner->On("rev-list", 128, "fatal: bad revision\n");
    GitEngine git(runner);

    const auto comparison = git.CompareUpstream("/srv/shop");
    assert(comparison.status == UpstreamStatus::kBehind);
    assert(!comparison.behind);
  }
  {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->On("@{u}", 128, "fatal: no upstream configured\n");
    GitEngine git(runner);
    assert(git.CompareUpstream("/srv/shop").status == UpstreamStatus::kNoUpstream);
  }
}

void TestCloneOrVerify() {
  TempDir dir("git_engine_clone");
  auto    runner = std::make_shared<FakeCommandRunner>();
  GitEngine git(runner);
  const auto url = GitUrl::Parse("https://github.com/acme/shop.git");

  const auto target = dir / "shop";
  assert(git.CloneOrVerify(target, url));
  assert(runner->passthrough.size() == 1);
  assert(runner->passthrough[0] == "git clone https://github.com/acme/shop.git " + target.string());

  runner->On("git clone", 128, "");
  assert(git.CloneOrVerify(dir / "other", url).IsFatal());

  // Existing content that is not a repository.
  WriteFile(dir / "plain" / "README", "hello\n");
  runner->On("--is-inside-work-tree", 128, "fatal: not a git repository\n");
  assert(git.CloneOrVerify(dir / "plain", url).IsFatal());
  assert(!git.IsWorkingCopy(dir / "plain"));
  assert(!git.IsWorkingCopy(dir / "missing"));
}

} // namespace

int main() {
  TestUpToDateLeavesWorkingTreeAlone();
  TestBehindPullsWithCredentialedUrl();
  TestFetchFailureNeverPulls();
  TestPullFailureIsReported();
  TestCompareUpstream();
  TestCloneOrVerify();

  std::cout << "projmgr_unit_git_engine: pass\n";
  return 0;
}
