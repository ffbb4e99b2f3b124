#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/backend/script_backend.hpp"
#include "internal/core/update_command.hpp"
#include "support/fakes.hpp"

namespace {

namespace fs = std::filesystem;

using projmgr::backend::ScriptBackend;
using projmgr::backend::ScriptRunner;
using projmgr::core::BatchRunner;
using projmgr::core::LifecycleOrchestrator;
using projmgr::core::RetryPolicy;
using projmgr::core::RunUpdate;
using projmgr::core::SelfUpdater;
using projmgr::core::StatusPoller;
using projmgr::git::CredentialResolver;
using projmgr::git::GitEngine;
using projmgr::git::GlobalCredentialStore;
using projmgr::git::WorkingCopy;
using projmgr::model::ProjectRecord;
using projmgr::model::ProjectType;
using projmgr::model::RunOptions;
using projmgr::store::ProjectStore;
using projmgr::testing::FakeCommandRunner;
using projmgr::testing::MakeExecutable;
using projmgr::testing::ScriptedPrompter;
using projmgr::testing::TempDir;
using projmgr::testing::WriteFile;

// Two scripts projects with an update.sh each; the manager checkout has its own runner.
struct Fixture {
  explicit Fixture(const std::string& name) : dir(name) {
    projects = std::make_shared<FakeCommandRunner>();
    manager  = std::make_shared<FakeCommandRunner>();
    prompter = std::make_shared<ScriptedPrompter>();
    store    = std::make_shared<ProjectStore>(dir / "managed");
    fs::create_directories(dir / "managed");
    fs::create_directories(dir / "install");

    auto git         = std::make_shared<GitEngine>(projects);
    auto credentials = std::make_shared<CredentialResolver>(std::make_shared<GlobalCredentialStore>(dir / "global-pat.txt", prompter),
                                                            std::vector<std::string>{"github.com"});
    auto scripts     = std::make_shared<ScriptRunner>(projects, prompter);

    LifecycleOrchestrator::Dependencies deps;
    deps.store        = store;
    deps.backends     = {{ProjectType::kScripts, std::make_shared<ScriptBackend>(scripts)}};
    deps.scripts      = scripts;
    deps.git          = git;
    deps.credentials  = credentials;
    deps.working_copy = std::make_shared<WorkingCopy>(git, credentials);
    deps.poller       = std::make_shared<StatusPoller>(RetryPolicy{0, std::chrono::milliseconds(0)}, [](std::chrono::milliseconds) {});
    deps.prompter     = prompter;

    orchestrator = std::make_unique<LifecycleOrchestrator>(std::move(deps), out);
    batch        = std::make_unique<BatchRunner>(store, prompter, out);
    self_updater = std::make_unique<SelfUpdater>(std::make_shared<GitEngine>(manager), manager, dir / "install",
                                                 "https://github.com/acme/projmgr.git", std::vector<std::string>{}, "1.0.0");

    for (const std::string id : {"api", "web"}) {
      ProjectRecord record;
      record.id       = id;
      record.type     = ProjectType::kScripts;
      record.type_tag = "scripts";
      record.path     = dir / ("work/" + id);
      WriteFile(record.path / "update.sh", "#!/bin/sh\nexit 0\n");
      MakeExecutable(record.path / "update.sh");
      store->Create(record);
    }
  }

  // The manager checkout is two commits behind its upstream.
  void ManagerBehind() {
    manager->On("rev-parse --abbrev-ref HEAD", 0, "main\n");
    manager->On("--symbolic-full-name @{u}", 0, "origin/main\n");
    manager->On("rev-list --count main..origin/main", 0, "2\n");
    manager->On("rev-parse --short HEAD", 0, "abc1234\n");
    manager->On("rev-parse --short HEAD", 0, "def5678\n");
  }

  TempDir                                dir;
  std::shared_ptr<FakeCommandRunner>     projects;
  std::shared_ptr<FakeCommandRunner>     manager;
  std::shared_ptr<ScriptedPrompter>      prompter;
  std::shared_ptr<ProjectStore>          store;
  std::ostringstream                     out;
  std::unique_ptr<LifecycleOrchestrator> orchestrator;
  std::unique_ptr<BatchRunner>           batch;
  std::unique_ptr<SelfUpdater>           self_updater;
};

void TestDeclinedUpdateOfAllProjectsTouchesNothing() {
  Fixture fx("update_all_declined");
  fx.ManagerBehind();

  const auto outcome = RunUpdate(*fx.batch, *fx.orchestrator, *fx.self_updater, "", RunOptions{});
  assert(outcome.exit_code == 0);
  assert(!outcome.relaunch);
  assert(fx.prompter->questions.size() == 1);
  assert(fx.prompter->questions[0] == "Are you sure you want to update ALL 2 projects?");
  assert(fx.manager->commands.empty());
  assert(fx.projects->commands.empty());
}

void TestConfirmedUpdateOfAllProjectsUpdatesManagerFirst() {
  Fixture fx("update_all_confirmed");
  fx.ManagerBehind();
  fx.prompter->Confirms(true);

  const auto outcome = RunUpdate(*fx.batch, *fx.orchestrator, *fx.self_updater, "", RunOptions{});
  assert(outcome.exit_code == 0);
  assert(outcome.relaunch);
  assert(fx.manager->Ran("pull https://github.com/acme/projmgr.git main"));
  // Projects are updated by the relaunched image.
  assert(fx.projects->commands.empty());
}

void TestManagerAlreadyCurrentContinuesWithProjects() {
  Fixture fx("update_all_current");
  fx.manager->On("--is-inside-work-tree", 128, "fatal: not a git repository\n");

  RunOptions quiet;
  quiet.quiet        = true;
  const auto outcome = RunUpdate(*fx.batch, *fx.orchestrator, *fx.self_updater, "", quiet);
  assert(outcome.exit_code == 0);
  assert(!outcome.relaunch);
  assert(fx.prompter->questions.empty());
  assert(fx.projects->passthrough.size() == 2);
  assert(fx.projects->passthrough[0] == (fx.dir / "work/api/update.sh").string());
  assert(fx.projects->passthrough[1] == (fx.dir / "work/web/update.sh").string());
}

void TestSingleProjectNeverUpdatesManager() {
  Fixture fx("update_single");
  fx.ManagerBehind();

  const auto outcome = RunUpdate(*fx.batch, *fx.orchestrator, *fx.self_updater, "web", RunOptions{});
  assert(outcome.exit_code == 0);
  assert(!outcome.relaunch);
  assert(fx.prompter->questions.empty());
  assert(fx.manager->commands.empty());
  assert(fx.projects->passthrough.size() == 1);
}

} // namespace

int main() {
  TestDeclinedUpdateOfAllProjectsTouchesNothing();
  TestConfirmedUpdateOfAllProjectsUpdatesManagerFirst();
  TestManagerAlreadyCurrentContinuesWithProjects();
  TestSingleProjectNeverUpdatesManager();

  std::cout << "projmgr_unit_update_command: pass\n";
  return 0;
}
