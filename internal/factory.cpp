#include "factory.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/backend/backend_factory.hpp"
#include "internal/backend/script_runner.hpp"
#include "internal/git/credential_store.hpp"
#include "internal/git/git_engine.hpp"
#include "internal/git/working_copy.hpp"
#include "internal/store/project_store.hpp"
#include "internal/util/time.hpp"

namespace projmgr::factory {

using namespace projmgr;

Environment DefaultEnvironment(std::string version) {
  Environment env;
  env.runner   = std::make_shared<process::PosixCommandRunner>();
  env.prompter = std::make_shared<ui::ConsolePrompter>(std::cin, std::cout);
  env.sleeper  = [](std::chrono::milliseconds duration) { util::SleepFor(duration); };
  env.out      = &std::cout;
  env.version  = std::move(version);
  return env;
}

Application Build(const projmgr::runtime::config::ManagerConfig& config, const Environment& env) {
  if (!env.runner || !env.prompter || !env.sleeper || env.out == nullptr) {
    throw std::invalid_argument("factory: incomplete environment");
  }

  Application app;
  app.store = std::make_shared<store::ProjectStore>(config.projects_dir());

  auto git_engine = std::make_shared<git::GitEngine>(env.runner);

  auto global_credential = std::make_shared<git::GlobalCredentialStore>(config.credentials().global_credential_file(), env.prompter);
  auto credentials       = std::make_shared<git::CredentialResolver>(
      global_credential,
      std::vector<std::string>(config.credentials().trusted_hosts().begin(), config.credentials().trusted_hosts().end()));

  core::RetryPolicy policy;
  policy.max_attempts = config.status_check().max_attempts();
  policy.interval     = std::chrono::milliseconds(config.status_check().interval_ms());

  core::LifecycleOrchestrator::Dependencies deps;
  deps.store        = app.store;
  deps.backends     = backend::BackendFactory::Build(config, env.runner, env.prompter);
  deps.scripts      = std::make_shared<backend::ScriptRunner>(env.runner, env.prompter);
  deps.git          = git_engine;
  deps.credentials  = credentials;
  deps.working_copy = std::make_shared<git::WorkingCopy>(git_engine, credentials);
  deps.poller       = std::make_shared<core::StatusPoller>(policy, env.sleeper);
  deps.prompter     = env.prompter;

  app.orchestrator = std::make_shared<core::LifecycleOrchestrator>(std::move(deps), *env.out);
  app.batch        = std::make_shared<core::BatchRunner>(app.store, env.prompter, *env.out);
  app.self_updater = std::make_shared<core::SelfUpdater>(
      git_engine, env.runner, config.self_update().install_dir(), config.self_update().repo_url(),
      std::vector<std::string>(config.self_update().build_command().begin(), config.self_update().build_command().end()), env.version);

  return app;
}

} // namespace projmgr::factory
