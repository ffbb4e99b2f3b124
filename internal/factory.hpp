#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

#include "config/config.pb.h"
#include "internal/core/batch_runner.hpp"
#include "internal/core/lifecycle_orchestrator.hpp"
#include "internal/core/self_updater.hpp"
#include "internal/core/status_poller.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::factory {

/*
  Process-level collaborators. Production wires the POSIX runner, the console
  prompter and a real sleep; tests substitute scripted fakes.
*/
struct Environment {
  process::CommandRunnerPtr runner;
  ui::PrompterPtr           prompter;
  core::Sleeper             sleeper;
  std::ostream*             out = nullptr;
  std::string               version;
};

/*
  Application

  Everything one invocation needs. Lives until main returns or relaunches.
*/
struct Application {
  std::shared_ptr<store::ProjectStore>         store;
  std::shared_ptr<core::LifecycleOrchestrator> orchestrator;
  std::shared_ptr<core::BatchRunner>           batch;
  std::shared_ptr<core::SelfUpdater>           self_updater;
};

Environment DefaultEnvironment(std::string version);

/*
  Build

  Constructs the whole object graph from a config that already has its
  defaults applied.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete backend and runner types.
*/
Application Build(const projmgr::runtime::config::ManagerConfig& config, const Environment& env);

} // namespace projmgr::factory
