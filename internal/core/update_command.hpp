#pragma once

#include <string>

#include "internal/core/batch_runner.hpp"
#include "internal/core/lifecycle_orchestrator.hpp"
#include "internal/core/self_updater.hpp"
#include "internal/model/project_context.hpp"

namespace projmgr::core {

struct UpdateOutcome {
  int  exit_code = 0;
  bool relaunch  = false;
};

/*
  The `update` command over the selected projects.

  Selecting every project updates the manager first, after the batch has been
  confirmed. A hash change stops here with relaunch set; the new image runs
  the project updates under the recursion guard. Dangling images collected by
  the project updates are offered for removal at the end.
*/
UpdateOutcome RunUpdate(BatchRunner& batch, LifecycleOrchestrator& orchestrator, SelfUpdater& self_updater, const std::string& argument,
                        const model::RunOptions& options);

} // namespace projmgr::core
