#include "update_command.hpp"

#include "internal/observability/logging.hpp"

namespace projmgr::core {

UpdateOutcome RunUpdate(BatchRunner& batch, LifecycleOrchestrator& orchestrator, SelfUpdater& self_updater, const std::string& argument,
                        const model::RunOptions& options) {
  const auto    selection = batch.Resolve(argument, true);
  UpdateOutcome outcome;

  if (!batch.Confirm(selection, "update", options)) {
    PROJMGR_LOG_INFO("Cancelled.");
    return outcome;
  }

  if (selection.all) {
    const auto updated = self_updater.Run(options);
    if (updated.RestartRequested()) {
      PROJMGR_LOG_INFO(updated.message);
      outcome.relaunch = true;
      return outcome;
    }
    if (updated.Failed()) {
      PROJMGR_LOG_ERROR(updated.message);
      outcome.exit_code = 1;
    } else {
      PROJMGR_LOG_INFO(updated.message);
    }
  }

  const auto report = batch.Run(selection, "UPDATE", [&](const std::string& id, bool) { return orchestrator.Update(id, options); });
  if (!report.Ok()) {
    outcome.exit_code = 1;
  }

  const auto cleanup = orchestrator.CleanupDanglingImages(options);
  if (!cleanup) {
    Report(cleanup);
    outcome.exit_code = 1;
  }
  return outcome;
}

} // namespace projmgr::core
