#include "script_backend.hpp"

#include "internal/observability/logging.hpp"

namespace projmgr::backend {

using model::OpResult;
using model::ProjectContext;
using observability::StringField;

ScriptBackend::ScriptBackend(std::shared_ptr<ScriptRunner> scripts) : scripts_(std::move(scripts)) {
}

OpResult ScriptBackend::Install(const ProjectContext& ctx) {
  // setup.sh is run for every project type before the backend install.
  if (!scripts_->Has(ctx, "setup.sh")) {
    PROJMGR_LOG_WARN("No setup.sh script found, only setting ENABLED=true.", {StringField("path", ctx.path().string())});
  }
  return OpResult::Ok();
}

OpResult ScriptBackend::Start(const ProjectContext& ctx) {
  return scripts_->Run(ctx, "start.sh");
}

OpResult ScriptBackend::Stop(const ProjectContext& ctx) {
  return scripts_->Run(ctx, "stop.sh");
}

OpResult ScriptBackend::Restart(const ProjectContext& ctx) {
  if (scripts_->Has(ctx, "restart.sh")) {
    return scripts_->Run(ctx, "restart.sh");
  }
  if (!scripts_->Has(ctx, "stop.sh") || !scripts_->Has(ctx, "start.sh")) {
    return OpResult::Fatal("No restart.sh or start.sh + stop.sh scripts found in " + ctx.path().string() + ".");
  }
  auto stopped = scripts_->Run(ctx, "stop.sh");
  if (!stopped) {
    return stopped;
  }
  return scripts_->Run(ctx, "start.sh");
}

model::RunningState ScriptBackend::Status(const ProjectContext&) {
  return model::RunningState::kUnknown;
}

OpResult ScriptBackend::Uninstall(const ProjectContext& ctx) {
  if (!scripts_->Has(ctx, "uninstall.sh")) {
    PROJMGR_LOG_WARN("No uninstall.sh script found, only setting ENABLED=false.", {StringField("path", ctx.path().string())});
    return OpResult::Ok();
  }
  return scripts_->Run(ctx, "uninstall.sh");
}

// logs.sh gets no arguments, so follow and line count are up to the script.
OpResult ScriptBackend::Logs(const ProjectContext& ctx, const model::LogRequest&) {
  return scripts_->Run(ctx, "logs.sh");
}

OpResult ScriptBackend::ShowDetails(const ProjectContext& ctx) {
  if (!scripts_->Has(ctx, "status.sh")) {
    return OpResult::Recoverable("No status.sh script found in " + ctx.path().string() + ".");
  }
  return scripts_->Run(ctx, "status.sh");
}

} // namespace projmgr::backend
