#include "script_runner.hpp"

#include <unistd.h>

#include "internal/observability/logging.hpp"

namespace projmgr::backend {

using observability::IntField;
using observability::StringField;

ScriptRunner::ScriptRunner(process::CommandRunnerPtr runner, ui::PrompterPtr prompter)
    : runner_(std::move(runner)), prompter_(std::move(prompter)) {
}

bool ScriptRunner::Has(const model::ProjectContext& ctx, const std::string& script) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(ctx.path() / script, ec);
}

bool ScriptRunner::EnsureExecutable(const model::ProjectContext& ctx, const std::filesystem::path& file) {
  if (access(file.c_str(), X_OK) == 0) {
    return true;
  }
  if (!ctx.options.Interactive() || !prompter_->Confirm("File '" + file.string() + "' is not executable. Make it executable?")) {
    return false;
  }
  std::filesystem::permissions(file,
                               std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::add);
  return true;
}

model::OpResult ScriptRunner::Run(const model::ProjectContext& ctx, const std::string& script) {
  const auto file = ctx.path() / script;
  if (!Has(ctx, script)) {
    return model::OpResult::Fatal("No " + script + " script found in " + ctx.path().string() + ".");
  }
  if (!EnsureExecutable(ctx, file)) {
    PROJMGR_LOG_WARN("Script is not executable, skipping.", {StringField("script", file.string())});
    return model::OpResult::Ok();
  }

  PROJMGR_LOG_INFO("Running script", {StringField("script", file.string())});
  const int exit_code = runner_->Passthrough(process::Command{{file.string()}, ctx.path()});
  if (exit_code != 0) {
    PROJMGR_LOG_ERROR("Script failed", {StringField("script", script), IntField("exit_code", exit_code)});
    return model::OpResult::Fatal("Script " + script + " failed with exit code " + std::to_string(exit_code));
  }
  return model::OpResult::Ok();
}

} // namespace projmgr::backend
