#pragma once

#include <string>

#include "internal/model/op_result.hpp"
#include "internal/model/project_context.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::backend {

/*
  Runs project-supplied scripts (setup.sh, start.sh, update.sh, ...).

  Scripts get no arguments and run inside the project path; only the exit code
  counts. A script without the executable bit is fixed after confirmation or
  skipped with a warning, which still counts as success.
*/
class ScriptRunner {
 public:
  ScriptRunner(process::CommandRunnerPtr runner, ui::PrompterPtr prompter);

  bool Has(const model::ProjectContext& ctx, const std::string& script) const;

  model::OpResult Run(const model::ProjectContext& ctx, const std::string& script);

 private:
  bool EnsureExecutable(const model::ProjectContext& ctx, const std::filesystem::path& file);

  process::CommandRunnerPtr runner_;
  ui::PrompterPtr           prompter_;
};

} // namespace projmgr::backend
