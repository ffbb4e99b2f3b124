#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/update_command.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/cli_args.hpp"
#include "internal/runtime/relaunch.hpp"
#include "internal/util/errors.hpp"

#ifndef PROJMGR_VERSION
#define PROJMGR_VERSION "0.0.0"
#endif

using projmgr::core::BatchRunner;
using projmgr::core::Report;
using projmgr::model::OpResult;
using projmgr::model::RunOptions;
using projmgr::observability::StringField;

namespace {

struct RunOutcome {
  int  exit_code = 0;
  bool relaunch  = false;
};

// Resolves, confirms and runs one per-project command over its targets.
int RunBatch(const projmgr::factory::Application& app, const projmgr::runtime::CliArguments& args, const std::string& verb,
             const std::string& heading, const BatchRunner::Action& action) {
  const auto selection = app.batch->Resolve(args.project, true);
  if (!app.batch->Confirm(selection, verb, args.options)) {
    PROJMGR_LOG_INFO("Cancelled.");
    return 0;
  }
  return app.batch->Run(selection, heading, action).Ok() ? 0 : 1;
}

RunOutcome Dispatch(const projmgr::factory::Application& app, const projmgr::runtime::CliArguments& args,
                    const std::filesystem::path& invocation_dir) {
  const auto&       cmd     = args.command;
  const RunOptions& options = args.options;
  auto&             orch    = *app.orchestrator;

  if (cmd == "add") {
    const auto result = orch.Add(args.project, options, invocation_dir);
    Report(result);
    return {result ? 0 : 1, false};
  }

  if (cmd == "remove") {
    if (args.project.empty()) {
      throw projmgr::util::ValidationError("Please specify a project name!");
    }
    const auto result = orch.Remove(args.project, options);
    Report(result);
    return {result ? 0 : 1, false};
  }

  if (cmd == "list") {
    return {RunBatch(app, args, "", "", [&](const std::string& id, bool) { return orch.List(id, options); }), false};
  }
  if (cmd == "enable") {
    return {RunBatch(app, args, "enable", "ENABLE", [&](const std::string& id, bool) { return orch.Enable(id, options); }), false};
  }
  if (cmd == "disable") {
    return {RunBatch(app, args, "disable", "DISABLE", [&](const std::string& id, bool) { return orch.Disable(id, options); }), false};
  }
  if (cmd == "start") {
    return {RunBatch(app, args, "start", "START", [&](const std::string& id, bool) { return orch.Start(id, options); }), false};
  }
  if (cmd == "stop") {
    return {RunBatch(app, args, "stop", "STOP", [&](const std::string& id, bool) { return orch.Stop(id, options); }), false};
  }
  if (cmd == "restart") {
    return {RunBatch(app, args, "restart", "RESTART", [&](const std::string& id, bool) { return orch.Restart(id, options); }), false};
  }
  if (cmd == "status") {
    return {RunBatch(app, args, "", "STATUS", [&](const std::string& id, bool single) { return orch.Status(id, options, single); }), false};
  }
  if (cmd == "logs") {
    return {RunBatch(app, args, "", "LOGS", [&](const std::string& id, bool single) { return orch.Logs(id, options, single); }), false};
  }

  if (cmd == "shell") {
    const auto selection = app.batch->Resolve(args.project, false);
    const auto result    = orch.Shell(selection.ids.front(), options);
    Report(result);
    return {result ? 0 : 1, false};
  }

  if (cmd == "self-update") {
    const auto outcome = app.self_updater->Run(options);
    if (outcome.RestartRequested()) {
      PROJMGR_LOG_INFO(outcome.message);
      return {0, true};
    }
    if (outcome.Failed()) {
      PROJMGR_LOG_ERROR(outcome.message);
      return {1, false};
    }
    PROJMGR_LOG_INFO(outcome.message);
    return {0, false};
  }

  if (cmd == "update") {
    const auto outcome = projmgr::core::RunUpdate(*app.batch, orch, *app.self_updater, args.project, options);
    return {outcome.exit_code, outcome.relaunch};
  }

  std::cerr << "Unknown command: '" << cmd << "'!\n\n" << projmgr::runtime::UsageText();
  return {1, false};
}

} // namespace

int main(int argc, char** argv) {
  // Before anything can change the working directory or the binary on disk.
  const auto launch         = projmgr::runtime::CaptureLaunch(argc, argv);
  const auto invocation_dir = std::filesystem::current_path();

  projmgr::runtime::CliArguments args;
  try {
    args = projmgr::runtime::ParseArguments(launch.args);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n\n" << projmgr::runtime::UsageText();
    return 1;
  }

  if (args.command.empty()) {
    std::cout << "Welcome to projmgr " << PROJMGR_VERSION << "!\n\n" << projmgr::runtime::UsageText();
    return 1;
  }
  if (args.command == "help") {
    std::cout << projmgr::runtime::HelpText(PROJMGR_VERSION);
    return 0;
  }

  RunOutcome outcome;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    const auto install_dir = launch.executable.parent_path();
    std::filesystem::path config_path = install_dir / "projmgr.yaml";
    if (!args.config_path.empty()) {
      config_path = args.config_path;
      if (!std::filesystem::exists(config_path)) {
        throw projmgr::util::NotFound("Config file not found: " + config_path.string());
      }
    }
    auto config = projmgr::config::ConfigLoader::Load(config_path, install_dir);

    projmgr::observability::InitializeLogging(config);

    if (!args.lines_given) {
      args.options.logs.lines = config.logs().default_lines();
    }

    // ------------------------------------------------------------
    // Build application (dependency graph) and run the command
    // ------------------------------------------------------------
    {
      auto app = projmgr::factory::Build(config, projmgr::factory::DefaultEnvironment(PROJMGR_VERSION));
      outcome  = Dispatch(app, args, invocation_dir);
    }
  } catch (const std::exception& e) {
    PROJMGR_LOG_ERROR(e.what());
    if (const auto* tool = dynamic_cast<const projmgr::util::ExternalToolError*>(&e); tool != nullptr && !tool->output().empty()) {
      std::cerr << tool->output() << '\n';
    }
    projmgr::observability::ShutdownLogging();
    return 1;
  }

  projmgr::observability::ShutdownLogging();

  // ------------------------------------------------------------
  // Continue in the updated image
  // ------------------------------------------------------------
  if (outcome.relaunch) {
    std::cout.flush();
    return projmgr::runtime::Relaunch(launch);
  }
  return outcome.exit_code;
}
