#pragma once

#include <string>
#include <vector>

#include "internal/model/project_context.hpp"

namespace projmgr::runtime {

struct CliArguments {
  std::string command;
  std::string project;
  std::string config_path;

  model::RunOptions options;
  // -n given explicitly; otherwise the configured default applies to non-follow output.
  bool lines_given = false;
};

/*
  projmgr <command> [project] [-q] [-f] [-s] [-n N|f|follow] [--config <file>] [--internal-recursive]

  Throws util::ValidationError on unknown options, bad line counts and
  surplus positional arguments.
*/
CliArguments ParseArguments(const std::vector<std::string>& args);

std::string UsageText();
std::string HelpText(const std::string& version);

} // namespace projmgr::runtime
