#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/runtime/cli_args.hpp"
#include "internal/runtime/relaunch.hpp"
#include "internal/util/errors.hpp"

namespace {

using projmgr::runtime::CliArguments;
using projmgr::runtime::LaunchInfo;
using projmgr::runtime::ParseArguments;
using projmgr::runtime::RelaunchArguments;

bool Rejected(const std::vector<std::string>& args, const std::string& expected) {
  try {
    (void)ParseArguments(args);
  } catch (const projmgr::util::ValidationError& e) {
    return std::string(e.what()).find(expected) != std::string::npos;
  }
  return false;
}

void TestDefaults() {
  const auto parsed = ParseArguments({});
  assert(parsed.command.empty());
  assert(parsed.project.empty());
  assert(parsed.config_path.empty());
  assert(!parsed.options.quiet);
  assert(!parsed.options.force);
  assert(parsed.options.status_check);
  assert(!parsed.options.internal_recursive);
  assert(parsed.options.logs.follow);
  assert(!parsed.lines_given);
}

void TestFlagsAndPositionals() {
  const auto parsed = ParseArguments({"-q", "stop", "--force", "shop+", "-s", "--config", "/etc/projmgr.yaml"});
  assert(parsed.command == "stop");
  assert(parsed.project == "shop+");
  assert(parsed.options.quiet);
  assert(parsed.options.force);
  assert(!parsed.options.status_check);
  assert(parsed.config_path == "/etc/projmgr.yaml");

  const auto recursive = ParseArguments({"update", "--internal-recursive"});
  assert(recursive.command == "update");
  assert(recursive.project.empty());
  assert(recursive.options.internal_recursive);
}

void TestLineCount() {
  auto parsed = ParseArguments({"logs", "shop", "-n", "25"});
  assert(!parsed.options.logs.follow);
  assert(parsed.options.logs.lines == 25);
  assert(parsed.lines_given);

  parsed = ParseArguments({"logs", "--number-of-lines", "follow"});
  assert(parsed.options.logs.follow);
  assert(!parsed.lines_given);

  parsed = ParseArguments({"logs", "-n", "f"});
  assert(parsed.options.logs.follow);

  assert(Rejected({"logs", "-n", "ten"}, "Line count must be a number"));
  assert(Rejected({"logs", "-n", "-5"}, "Line count must be a number"));
  assert(Rejected({"logs", "-n", "12x"}, "Line count must be a number"));
  assert(Rejected({"logs", "-n"}, "Line count must be a number"));
}

void TestRejections() {
  assert(Rejected({"start", "-x"}, "Unknown option: '-x'!"));
  assert(Rejected({"start", "--verbose"}, "Unknown option: '--verbose'!"));
  assert(Rejected({"start", "shop", "web"}, "Too many arguments: web"));
  assert(Rejected({"start", "--config"}, "--config"));
}

void TestRelaunchAddsGuardOnce() {
  LaunchInfo launch;
  launch.executable = "/opt/projmgr/projmgr";
  launch.args       = {"update", "-q"};

  const auto args = RelaunchArguments(launch);
  assert((args == std::vector<std::string>{"/opt/projmgr/projmgr", "update", "-q", "--internal-recursive"}));

  launch.args.push_back("--internal-recursive");
  const auto again = RelaunchArguments(launch);
  assert((again == std::vector<std::string>{"/opt/projmgr/projmgr", "update", "-q", "--internal-recursive"}));

  // The relaunched arguments parse back to the guarded invocation.
  const CliArguments parsed = ParseArguments(std::vector<std::string>(again.begin() + 1, again.end()));
  assert(parsed.command == "update");
  assert(parsed.options.quiet);
  assert(parsed.options.internal_recursive);
}

} // namespace

int main() {
  TestDefaults();
  TestFlagsAndPositionals();
  TestLineCount();
  TestRejections();
  TestRelaunchAddsGuardOnce();

  std::cout << "projmgr_unit_cli_args: pass\n";
  return 0;
}
