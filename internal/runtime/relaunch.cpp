#include "relaunch.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace projmgr::runtime {

namespace fs = std::filesystem;

LaunchInfo CaptureLaunch(int argc, char** argv) {
  LaunchInfo      launch;
  std::error_code ec;
  launch.executable = fs::canonical("/proc/self/exe", ec);
  if (ec && argc > 0) {
    launch.executable = fs::weakly_canonical(argv[0], ec);
  }
  for (int i = 1; i < argc; ++i) {
    launch.args.emplace_back(argv[i]);
  }
  return launch;
}

std::vector<std::string> RelaunchArguments(const LaunchInfo& launch) {
  std::vector<std::string> args;
  args.push_back(launch.executable.string());
  args.insert(args.end(), launch.args.begin(), launch.args.end());
  if (std::find(launch.args.begin(), launch.args.end(), kRecursionGuardFlag) == launch.args.end()) {
    args.emplace_back(kRecursionGuardFlag);
  }
  return args;
}

int Relaunch(const LaunchInfo& launch) {
  std::error_code ec;
  fs::permissions(launch.executable, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec, fs::perm_options::add, ec);

  auto               args = RelaunchArguments(launch);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::cout.flush();
  execv(launch.executable.c_str(), argv.data());

  // Logging is already shut down at this point.
  std::cerr << "Failed to restart " << launch.executable.string() << ": " << std::strerror(errno) << '\n';
  return 1;
}

} // namespace projmgr::runtime
