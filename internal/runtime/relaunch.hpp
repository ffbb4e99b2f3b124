#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace projmgr::runtime {

inline constexpr std::string_view kRecursionGuardFlag = "--internal-recursive";

/*
  How this process was started. Captured first thing in main so a relaunch
  uses the same executable path and arguments even after self-update.
*/
struct LaunchInfo {
  std::filesystem::path    executable;
  std::vector<std::string> args;  // without argv[0]
};

LaunchInfo CaptureLaunch(int argc, char** argv);

// Arguments of the replacement process: the originals plus the recursion guard, once.
std::vector<std::string> RelaunchArguments(const LaunchInfo& launch);

/*
  Replaces the current process image with a fresh copy of the executable.

  Call only after all work is done and logging is shut down. Returns only when
  the exec failed, with the exit code to use.
*/
int Relaunch(const LaunchInfo& launch);

} // namespace projmgr::runtime
