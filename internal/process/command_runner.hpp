#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace projmgr::process {

struct Command {
  std::vector<std::string> argv;
  // Empty means the caller's working directory.
  std::filesystem::path cwd;

  std::string ToString() const;
};

struct CommandResult {
  int         exit_code = -1;
  std::string output;  // stdout and stderr interleaved

  bool Succeeded() const {
    return exit_code == 0;
  }
};

/*
  Blocking subprocess execution.

  Every external tool the manager drives (docker, systemctl, journalctl, git,
  project scripts) goes through this seam so tests can script the replies.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  // Runs to completion and captures output.
  virtual CommandResult Capture(const Command& command) = 0;

  // Runs attached to the terminal (scripts, logs -f, shells). Returns the exit code.
  virtual int Passthrough(const Command& command) = 0;
};

using CommandRunnerPtr = std::shared_ptr<CommandRunner>;

/*
  fork/execvp based runner. argv is passed as-is, never through a shell.
*/
class PosixCommandRunner final : public CommandRunner {
 public:
  CommandResult Capture(const Command& command) override;
  int           Passthrough(const Command& command) override;
};

} // namespace projmgr::process
