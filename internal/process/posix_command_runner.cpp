#include "command_runner.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace projmgr::process {

namespace {

constexpr int kExecFailedExitCode = 127;

std::vector<char*> ToArgv(const Command& command) {
  std::vector<char*> args;
  args.reserve(command.argv.size() + 1);
  for (const auto& arg : command.argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);
  return args;
}

// Only called in the forked child.
[[noreturn]] void ExecChild(const Command& command) {
  if (!command.cwd.empty() && chdir(command.cwd.c_str()) != 0) {
    std::fprintf(stderr, "chdir %s: %s\n", command.cwd.c_str(), std::strerror(errno));
    _exit(kExecFailedExitCode);
  }
  auto args = ToArgv(command);
  execvp(args[0], args.data());
  std::fprintf(stderr, "exec %s: %s\n", args[0], std::strerror(errno));
  _exit(kExecFailedExitCode);
}

int WaitForExit(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error("waitpid failed: " + std::string(std::strerror(errno)));
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::string Command::ToString() const {
  std::ostringstream out;
  bool first = true;
  for (const auto& arg : argv) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << arg;
  }
  return out.str();
}

CommandResult PosixCommandRunner::Capture(const Command& command) {
  if (command.argv.empty()) {
    throw std::invalid_argument("empty command");
  }

  int out[2];
  if (pipe(out) != 0) {
    throw std::runtime_error("pipe failed: " + std::string(std::strerror(errno)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(out[0]);
    close(out[1]);
    throw std::runtime_error("fork failed: " + std::string(std::strerror(errno)));
  }
  if (pid == 0) {
    close(out[0]);
    dup2(out[1], STDOUT_FILENO);
    dup2(out[1], STDERR_FILENO);
    close(out[1]);
    ExecChild(command);
  }

  close(out[1]);
  CommandResult result;
  char          buf[4096];
  while (true) {
    const ssize_t n = read(out[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    result.output.append(buf, static_cast<size_t>(n));
  }
  close(out[0]);

  result.exit_code = WaitForExit(pid);
  return result;
}

int PosixCommandRunner::Passthrough(const Command& command) {
  if (command.argv.empty()) {
    throw std::invalid_argument("empty command");
  }

  std::fflush(stdout);
  std::fflush(stderr);

  const pid_t pid = fork();
  if (pid < 0) {
    throw std::runtime_error("fork failed: " + std::string(std::strerror(errno)));
  }
  if (pid == 0) {
    ExecChild(command);
  }
  return WaitForExit(pid);
}

} // namespace projmgr::process
