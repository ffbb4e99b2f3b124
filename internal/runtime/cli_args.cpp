#include "cli_args.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace projmgr::runtime {

namespace {

uint32_t ParseLines(const std::string& value) {
  uint32_t    lines = 0;
  const auto* end   = value.data() + value.size();
  auto [ptr, ec]    = std::from_chars(value.data(), end, lines);
  if (value.empty() || ec != std::errc() || ptr != end) {
    throw util::ValidationError("Line count must be a number or 'f'/'follow'!");
  }
  return lines;
}

} // namespace

CliArguments ParseArguments(const std::vector<std::string>& args) {
  CliArguments parsed;

  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "-q" || arg == "--quiet") {
      parsed.options.quiet = true;
    } else if (arg == "-f" || arg == "--force") {
      parsed.options.force = true;
    } else if (arg == "-s" || arg == "--no-status-check") {
      parsed.options.status_check = false;
    } else if (arg == "-n" || arg == "--number-of-lines") {
      if (i + 1 >= args.size()) {
        throw util::ValidationError("Line count must be a number or 'f'/'follow'!");
      }
      const auto& value = args[++i];
      if (value == "f" || value == "follow") {
        parsed.options.logs.follow = true;
      } else {
        parsed.options.logs.follow = false;
        parsed.options.logs.lines  = ParseLines(value);
        parsed.lines_given         = true;
      }
    } else if (arg == "--config") {
      if (i + 1 >= args.size()) {
        throw util::ValidationError("Option --config needs a file argument!");
      }
      parsed.config_path = args[++i];
    } else if (arg == "--internal-recursive") {
      parsed.options.internal_recursive = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw util::ValidationError("Unknown option: '" + arg + "'!");
    } else if (parsed.command.empty()) {
      parsed.command = arg;
    } else if (parsed.project.empty()) {
      parsed.project = arg;
    } else {
      throw util::ValidationError("Too many arguments: " + arg);
    }
  }
  return parsed;
}

std::string UsageText() {
  return "Usage: projmgr <command> [project-name] [options]\n"
         "\n"
         "Commands:\n"
         "  help                     Show detailed help\n"
         "  add [name]               Add a new project (interactive)\n"
         "  remove <name>            Remove a disabled project\n"
         "  list [name]              List projects with their state\n"
         "  enable [name]            Install and enable projects\n"
         "  disable [name]           Uninstall and disable projects\n"
         "  start [name]             Start projects\n"
         "  stop [name]              Stop projects\n"
         "  restart [name]           Restart projects\n"
         "  status [name]            Show project status\n"
         "  logs [name]              Show project logs\n"
         "  shell <name>             Open a shell in a docker project container\n"
         "  update [name]            Update projects (and projmgr itself when no name is given)\n"
         "  self-update              Update projmgr itself\n"
         "\n"
         "Options:\n"
         "  -q, --quiet              Never prompt, decline every question\n"
         "  -f, --force              Skip confirmations\n"
         "  -s, --no-status-check    Don't retry checking status after starting or stopping\n"
         "  -n, --number-of-lines N  Show N log lines or 'f' to follow (default: follow, 10 for several projects)\n"
         "      --config <file>      Configuration file (default: projmgr.yaml next to the executable)\n"
         "\n"
         "Without a project name a command applies to all projects. A '+' in the name matches any sequence.\n";
}

std::string HelpText(const std::string& version) {
  return "projmgr " + version +
         " installs, runs and updates projects using docker compose, systemd services or custom scripts.\n\n" + UsageText() +
         "\n"
         "Installing (enable, update) a project:\n"
         "  - runs setup.sh from the project path when present\n"
         "  - docker:  links <name>.docker-compose.yml in the projects directory to, in order, an existing regular file\n"
         "             there, docker-compose.yml or docker-compose-default.yml in the project path, an existing valid\n"
         "             link, or a compose file generated from the project's Dockerfile; then runs `docker compose build`\n"
         "  - service: links <name>.service the same way (<name>.service, default.service) and links it into the\n"
         "             systemd unit directory, followed by `systemctl daemon-reload`\n"
         "\n"
         "Running a project:\n"
         "  - docker:  `docker compose up -d` / `down`; a stopped docker project does not come back after a reboot\n"
         "  - service: `systemctl start` / `stop`; a stopped service starts again on reboot\n"
         "  - scripts: start.sh, stop.sh, restart.sh (else stop.sh + start.sh), status.sh, logs.sh\n"
         "\n"
         "Uninstalling (disable) a project stops it and removes its links. Images are only removed for generated\n"
         "compose files. The project record is kept so it can be enabled again.\n"
         "\n"
         "Updating a project runs update.sh when present, otherwise pulls the git repository and, for docker\n"
         "projects, every image of the compose file. A running project is restarted afterwards.\n";
}

} // namespace projmgr::runtime
