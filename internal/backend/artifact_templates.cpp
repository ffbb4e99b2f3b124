#include "artifact_templates.hpp"

#include <cstdlib>
#include <sstream>

#include "internal/backend/artifact_selector.hpp"

namespace projmgr::backend {

namespace {

std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
    value.remove_suffix(1);
  }
  return value;
}

// "KEY value" -> "KEY=value"; "KEY=value" unchanged.
std::string EnvAssignment(std::string_view declaration) {
  if (declaration.find('=') != std::string_view::npos) {
    return std::string(declaration);
  }
  const auto space = declaration.find_first_of(" \t");
  if (space == std::string_view::npos) {
    return std::string(declaration) + "=";
  }
  return std::string(declaration.substr(0, space)) + "=" + std::string(Trim(declaration.substr(space + 1)));
}

// "8700 8701" -> "8700:8701", as a single mapping entry.
std::string PortMapping(std::string_view declaration) {
  std::string mapping;
  bool        in_gap = false;
  for (char c : declaration) {
    if (c == ' ' || c == '\t') {
      in_gap = true;
      continue;
    }
    if (in_gap && !mapping.empty()) {
      mapping.push_back(':');
    }
    in_gap = false;
    mapping.push_back(c);
  }
  return mapping;
}

bool StartsWithInstruction(std::string_view line, std::string_view instruction) {
  return line.size() > instruction.size() && line.substr(0, instruction.size()) == instruction &&
         (line[instruction.size()] == ' ' || line[instruction.size()] == '\t');
}

} // namespace

DockerfileDeclarations ParseDockerfile(std::string_view dockerfile) {
  DockerfileDeclarations declarations;
  std::istringstream     in{std::string(dockerfile)};
  std::string            raw;
  while (std::getline(in, raw)) {
    const auto line = Trim(raw);
    if (StartsWithInstruction(line, "EXPOSE")) {
      declarations.ports.push_back(PortMapping(Trim(line.substr(6))));
    } else if (StartsWithInstruction(line, "ENV")) {
      declarations.environment.push_back(EnvAssignment(Trim(line.substr(3))));
    }
  }
  return declarations;
}

std::string SynthesizeCompose(const std::string& project_id, const std::filesystem::path& project_path, std::string_view dockerfile) {
  const auto declarations = ParseDockerfile(dockerfile);

  std::ostringstream out;
  out << kComposeGenerationMarker << '\n';
  out << "services:\n";
  out << "  " << project_id << ":\n";
  out << "    build: " << project_path.string() << '\n';
  out << "    container_name: " << project_id << '\n';

  if (!declarations.ports.empty()) {
    out << "    ports:\n";
    for (const auto& port : declarations.ports) {
      out << "      - \"" << port << "\"\n";
    }
  } else {
    out << "#    ports:\n";
    out << "#      - \"8700:8700\"\n";
  }

  if (!declarations.environment.empty()) {
    out << "    environment:\n";
    for (const auto& env : declarations.environment) {
      out << "      - " << env << '\n';
    }
  } else {
    out << "#    environment:\n";
    out << "#      - NODE_ENV=production\n";
  }

  out << "    restart: always\n";
  return out.str();
}

bool HasGenerationMarker(const std::filesystem::path& artifact, std::string_view marker) {
  const auto content = ArtifactSelector::ReadFile(artifact);
  if (!content) {
    return false;
  }
  std::istringstream in(*content);
  std::string        line;
  while (std::getline(in, line)) {
    if (Trim(line) == marker) {
      return true;
    }
  }
  return false;
}

ArtifactWizard::ArtifactWizard(ui::PrompterPtr prompter) : prompter_(std::move(prompter)) {
}

std::vector<std::string> ArtifactWizard::AskEnvironment() {
  std::vector<std::string> environment;
  while (true) {
    auto answer = prompter_->Ask("> New environment variable (type as 'KEY=value', leave blank to finish):");
    if (Trim(answer).empty()) {
      return environment;
    }
    environment.emplace_back(Trim(answer));
  }
}

std::optional<std::string> ArtifactWizard::Dockerfile(const std::filesystem::path& project_path, const std::string& base_image) {
  if (!prompter_->Confirm("No compose file or Dockerfile found. Generate a Dockerfile in " + project_path.string() + "?")) {
    return std::nullopt;
  }

  std::ostringstream out;
  out << "FROM " << base_image << '\n';
  out << "WORKDIR /usr/src/app\n";
  out << "RUN corepack enable\n";
  out << "COPY . .\n";

  std::string suggested = "node index.js";
  if (std::filesystem::exists(project_path / "yarn.lock")) {
    suggested = "yarn start";
    out << "RUN yarn set version stable\n";
    out << "RUN yarn install\n";
  } else if (std::filesystem::exists(project_path / "package.json")) {
    suggested = "npm start";
    out << "RUN npm install\n";
  }

  const auto entrypoint = std::string(Trim(prompter_->Ask("> Entrypoint (e.g. " + suggested + "):")));
  out << "ENTRYPOINT [";
  std::istringstream words(entrypoint.empty() ? suggested : entrypoint);
  std::string        word;
  bool               first = true;
  while (words >> word) {
    out << (first ? "" : ", ") << '"' << word << '"';
    first = false;
  }
  out << "]\n";

  const auto port = std::string(Trim(prompter_->Ask("> Port (e.g. 8700 or 8700:8700 or leave blank to use default):")));
  if (!port.empty()) {
    out << "EXPOSE " << port << '\n';
  }

  const auto environment = AskEnvironment();
  for (const auto& env : environment) {
    out << "ENV " << env << '\n';
  }
  if (environment.empty()) {
    out << "# ENV NODE_ENV=production\n";
  }
  return out.str();
}

std::optional<std::string> ArtifactWizard::UnitFile(const std::string& project_id, const std::filesystem::path& project_path) {
  if (!prompter_->Confirm("No service file found. Generate one?")) {
    return std::nullopt;
  }

  const char* user = std::getenv("USER");

  std::ostringstream out;
  out << kUnitGenerationMarker << '\n';
  out << "[Unit]\n";
  out << "Description=" << project_id << " (managed by projmgr)\n";
  out << "After=network.target\n\n";
  out << "[Service]\n";
  out << "Type=simple\n";
  if (user != nullptr && *user != '\0') {
    out << "User=" << user << '\n';
  }
  out << "WorkingDirectory=" << project_path.string() << '\n';
  out << "ExecStart=" << Trim(prompter_->Ask("> Start command (absolute or relative to " + project_path.string() + "):")) << '\n';
  out << "Restart=always\n";
  for (const auto& env : AskEnvironment()) {
    out << "Environment=\"" << env << "\"\n";
  }
  out << "\n[Install]\n";
  out << "WantedBy=multi-user.target\n";
  return out.str();
}

} // namespace projmgr::backend
