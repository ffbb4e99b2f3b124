#include "container_backend.hpp"

#include <algorithm>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "internal/backend/artifact_selector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::backend {

using model::OpResult;
using model::ProjectContext;
using observability::StringField;

namespace {

constexpr char kUpToDateMarker[] = "Image is up to date";

std::vector<std::string> NonEmptyLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

} // namespace

std::string ImageRepository(const std::string& image) {
  auto repository = image;
  const auto at   = repository.find('@');
  if (at != std::string::npos) {
    repository.erase(at);
  }
  const auto colon = repository.rfind(':');
  const auto slash = repository.rfind('/');
  if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
    repository.erase(colon);
  }
  return repository;
}

ContainerBackend::ContainerBackend(process::CommandRunnerPtr runner, ui::PrompterPtr prompter, std::string default_base_image)
    : runner_(std::move(runner)), prompter_(prompter), wizard_(prompter), default_base_image_(std::move(default_base_image)) {
}

std::filesystem::path ContainerBackend::ArtifactPath(const ProjectContext& ctx) const {
  return store::ComposeArtifactPath(ctx.managed_dir, ctx.id());
}

std::optional<std::filesystem::path> ContainerBackend::Artifact(const ProjectContext& ctx) const {
  auto path = ArtifactPath(ctx);
  if (!ArtifactSelector::Resolves(path)) {
    return std::nullopt;
  }
  return path;
}

process::Command ContainerBackend::Compose(const ProjectContext& ctx, std::initializer_list<std::string> args) const {
  process::Command command;
  command.argv = {"docker", "compose", "-f", ArtifactPath(ctx).string(), "--project-directory", ctx.path().string()};
  command.argv.insert(command.argv.end(), args.begin(), args.end());
  return command;
}

std::string ContainerBackend::Regenerate(const ProjectContext& ctx) const {
  const auto dockerfile = ArtifactSelector::ReadFile(ctx.path() / "Dockerfile");
  return SynthesizeCompose(ctx.id(), ctx.path(), dockerfile ? *dockerfile : std::string());
}

OpResult ContainerBackend::Install(const ProjectContext& ctx) {
  const ArtifactCandidates candidates{ArtifactPath(ctx), ctx.path() / "docker-compose.yml", ctx.path() / "docker-compose-default.yml"};

  if (!ArtifactSelector::SelectExisting(candidates)) {
    const auto dockerfile = ctx.path() / "Dockerfile";
    if (!ArtifactSelector::Resolves(dockerfile)) {
      if (!ctx.options.Interactive()) {
        return OpResult::Fatal("No docker compose file could be determined. To generate a Dockerfile, run this command without -q.");
      }
      auto content = wizard_.Dockerfile(ctx.path(), default_base_image_);
      if (!content) {
        return OpResult::Fatal("No docker compose file could be determined.");
      }
      ArtifactSelector::WriteRegularFile(dockerfile, *content);
      PROJMGR_LOG_INFO("Generated Dockerfile", {StringField("file", dockerfile.string())});
    }
    ArtifactSelector::WriteRegularFile(candidates.managed, Regenerate(ctx));
    PROJMGR_LOG_INFO("Using generated compose file", {StringField("file", candidates.managed.string())});
  }

  PROJMGR_LOG_INFO("Building possible docker images ...");
  if (runner_->Passthrough(Compose(ctx, {"build"})) != 0) {
    return OpResult::Fatal("docker compose build failed.");
  }
  return OpResult::Ok();
}

OpResult ContainerBackend::Start(const ProjectContext& ctx) {
  if (!Artifact(ctx)) {
    return OpResult::Fatal("No valid docker compose file found, cannot start.");
  }
  if (runner_->Passthrough(Compose(ctx, {"up", "-d"})) != 0) {
    return OpResult::Fatal("docker compose up failed.");
  }
  return OpResult::Ok();
}

OpResult ContainerBackend::Stop(const ProjectContext& ctx) {
  if (!Artifact(ctx)) {
    return OpResult::Fatal("No valid docker compose file found, cannot stop.");
  }
  if (runner_->Passthrough(Compose(ctx, {"down"})) != 0) {
    return OpResult::Fatal("docker compose down failed.");
  }
  return OpResult::Ok();
}

OpResult ContainerBackend::Restart(const ProjectContext& ctx) {
  if (!Artifact(ctx)) {
    return OpResult::Fatal("No valid docker compose file found, cannot restart.");
  }
  if (runner_->Passthrough(Compose(ctx, {"down"})) != 0) {
    return OpResult::Fatal("docker compose down failed.");
  }
  if (runner_->Passthrough(Compose(ctx, {"up", "-d"})) != 0) {
    return OpResult::Fatal("docker compose up failed.");
  }
  return OpResult::Ok();
}

model::RunningState ContainerBackend::Status(const ProjectContext& ctx) {
  if (!Artifact(ctx)) {
    return model::RunningState::kUnknown;
  }
  const auto result = runner_->Capture(Compose(ctx, {"ps", "--services", "--filter", "status=running"}));
  if (!result.Succeeded()) {
    return model::RunningState::kStopped;
  }
  return NonEmptyLines(result.output).empty() ? model::RunningState::kStopped : model::RunningState::kRunning;
}

OpResult ContainerBackend::Uninstall(const ProjectContext& ctx) {
  const auto artifact = ArtifactPath(ctx);
  if (!ArtifactSelector::Resolves(artifact)) {
    PROJMGR_LOG_WARN("No valid docker compose file found, possibly already uninstalled.", {StringField("project", ctx.id())});
    return OpResult::Ok();
  }

  if (!HasGenerationMarker(artifact, kComposeGenerationMarker)) {
    PROJMGR_LOG_INFO("Stopping possibly running docker containers ...");
    if (runner_->Passthrough(Compose(ctx, {"down"})) != 0) {
      return OpResult::Recoverable("docker compose down failed.");
    }
    return OpResult::Ok();
  }

  PROJMGR_LOG_INFO("Stopping possibly running docker containers and removing images ...");
  if (runner_->Passthrough(Compose(ctx, {"down", "--rmi", "all"})) != 0) {
    return OpResult::Recoverable("docker compose down --rmi all failed.");
  }
  if (ArtifactSelector::IsRegularNonLink(artifact)) {
    ArtifactSelector::Retire(artifact, Regenerate(ctx));
  }
  return OpResult::Ok();
}

OpResult ContainerBackend::Logs(const ProjectContext& ctx, const model::LogRequest& request) {
  if (!Artifact(ctx)) {
    return OpResult::Recoverable("No valid docker compose file found, cannot show logs.");
  }
  const auto command = request.follow ? Compose(ctx, {"logs", "-f"}) : Compose(ctx, {"logs", "-n", std::to_string(request.lines)});
  if (runner_->Passthrough(command) != 0) {
    return OpResult::Recoverable("docker compose logs failed.");
  }
  return OpResult::Ok();
}

OpResult ContainerBackend::ShowDetails(const ProjectContext& ctx) {
  if (!Artifact(ctx)) {
    return OpResult::Recoverable("No valid docker compose file found.");
  }
  if (runner_->Passthrough(Compose(ctx, {"ps", "-a"})) != 0) {
    return OpResult::Recoverable("docker compose ps failed.");
  }
  return OpResult::Ok();
}

std::vector<std::string> ContainerBackend::Images(const ProjectContext& ctx) {
  const auto result = runner_->Capture(Compose(ctx, {"config"}));
  if (!result.Succeeded()) {
    throw util::ExternalToolError("Failed to get docker compose config", result.output);
  }

  YAML::Node config;
  try {
    config = YAML::Load(result.output);
  } catch (const YAML::Exception& e) {
    throw util::ExternalToolError("Unparseable docker compose config: " + std::string(e.what()), result.output);
  }

  std::vector<std::string> images;
  const auto               services = config["services"];
  if (!services || !services.IsMap()) {
    return images;
  }
  for (const auto& service : services) {
    const auto image = service.second["image"];
    if (!image || !image.IsScalar()) {
      continue;
    }
    const auto name = image.as<std::string>();
    if (std::find(images.begin(), images.end(), name) == images.end()) {
      images.push_back(name);
    }
  }
  return images;
}

bool ContainerBackend::PullImage(const std::string& image) {
  const auto result = runner_->Capture(process::Command{{"docker", "image", "pull", image}, {}});
  if (!result.Succeeded()) {
    throw util::ExternalToolError("Pulling " + image + " failed with exit code " + std::to_string(result.exit_code), result.output);
  }
  return result.output.find(kUpToDateMarker) == std::string::npos;
}

std::vector<DanglingImage> ContainerBackend::DanglingImages(const std::string& image) {
  const auto result = runner_->Capture(process::Command{{"docker", "images", "--format", "{{.Repository}}:{{.Tag}} {{.ID}}", "--filter",
                                                          "dangling=true", "--filter", "reference=" + ImageRepository(image)},
                                                         {}});
  std::vector<DanglingImage> dangling;
  if (!result.Succeeded()) {
    PROJMGR_LOG_WARN("Could not list dangling images", {StringField("image", image)});
    return dangling;
  }
  for (const auto& line : NonEmptyLines(result.output)) {
    const auto space = line.rfind(' ');
    if (space == std::string::npos) {
      continue;
    }
    dangling.push_back({line.substr(0, space), line.substr(space + 1)});
  }
  return dangling;
}

OpResult ContainerBackend::RemoveImages(const std::vector<std::string>& ids) {
  if (ids.empty()) {
    return OpResult::Ok();
  }
  process::Command command{{"docker", "rmi", "-f"}, {}};
  command.argv.insert(command.argv.end(), ids.begin(), ids.end());
  if (runner_->Passthrough(command) != 0) {
    return OpResult::Recoverable("Removing images failed.");
  }
  return OpResult::Ok();
}

std::vector<std::string> ContainerBackend::Services(const ProjectContext& ctx) {
  const auto result = runner_->Capture(Compose(ctx, {"ps", "--services"}));
  if (!result.Succeeded()) {
    throw util::ExternalToolError("Could not determine service names from docker compose file.", result.output);
  }
  return NonEmptyLines(result.output);
}

OpResult ContainerBackend::Shell(const ProjectContext& ctx, const std::string& service) {
  const int exit_code = runner_->Passthrough(Compose(ctx, {"exec", service, "sh", "-l"}));
  if (exit_code != 0) {
    return OpResult::Recoverable("Shell exited with code " + std::to_string(exit_code) + ".");
  }
  return OpResult::Ok();
}

} // namespace projmgr::backend
