#include "service_backend.hpp"

#include "internal/backend/artifact_selector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/path_utils.hpp"

namespace projmgr::backend {

using model::OpResult;
using model::ProjectContext;
using observability::StringField;

ServiceBackend::ServiceBackend(process::CommandRunnerPtr runner, ui::PrompterPtr prompter, std::filesystem::path unit_dir)
    : runner_(std::move(runner)), wizard_(std::move(prompter)), unit_dir_(std::move(unit_dir)) {
}

std::filesystem::path ServiceBackend::ArtifactPath(const ProjectContext& ctx) const {
  return store::ServiceArtifactPath(ctx.managed_dir, ctx.id());
}

std::filesystem::path ServiceBackend::UnitLink(const ProjectContext& ctx) const {
  return unit_dir_ / (ctx.id() + ".service");
}

std::optional<std::filesystem::path> ServiceBackend::Artifact(const ProjectContext& ctx) const {
  auto path = ArtifactPath(ctx);
  if (!ArtifactSelector::Resolves(path)) {
    return std::nullopt;
  }
  return path;
}

bool ServiceBackend::Linked(const ProjectContext& ctx) const {
  const auto artifact = ArtifactPath(ctx);
  return ArtifactSelector::Resolves(artifact) && ArtifactSelector::SameFile(UnitLink(ctx), artifact);
}

OpResult ServiceBackend::Systemctl(const std::string& verb, const ProjectContext& ctx) {
  if (!Linked(ctx)) {
    return OpResult::Fatal("No valid service file found, cannot " + verb + ".");
  }
  if (runner_->Passthrough(process::Command{{"systemctl", verb, ctx.id()}, {}}) != 0) {
    return OpResult::Fatal("systemctl " + verb + " " + ctx.id() + " failed.");
  }
  return OpResult::Ok();
}

bool ServiceBackend::DaemonReload() {
  PROJMGR_LOG_INFO("Reloading systemd daemon ...");
  const auto result = runner_->Capture(process::Command{{"systemctl", "daemon-reload"}, {}});
  if (!result.Succeeded()) {
    PROJMGR_LOG_ERROR("systemctl daemon-reload failed", {StringField("output", result.output)});
  }
  return result.Succeeded();
}

OpResult ServiceBackend::Install(const ProjectContext& ctx) {
  const ArtifactCandidates candidates{ArtifactPath(ctx), ctx.path() / (ctx.id() + ".service"), ctx.path() / "default.service"};

  if (!ArtifactSelector::SelectExisting(candidates)) {
    if (!ctx.options.Interactive()) {
      return OpResult::Fatal("No service file could be determined. To generate one, run this command without -q.");
    }
    auto content = wizard_.UnitFile(ctx.id(), ctx.path());
    if (!content) {
      return OpResult::Fatal("No service file could be determined.");
    }
    ArtifactSelector::WriteRegularFile(candidates.managed, *content);
    PROJMGR_LOG_INFO("Generated service file", {StringField("file", candidates.managed.string())});
  }

  const auto      link = UnitLink(ctx);
  std::error_code ec;
  const bool      occupied = std::filesystem::is_symlink(link, ec) || std::filesystem::exists(link, ec);
  if (occupied && ArtifactSelector::Resolves(link) && !ArtifactSelector::SameFile(link, candidates.managed)) {
    return OpResult::Fatal("A service file already exists at " + link.string() + ", cannot install " + ctx.id() + ".");
  }
  if (occupied && ArtifactSelector::SameFile(link, candidates.managed)) {
    PROJMGR_LOG_INFO("Service file already linked", {StringField("link", link.string())});
  } else {
    // Absent or dangling.
    std::filesystem::remove(link, ec);
    std::filesystem::create_symlink(candidates.managed, link, ec);
    if (ec) {
      return OpResult::Fatal("Failed to link service file " + link.string() + " to " + candidates.managed.string() + ": " + ec.message());
    }
    PROJMGR_LOG_INFO("Linked service file", {StringField("link", link.string()), StringField("target", candidates.managed.string())});
  }

  if (!DaemonReload()) {
    return OpResult::Fatal("systemctl daemon-reload failed.");
  }
  return OpResult::Ok();
}

OpResult ServiceBackend::Start(const ProjectContext& ctx) {
  return Systemctl("start", ctx);
}

OpResult ServiceBackend::Stop(const ProjectContext& ctx) {
  return Systemctl("stop", ctx);
}

OpResult ServiceBackend::Restart(const ProjectContext& ctx) {
  return Systemctl("restart", ctx);
}

model::RunningState ServiceBackend::Status(const ProjectContext& ctx) {
  if (!Linked(ctx)) {
    return model::RunningState::kUnknown;
  }
  auto result = runner_->Capture(process::Command{{"systemctl", "is-active", ctx.id()}, {}});
  while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r')) {
    result.output.pop_back();
  }
  return result.output == "active" ? model::RunningState::kRunning : model::RunningState::kStopped;
}

OpResult ServiceBackend::Uninstall(const ProjectContext& ctx) {
  if (!Linked(ctx)) {
    const auto probe = runner_->Capture(process::Command{{"systemctl", "status", ctx.id()}, {}});
    if (probe.Succeeded()) {
      PROJMGR_LOG_WARN("No valid project service file found, but a systemd service with the same name exists. There might be another service with the same name!",
                       {StringField("project", ctx.id())});
    } else {
      PROJMGR_LOG_WARN("No valid service file and no systemd service found, possibly already uninstalled.", {StringField("project", ctx.id())});
    }
  } else {
    PROJMGR_LOG_INFO("Stopping systemd service", {StringField("project", ctx.id())});
    if (runner_->Passthrough(process::Command{{"systemctl", "stop", ctx.id()}, {}}) != 0) {
      PROJMGR_LOG_WARN("systemctl stop failed", {StringField("project", ctx.id())});
    }
    std::error_code ec;
    std::filesystem::remove(UnitLink(ctx), ec);
    if (ec) {
      return OpResult::Recoverable("Could not remove service file link " + UnitLink(ctx).string() + ": " + ec.message());
    }
    PROJMGR_LOG_INFO("Removed service file link", {StringField("link", UnitLink(ctx).string())});
  }

  if (!DaemonReload()) {
    return OpResult::Recoverable("systemctl daemon-reload failed.");
  }
  return OpResult::Ok();
}

OpResult ServiceBackend::Logs(const ProjectContext& ctx, const model::LogRequest& request) {
  if (!Linked(ctx)) {
    return OpResult::Recoverable("No valid service file found, cannot show logs.");
  }
  process::Command command{{"journalctl", "-u", ctx.id()}, {}};
  if (request.follow) {
    command.argv.push_back("-f");
  } else {
    command.argv.push_back("-n");
    command.argv.push_back(std::to_string(request.lines));
  }
  if (runner_->Passthrough(command) != 0) {
    return OpResult::Recoverable("journalctl failed for " + ctx.id() + ".");
  }
  return OpResult::Ok();
}

OpResult ServiceBackend::ShowDetails(const ProjectContext& ctx) {
  if (!Linked(ctx)) {
    return OpResult::Recoverable("No valid service file found.");
  }
  // systemctl status exits non-zero for inactive units; the view is still valid.
  const int exit_code = runner_->Passthrough(process::Command{{"systemctl", "status", ctx.id(), "--no-pager", "-n", "0"}, {}});
  PROJMGR_LOG_DEBUG("systemctl status finished", {StringField("project", ctx.id()), observability::IntField("exit_code", exit_code)});
  return OpResult::Ok();
}

} // namespace projmgr::backend
