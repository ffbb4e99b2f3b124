#include "lifecycle_orchestrator.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/store/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::core {

namespace fs = std::filesystem;

using model::OpResult;
using model::ProjectContext;
using model::RunningState;
using observability::IntField;
using observability::StringField;

namespace {

OpResult UnknownType(const ProjectContext& ctx, const std::string& verb) {
  PROJMGR_LOG_WARN("Unknown or unsupported type, skipping " + verb + ".",
                   {StringField("project", ctx.id()), StringField("type", ctx.record.type_tag)});
  return OpResult::Fatal("Unknown or unsupported type '" + ctx.record.type_tag + "'");
}

const char* StatusIcon(bool enabled, RunningState running) {
  if (!enabled) {
    return "✗";
  }
  switch (running) {
    case RunningState::kRunning:
      return "✓";
    case RunningState::kStopped:
      return "⏹";
    case RunningState::kUnknown:
      return "?";
  }
  return "?";
}

std::string Trimmed(std::string value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

} // namespace

std::string ResolveServicePrefix(const std::vector<std::string>& services, const std::string& prefix) {
  for (const auto& service : services) {
    if (service == prefix) {
      return service;
    }
  }
  std::vector<std::string> matches;
  for (const auto& service : services) {
    if (service.compare(0, prefix.size(), prefix) == 0) {
      matches.push_back(service);
    }
  }
  if (matches.empty()) {
    throw util::NotFound("No services match '" + prefix + "*'!");
  }
  if (matches.size() > 1) {
    throw util::AmbiguousSelection("Provided service name '" + prefix + "' is ambiguous!");
  }
  return matches.front();
}

LifecycleOrchestrator::LifecycleOrchestrator(Dependencies deps, std::ostream& out) : deps_(std::move(deps)), out_(out) {
}

ProjectContext LifecycleOrchestrator::Context(const std::string& id, const model::RunOptions& options) const {
  ProjectContext ctx;
  ctx.record      = deps_.store->Load(id);
  ctx.managed_dir = deps_.store->root();
  ctx.gitpath     = git::WorkingCopy::GitPath(ctx.record, ctx.managed_dir);
  ctx.options     = options;
  return ctx;
}

backend::Backend* LifecycleOrchestrator::BackendFor(const ProjectContext& ctx) const {
  switch (ctx.record.type) {
    case model::ProjectType::kContainer:
    case model::ProjectType::kService:
    case model::ProjectType::kScripts: {
      const auto it = deps_.backends.find(ctx.record.type);
      return it == deps_.backends.end() ? nullptr : it->second.get();
    }
    case model::ProjectType::kUnknown:
      return nullptr;
  }
  return nullptr;
}

std::shared_ptr<backend::ContainerBackend> LifecycleOrchestrator::Container() const {
  const auto it = deps_.backends.find(model::ProjectType::kContainer);
  if (it == deps_.backends.end()) {
    return nullptr;
  }
  return std::dynamic_pointer_cast<backend::ContainerBackend>(it->second);
}

bool LifecycleOrchestrator::ConfirmRedundant(const ProjectContext& ctx, const std::string& question) {
  if (ctx.options.force) {
    return true;
  }
  if (!ctx.options.Interactive()) {
    return false;
  }
  return deps_.prompter->Confirm(question);
}

// ----------------------------------------------------------------------
// Records
// ----------------------------------------------------------------------

OpResult LifecycleOrchestrator::Add(const std::string& id, const model::RunOptions& options, const fs::path& invocation_dir) {
  if (!options.Interactive()) {
    return OpResult::Fatal("Command 'add' cannot be called with --quiet.");
  }

  model::ProjectRecord record;
  record.id = id.empty() ? Trimmed(deps_.prompter->Ask("Project name:")) : id;
  store::ValidateProjectId(record.id);
  if (deps_.store->Exists(record.id)) {
    throw util::AlreadyExists("Project " + record.id + " already exists.");
  }

  const auto owner = Trimmed(deps_.prompter->Ask("GitHub owner:"));
  if (owner.empty()) {
    throw util::ValidationError("GitHub owner must not be empty.");
  }
  auto repo = Trimmed(deps_.prompter->Ask("GitHub repository name (default: " + record.id + "):"));
  if (repo.empty()) {
    repo = record.id;
  }
  record.repo_url = "https://github.com/" + owner + "/" + repo + ".git";

  const auto sub_path = Trimmed(deps_.prompter->Ask("Subdirectory inside git repo (default: none):"));
  if (!sub_path.empty()) {
    record.sub_path = sub_path;
  }

  if (deps_.prompter->Confirm("Use global GitHub PAT?")) {
    record.auth = model::AuthMode::kGlobalCredential;
  } else {
    record.local_token = Trimmed(deps_.prompter->Ask("Project-specific GitHub PAT (leave blank to use no PAT):"));
    record.auth        = record.local_token.empty() ? model::AuthMode::kNone : model::AuthMode::kLocalCredential;
  }

  const auto default_path = invocation_dir.filename() == record.id ? invocation_dir : invocation_dir / record.id;
  const auto path         = Trimmed(deps_.prompter->Ask("Project path (default: " + default_path.string() + "):"));
  record.path             = path.empty() ? default_path : fs::path(path);

  std::string question = "Project type (docker/service/scripts):";
  while (true) {
    record.type_tag = Trimmed(deps_.prompter->Ask(question));
    record.type     = model::ParseProjectType(record.type_tag);
    if (record.type != model::ProjectType::kUnknown) {
      break;
    }
    question = "Invalid type '" + record.type_tag + "', try again (docker/service/scripts):";
  }

  deps_.store->Create(record);
  return OpResult::Ok("Successfully added project " + record.id + ". You can now enable and install it with `projmgr enable " +
                      record.id + "`.");
}

OpResult LifecycleOrchestrator::Remove(const std::string& id, const model::RunOptions& options) {
  const auto ctx = Context(id, options);
  if (ctx.record.enabled) {
    return OpResult::Fatal("Project " + id + " is enabled, please disable it first.");
  }
  if (!options.force && !(options.Interactive() && deps_.prompter->Confirm("Are you sure you want to remove project " + id + "?"))) {
    return OpResult::Ok("Cancelled.");
  }

  deps_.store->Delete(id);

  std::error_code ec;
  if (ctx.record.sub_path && fs::is_directory(ctx.gitpath, ec)) {
    if (options.Interactive() && deps_.prompter->Confirm("Do you want to remove the full git repository at " + ctx.gitpath.string() + "?")) {
      fs::remove_all(ctx.gitpath);
      if (fs::is_symlink(ctx.path(), ec)) {
        fs::remove(ctx.path());
        fs::create_directories(ctx.path());
        PROJMGR_LOG_INFO("Removed symlink and created empty directory", {StringField("path", ctx.path().string())});
      }
      PROJMGR_LOG_INFO("Removed git repository", {StringField("path", ctx.gitpath.string())});
    } else {
      PROJMGR_LOG_INFO("Git repository kept for potential reuse.", {StringField("path", ctx.gitpath.string())});
    }
  }
  return OpResult::Ok("Successfully removed project " + id + ".");
}

OpResult LifecycleOrchestrator::List(const std::string& id, const model::RunOptions& options) {
  const auto ctx     = Context(id, options);
  auto       running = RunningState::kUnknown;
  if (ctx.record.enabled) {
    if (auto* backend = BackendFor(ctx)) {
      running = backend->Status(ctx);
    }
  }
  out_ << StatusIcon(ctx.record.enabled, running) << ' ' << id << ": " << ctx.path().string() << '\n';
  return OpResult::Ok();
}

// ----------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------

OpResult LifecycleOrchestrator::Install(const ProjectContext& ctx) {
  auto* backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "install");
  }

  try {
    auto prepared = deps_.working_copy->Prepare(ctx);
    if (!prepared) {
      return prepared;
    }
    if (deps_.scripts->Has(ctx, "setup.sh")) {
      auto setup = deps_.scripts->Run(ctx, "setup.sh");
      if (setup.IsFatal()) {
        return setup;
      }
      if (!setup) {
        PROJMGR_LOG_WARN(setup.message);
      }
    }
    return backend->Install(ctx);
  } catch (const std::exception& e) {
    return OpResult::Fatal(e.what());
  }
}

OpResult LifecycleOrchestrator::Enable(const std::string& id, const model::RunOptions& options) {
  auto       ctx         = Context(id, options);
  const bool was_enabled = ctx.record.enabled;

  auto installed = Install(ctx);
  if (!installed) {
    deps_.store->SetEnabled(id, false);
    return OpResult::Fatal("Install failed with project " + id + ", " + (was_enabled ? "disabling project" : "project remains disabled") +
                           (installed.message.empty() ? "" : ": " + installed.message));
  }

  if (was_enabled) {
    PROJMGR_LOG_INFO("Successfully re-installed project, it was already enabled.", {StringField("project", id)});
  } else {
    deps_.store->SetEnabled(id, true);
    ctx.record.enabled = true;
    PROJMGR_LOG_INFO("Successfully installed and enabled project.", {StringField("project", id)});
  }

  // A re-install must not silently diverge from what is running.
  auto* backend = BackendFor(ctx);
  if (was_enabled && backend->Status(ctx) == RunningState::kRunning) {
    PROJMGR_LOG_INFO("Restarting project now.", {StringField("project", id)});
    return RestartContext(ctx, *backend);
  }
  return OpResult::Ok("You can now start it with `projmgr start " + id + "`.");
}

OpResult LifecycleOrchestrator::Disable(const std::string& id, const model::RunOptions& options) {
  const auto ctx = Context(id, options);
  if (!ctx.record.enabled) {
    PROJMGR_LOG_WARN("Already disabled, skipping.", {StringField("project", id)});
    return OpResult::Ok();
  }

  auto  uninstalled = OpResult::Ok();
  auto* backend     = BackendFor(ctx);
  if (backend == nullptr) {
    PROJMGR_LOG_WARN("Unknown or unsupported type, skipping uninstall.", {StringField("type", ctx.record.type_tag)});
  } else {
    try {
      uninstalled = backend->Uninstall(ctx);
    } catch (const std::exception& e) {
      uninstalled = OpResult::Recoverable(e.what());
    }
  }

  // Always leave a record that can be enabled again.
  deps_.store->SetEnabled(id, false);

  if (!uninstalled) {
    PROJMGR_LOG_WARN("Uninstall incomplete, project disabled anyway.", {StringField("project", id), StringField("reason", uninstalled.message)});
    return OpResult::Ok("Disabled project " + id + " with incomplete uninstall.");
  }
  return OpResult::Ok(std::string("Successfully ") + (backend ? "uninstalled and disabled" : "disabled") + " project " + id + ".");
}

OpResult LifecycleOrchestrator::ConfirmState(const ProjectContext& ctx, backend::Backend& backend, RunningState expected) {
  const bool starting = expected == RunningState::kRunning;
  const auto poller   = ctx.options.status_check ? *deps_.poller : deps_.poller->WithMaxAttempts(0);
  const auto result   = poller.Confirm(expected, [&] { return backend.Status(ctx); });

  switch (result.confirmation) {
    case Confirmation::kConfirmed:
      return OpResult::Ok(std::string("Successfully ") + (starting ? "started" : "stopped") + " project " + ctx.id() + ".");
    case Confirmation::kTimedOut:
      return OpResult::Recoverable(std::string("Failed to ") + (starting ? "start" : "stop") + " project " + ctx.id() + ", still " +
                                   (starting ? "not running" : "running") + " after " + std::to_string(result.waited_ms) + "ms timeout.");
    case Confirmation::kUnknown:
      PROJMGR_LOG_WARN("Running status unknown.", {StringField("project", ctx.id()), IntField("probes", result.probes)});
      return OpResult::Ok();
  }
  return OpResult::Ok();
}

OpResult LifecycleOrchestrator::Start(const std::string& id, const model::RunOptions& options) {
  const auto ctx = Context(id, options);
  if (!ctx.record.enabled) {
    PROJMGR_LOG_WARN("Not enabled, skipping start.", {StringField("project", id)});
    return OpResult::Ok();
  }
  auto* backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "start");
  }

  if (backend->Status(ctx) == RunningState::kRunning && !ConfirmRedundant(ctx, "Project seems to be running already. Trigger start anyway?")) {
    return OpResult::Ok("Already running, skipping start.");
  }

  auto started = backend->Start(ctx);
  if (!started) {
    return started;
  }
  if (!backend->ConfirmsState()) {
    return OpResult::Ok("Project " + id + " started.");
  }
  return ConfirmState(ctx, *backend, RunningState::kRunning);
}

OpResult LifecycleOrchestrator::Stop(const std::string& id, const model::RunOptions& options) {
  // Allowed while disabled: a leftover instance must stay stoppable.
  const auto ctx     = Context(id, options);
  auto*      backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "stop");
  }

  if (backend->Status(ctx) == RunningState::kStopped && !ConfirmRedundant(ctx, "Project seems to be stopped. Trigger stop anyway?")) {
    return OpResult::Ok("Already stopped, skipping stop.");
  }

  auto stopped = backend->Stop(ctx);
  if (!stopped) {
    return stopped;
  }
  if (!backend->ConfirmsState()) {
    return OpResult::Ok("Project " + id + " stopped.");
  }
  return ConfirmState(ctx, *backend, RunningState::kStopped);
}

OpResult LifecycleOrchestrator::RestartContext(const ProjectContext& ctx, backend::Backend& backend) {
  auto restarted = backend.Restart(ctx);
  if (!restarted) {
    return restarted;
  }
  return OpResult::Ok("Successfully restarted project " + ctx.id() + ".");
}

OpResult LifecycleOrchestrator::Restart(const std::string& id, const model::RunOptions& options) {
  const auto ctx = Context(id, options);
  if (!ctx.record.enabled) {
    PROJMGR_LOG_WARN("Not enabled, skipping restart.", {StringField("project", id)});
    return OpResult::Ok();
  }
  auto* backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "restart");
  }
  return RestartContext(ctx, *backend);
}

OpResult LifecycleOrchestrator::PullWorkingCopy(const ProjectContext& ctx) {
  if (!deps_.git->IsWorkingCopy(ctx.gitpath)) {
    PROJMGR_LOG_WARN("Path is not a git repository, skipping git repository update.", {StringField("path", ctx.gitpath.string())});
    return OpResult::Ok();
  }

  std::optional<git::GitUrl> url;
  if (!ctx.record.repo_url.empty()) {
    try {
      url = deps_.credentials->Resolve(ctx.record, ctx.options);
    } catch (const util::UntrustedHost& e) {
      return OpResult::Fatal(e.what());
    } catch (const util::InvalidState& e) {
      return OpResult::Fatal(e.what());
    } catch (const util::ValidationError& e) {
      return OpResult::Fatal(e.what());
    }
  }

  PROJMGR_LOG_INFO("Fetching updates ...", {StringField("path", ctx.gitpath.string())});
  const auto pulled = deps_.git->Pull(ctx.gitpath, url);
  switch (pulled.status) {
    case git::PullStatus::kUpToDate:
      PROJMGR_LOG_INFO("Git repository is already up to date!", {StringField("commit", pulled.old_hash)});
      return OpResult::Ok();
    case git::PullStatus::kUpdated:
      PROJMGR_LOG_INFO("Successfully updated git repository",
                       {StringField("from", pulled.old_hash), StringField("to", pulled.new_hash), IntField("commits", pulled.behind)});
      return OpResult::Ok();
    case git::PullStatus::kFailed:
      return OpResult::Fatal(pulled.detail);
  }
  return OpResult::Fatal(pulled.detail);
}

OpResult LifecycleOrchestrator::PullImages(const ProjectContext& ctx) {
  auto container = Container();
  if (ctx.record.type != model::ProjectType::kContainer || !container || !container->Artifact(ctx)) {
    return OpResult::Ok();
  }

  try {
    const auto images = container->Images(ctx);
    if (images.empty()) {
      PROJMGR_LOG_WARN("No images to possibly update found in docker compose file.");
      return OpResult::Ok();
    }

    // One pull per image so each reports its own status.
    int                                 updated = 0;
    std::vector<backend::DanglingImage> dangling;
    for (const auto& image : images) {
      if (container->PullImage(image)) {
        PROJMGR_LOG_INFO("Updated successfully", {StringField("image", image)});
        ++updated;
      } else {
        PROJMGR_LOG_INFO("Already up to date", {StringField("image", image)});
      }
      auto left_over = container->DanglingImages(image);
      dangling.insert(dangling.end(), left_over.begin(), left_over.end());
    }

    if (!dangling.empty()) {
      PROJMGR_LOG_INFO("Obsolete (dangling) images will be listed at the end of the update(s).");
      dangling_.Record(ctx.id(), std::move(dangling));
    }
    if (updated != 0) {
      PROJMGR_LOG_INFO("Successfully updated docker image(s).", {IntField("count", updated)});
    } else {
      PROJMGR_LOG_INFO("All docker images already up to date.");
    }
    return OpResult::Ok();
  } catch (const util::ExternalToolError& e) {
    if (!e.output().empty()) {
      out_ << e.output() << '\n';
    }
    return OpResult::Fatal(e.what());
  }
}

OpResult LifecycleOrchestrator::Update(const std::string& id, const model::RunOptions& options) {
  const auto ctx     = Context(id, options);
  auto*      backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "update");
  }

  const bool was_running = ctx.record.enabled && backend->Status(ctx) == RunningState::kRunning;

  if (deps_.scripts->Has(ctx, "update.sh")) {
    auto scripted = deps_.scripts->Run(ctx, "update.sh");
    if (!scripted) {
      return scripted;
    }
  } else {
    auto pulled = PullWorkingCopy(ctx);
    if (!pulled) {
      return pulled;
    }
    auto images = PullImages(ctx);
    if (!images) {
      return images;
    }
  }

  auto installed = Install(ctx);
  if (!installed) {
    return OpResult::Fatal("Post-update install failed. Skipping restart." + (installed.message.empty() ? "" : " " + installed.message));
  }

  PROJMGR_LOG_INFO("Update complete.", {StringField("project", id)});
  if (!was_running) {
    return OpResult::Ok("Project is not running, skipping restart.");
  }
  PROJMGR_LOG_INFO("Restarting project after update ...", {StringField("project", id)});
  return RestartContext(ctx, *backend);
}

// ----------------------------------------------------------------------
// Inspection
// ----------------------------------------------------------------------

OpResult LifecycleOrchestrator::Status(const std::string& id, const model::RunOptions& options, bool single) {
  const auto ctx = Context(id, options);
  out_ << "Enabled: " << (ctx.record.enabled ? "✓" : "✗") << '\n';

  auto* backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "status");
  }

  if (backend->ConfirmsState()) {
    out_ << "Running: " << model::ToString(backend->Status(ctx)) << '\n';
    if (const auto artifact = backend->Artifact(ctx)) {
      out_ << "Artifact: " << artifact->string();
      std::error_code ec;
      if (fs::is_symlink(*artifact, ec)) {
        out_ << " (→ " << fs::canonical(*artifact, ec).string() << ")";
      }
      out_ << '\n';
    } else {
      out_ << "Artifact: Not found\n";
    }
  } else if (deps_.scripts->Has(ctx, "status.sh")) {
    auto probed = backend->ShowDetails(ctx);
    if (!probed) {
      return probed;
    }
  } else {
    PROJMGR_LOG_WARN("No status.sh script found.", {StringField("path", ctx.path().string())});
  }

  out_ << "Project path: " << ctx.path().string() << '\n';
  out_ << "Repository: " << ctx.record.repo_url << '\n';
  if (ctx.record.sub_path) {
    out_ << "Subdirectory: " << *ctx.record.sub_path << '\n';
  }
  out_ << "Authentication: " << model::ToString(ctx.record.auth) << '\n';

  out_ << "Git status: ";
  if (!deps_.git->IsWorkingCopy(ctx.gitpath)) {
    out_ << "Git repository not set up!\n";
  } else {
    const auto upstream = deps_.git->CompareUpstream(ctx.gitpath);
    switch (upstream.status) {
      case git::UpstreamStatus::kUpToDate:
        out_ << "Up to date!" << (ctx.record.type == model::ProjectType::kContainer ? " (There might be new docker images available though)" : "")
             << '\n';
        break;
      case git::UpstreamStatus::kBehind:
        out_ << "Update available";
        if (upstream.behind) {
          out_ << " (" << *upstream.behind << " commits behind)";
        }
        out_ << '\n';
        break;
      case git::UpstreamStatus::kNoUpstream:
      case git::UpstreamStatus::kError:
        out_ << upstream.detail << '\n';
        break;
    }
  }

  if (single && backend->ConfirmsState()) {
    out_ << '\n';
    out_.flush();
    auto details = backend->ShowDetails(ctx);
    if (!details) {
      PROJMGR_LOG_WARN(details.message, {StringField("project", id)});
    }
  }
  return OpResult::Ok();
}

OpResult LifecycleOrchestrator::Logs(const std::string& id, const model::RunOptions& options, bool single) {
  const auto ctx     = Context(id, options);
  auto*      backend = BackendFor(ctx);
  if (backend == nullptr) {
    return UnknownType(ctx, "logs");
  }
  auto request = options.logs;
  if (!single) {
    request.follow = false;
  }
  return backend->Logs(ctx, request);
}

OpResult LifecycleOrchestrator::Shell(const std::string& id, const model::RunOptions& options) {
  const auto ctx = Context(id, options);
  if (ctx.record.type != model::ProjectType::kContainer) {
    return OpResult::Fatal("Shell command is only available for docker projects.");
  }
  if (!ctx.record.enabled) {
    return OpResult::Fatal("Project is not enabled, cannot open shell.");
  }
  auto container = Container();
  if (!container || !container->Artifact(ctx)) {
    return OpResult::Fatal("No valid docker compose file found, cannot open shell.");
  }
  if (container->Status(ctx) != RunningState::kRunning) {
    return OpResult::Fatal("Container is not running, cannot open shell.");
  }

  std::vector<std::string> services;
  try {
    services = container->Services(ctx);
  } catch (const util::ExternalToolError& e) {
    return OpResult::Fatal(e.what());
  }
  if (services.empty()) {
    return OpResult::Fatal("Could not determine service names from docker compose file.");
  }

  std::string service = services.front();
  if (services.size() > 1) {
    out_ << "Multiple services found:\n";
    for (const auto& name : services) {
      out_ << "  " << name << '\n';
    }
    if (!options.Interactive()) {
      PROJMGR_LOG_INFO("Using first service, run without -q next time to choose.", {StringField("service", service)});
    } else {
      service = ResolveServicePrefix(services, Trimmed(deps_.prompter->Ask("Enter (start of) service name:")));
    }
  }

  PROJMGR_LOG_INFO("Opening container shell", {StringField("project", id), StringField("service", service)});
  return container->Shell(ctx, service);
}

OpResult LifecycleOrchestrator::CleanupDanglingImages(const model::RunOptions& options) {
  if (dangling_.Empty()) {
    return OpResult::Ok();
  }

  out_ << "The following dangling docker images were found:\n";
  for (const auto& entry : dangling_.entries()) {
    out_ << "# " << entry.project << ":\n";
    for (const auto& image : entry.images) {
      out_ << "  - " << image.reference << ' ' << image.id << '\n';
    }
  }

  const auto ids = dangling_.Ids();
  if (options.Interactive() && deps_.prompter->Confirm("Do you want to remove them now?")) {
    auto container = Container();
    if (!container) {
      return OpResult::Fatal("No container backend available.");
    }
    return container->RemoveImages(ids);
  }

  std::string command = "docker rmi -f";
  for (const auto& image_id : ids) {
    command += " " + image_id;
  }
  out_ << "You can remove them later using `" << command << "`\n";
  return OpResult::Ok();
}

} // namespace projmgr::core
