#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "internal/backend/backend_factory.hpp"
#include "internal/backend/container_backend.hpp"
#include "internal/backend/script_runner.hpp"
#include "internal/core/dangling_image_ledger.hpp"
#include "internal/core/status_poller.hpp"
#include "internal/git/credential_store.hpp"
#include "internal/git/git_engine.hpp"
#include "internal/git/working_copy.hpp"
#include "internal/model/op_result.hpp"
#include "internal/model/project_context.hpp"
#include "internal/store/project_store.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::core {

/*
  Per-project commands on top of the store, the backend drivers, the working
  copy and the status poller.

  Only `enabled` is persisted. Everything else (running, stopped, unknown) is
  probed from the backend when a command needs it. Every command builds its
  own ProjectContext from the stored record; nothing is carried between calls
  except the dangling image ledger of the current invocation.

  Expected failures come back as OpResult. Store and selection errors
  (NotFound, ValidationError, ...) propagate as exceptions for the batch
  runner to attribute to the target.
*/
class LifecycleOrchestrator {
 public:
  struct Dependencies {
    std::shared_ptr<store::ProjectStore>     store;
    backend::BackendFactory::BackendMap      backends;
    std::shared_ptr<backend::ScriptRunner>   scripts;
    std::shared_ptr<git::GitEngine>          git;
    std::shared_ptr<git::CredentialResolver> credentials;
    std::shared_ptr<git::WorkingCopy>        working_copy;
    std::shared_ptr<StatusPoller>            poller;
    ui::PrompterPtr                          prompter;
  };

  LifecycleOrchestrator(Dependencies deps, std::ostream& out);

  model::ProjectContext Context(const std::string& id, const model::RunOptions& options) const;

  // ------------------------------------------------------------------
  // Records
  // ------------------------------------------------------------------
  // Interactive only. `id` may be empty, then it is asked for.
  model::OpResult Add(const std::string& id, const model::RunOptions& options, const std::filesystem::path& invocation_dir);
  model::OpResult Remove(const std::string& id, const model::RunOptions& options);
  model::OpResult List(const std::string& id, const model::RunOptions& options);

  // ------------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------------
  model::OpResult Enable(const std::string& id, const model::RunOptions& options);
  model::OpResult Disable(const std::string& id, const model::RunOptions& options);
  model::OpResult Start(const std::string& id, const model::RunOptions& options);
  model::OpResult Stop(const std::string& id, const model::RunOptions& options);
  model::OpResult Restart(const std::string& id, const model::RunOptions& options);
  model::OpResult Update(const std::string& id, const model::RunOptions& options);

  // ------------------------------------------------------------------
  // Inspection
  // ------------------------------------------------------------------
  // `single` adds the backend's native status view.
  model::OpResult Status(const std::string& id, const model::RunOptions& options, bool single);
  // Follow is only honoured for a single target.
  model::OpResult Logs(const std::string& id, const model::RunOptions& options, bool single);
  model::OpResult Shell(const std::string& id, const model::RunOptions& options);

  const DanglingImageLedger& dangling_images() const {
    return dangling_;
  }

  // Lists collected dangling images and removes them after confirmation.
  model::OpResult CleanupDanglingImages(const model::RunOptions& options);

 private:
  // nullptr for kUnknown.
  backend::Backend*                          BackendFor(const model::ProjectContext& ctx) const;
  std::shared_ptr<backend::ContainerBackend> Container() const;

  model::OpResult Install(const model::ProjectContext& ctx);
  model::OpResult RestartContext(const model::ProjectContext& ctx, backend::Backend& backend);
  model::OpResult ConfirmState(const model::ProjectContext& ctx, backend::Backend& backend, model::RunningState expected);
  model::OpResult PullWorkingCopy(const model::ProjectContext& ctx);
  model::OpResult PullImages(const model::ProjectContext& ctx);

  // true when the redundant action should go ahead.
  bool ConfirmRedundant(const model::ProjectContext& ctx, const std::string& question);

  Dependencies        deps_;
  std::ostream&       out_;
  DanglingImageLedger dangling_;
};

/*
  Picks the compose service for `shell`: exact name first, then a unique
  prefix. Throws util::NotFound or util::AmbiguousSelection.
*/
std::string ResolveServicePrefix(const std::vector<std::string>& services, const std::string& prefix);

} // namespace projmgr::core
