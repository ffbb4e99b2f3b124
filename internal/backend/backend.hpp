#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "internal/model/op_result.hpp"
#include "internal/model/project_context.hpp"
#include "internal/model/state_machine.hpp"

namespace projmgr::backend {

/*
  Execution technology behind a project.

  Implementations:
    CONTAINER → docker compose, keyed by the compose artifact
    SERVICE   → systemd unit, keyed by unit name
    SCRIPTS   → project-supplied executables

  Drivers are stateless; every call receives the full ProjectContext.
*/

class Backend {
 public:
  virtual ~Backend() = default;

  virtual model::ProjectType Type() const = 0;

  // Whether start/stop outcomes can be confirmed through Status().
  virtual bool ConfirmsState() const = 0;

  // ------------------------------------------------------------------
  // Install
  // ------------------------------------------------------------------
  /*
    Select (or generate) the artifact and wire the project into the runtime.

    Idempotent: a second call with nothing changed on disk leaves artifacts,
    links and running state exactly as they were.
  */
  virtual model::OpResult Install(const model::ProjectContext& ctx) = 0;

  // ------------------------------------------------------------------
  // Run control
  // ------------------------------------------------------------------
  virtual model::OpResult Start(const model::ProjectContext& ctx)   = 0;
  virtual model::OpResult Stop(const model::ProjectContext& ctx)    = 0;
  virtual model::OpResult Restart(const model::ProjectContext& ctx) = 0;

  // Unknown when the artifact or its link cannot be located.
  virtual model::RunningState Status(const model::ProjectContext& ctx) = 0;

  // ------------------------------------------------------------------
  // Uninstall
  // ------------------------------------------------------------------
  /*
    Stop and remove the runtime linkage. The record itself is untouched so the
    project can be enabled again later.
  */
  virtual model::OpResult Uninstall(const model::ProjectContext& ctx) = 0;

  virtual model::OpResult Logs(const model::ProjectContext& ctx, const model::LogRequest& request) = 0;

  // Native status view for a single selected project.
  virtual model::OpResult ShowDetails(const model::ProjectContext& ctx) = 0;

  // Artifact path when the backend has one and it currently resolves.
  virtual std::optional<std::filesystem::path> Artifact(const model::ProjectContext&) const {
    return std::nullopt;
  }
};

using BackendPtr = std::shared_ptr<Backend>;

} // namespace projmgr::backend
