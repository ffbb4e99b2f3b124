#pragma once

#include <string>

#include "internal/backend/artifact_templates.hpp"
#include "internal/backend/backend.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::backend {

/*
  systemd units.

  The unit artifact is <managed>/<id>.service and systemd sees it through a
  link at <unit_dir>/<id>.service. Stop keeps the unit enabled, so a stopped
  service comes back after a reboot.
*/
class ServiceBackend final : public Backend {
 public:
  ServiceBackend(process::CommandRunnerPtr runner, ui::PrompterPtr prompter, std::filesystem::path unit_dir);

  model::ProjectType Type() const override {
    return model::ProjectType::kService;
  }

  bool ConfirmsState() const override {
    return true;
  }

  model::OpResult     Install(const model::ProjectContext& ctx) override;
  model::OpResult     Start(const model::ProjectContext& ctx) override;
  model::OpResult     Stop(const model::ProjectContext& ctx) override;
  model::OpResult     Restart(const model::ProjectContext& ctx) override;
  model::RunningState Status(const model::ProjectContext& ctx) override;
  model::OpResult     Uninstall(const model::ProjectContext& ctx) override;
  model::OpResult     Logs(const model::ProjectContext& ctx, const model::LogRequest& request) override;
  model::OpResult     ShowDetails(const model::ProjectContext& ctx) override;

  std::optional<std::filesystem::path> Artifact(const model::ProjectContext& ctx) const override;

  std::filesystem::path UnitLink(const model::ProjectContext& ctx) const;

 private:
  std::filesystem::path ArtifactPath(const model::ProjectContext& ctx) const;

  // Artifact exists and the unit link resolves to it.
  bool Linked(const model::ProjectContext& ctx) const;

  model::OpResult Systemctl(const std::string& verb, const model::ProjectContext& ctx);
  bool            DaemonReload();

  process::CommandRunnerPtr runner_;
  ArtifactWizard            wizard_;
  std::filesystem::path     unit_dir_;
};

} // namespace projmgr::backend
