#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "internal/backend/artifact_templates.hpp"
#include "internal/backend/backend.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::backend {

struct DanglingImage {
  std::string reference;  // repository:tag as docker lists it
  std::string id;
};

/*
  docker compose projects.

  The compose artifact lives at <managed>/<id>.docker-compose.yml and every
  command runs with --project-directory <path>. Stop is `down`: containers are
  removed and do not come back after a reboot.
*/
class ContainerBackend final : public Backend {
 public:
  ContainerBackend(process::CommandRunnerPtr runner, ui::PrompterPtr prompter, std::string default_base_image);

  model::ProjectType Type() const override {
    return model::ProjectType::kContainer;
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

  // Image names of the resolved compose configuration, in declaration order.
  // Throws util::ExternalToolError.
  std::vector<std::string> Images(const model::ProjectContext& ctx);

  // Pulls one image. Returns true when a newer image was downloaded.
  // Throws util::ExternalToolError.
  bool PullImage(const std::string& image);

  std::vector<DanglingImage> DanglingImages(const std::string& image);

  model::OpResult RemoveImages(const std::vector<std::string>& ids);

  // Service names declared by the compose file.
  std::vector<std::string> Services(const model::ProjectContext& ctx);

  model::OpResult Shell(const model::ProjectContext& ctx, const std::string& service);

 private:
  std::filesystem::path ArtifactPath(const model::ProjectContext& ctx) const;
  process::Command      Compose(const model::ProjectContext& ctx, std::initializer_list<std::string> args) const;
  std::string           Regenerate(const model::ProjectContext& ctx) const;

  process::CommandRunnerPtr runner_;
  ui::PrompterPtr           prompter_;
  ArtifactWizard            wizard_;
  std::string               default_base_image_;
};

// "registry:5000/app:1.2" -> "registry:5000/app"
std::string ImageRepository(const std::string& image);

} // namespace projmgr::backend
