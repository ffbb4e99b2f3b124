#include "backend_factory.hpp"

#include "container_backend.hpp"
#include "script_backend.hpp"
#include "service_backend.hpp"

namespace projmgr::backend {

BackendFactory::BackendMap BackendFactory::Build(const projmgr::runtime::config::ManagerConfig& cfg, process::CommandRunnerPtr runner,
                                                 ui::PrompterPtr prompter) {
  BackendMap backends;

  backends.emplace(model::ProjectType::kContainer,
                   std::make_shared<ContainerBackend>(runner, prompter, cfg.container().default_base_image()));

  std::filesystem::path unit_dir =
      cfg.service().unit_dir().empty() ? std::filesystem::path{"/etc/systemd/system"} : std::filesystem::path{cfg.service().unit_dir()};
  backends.emplace(model::ProjectType::kService, std::make_shared<ServiceBackend>(runner, prompter, std::move(unit_dir)));

  backends.emplace(model::ProjectType::kScripts, std::make_shared<ScriptBackend>(std::make_shared<ScriptRunner>(runner, prompter)));

  return backends;
}

} // namespace projmgr::backend
