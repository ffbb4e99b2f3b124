#pragma once

#include <memory>
#include <unordered_map>

#include "backend.hpp"
#include "config/config.pb.h"
#include "internal/process/command_runner.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::backend {

/*
  Builds one driver per supported project type from configuration.

  The orchestrator uses this as:

      auto backends = BackendFactory::Build(config, runner, prompter);
      backends.at(record.type)->Start(ctx);

  kUnknown never has an entry.
*/

class BackendFactory {
 public:
  using BackendMap = std::unordered_map<model::ProjectType, BackendPtr>;

  static BackendMap Build(const projmgr::runtime::config::ManagerConfig& cfg, process::CommandRunnerPtr runner,
                          ui::PrompterPtr prompter);
};

} // namespace projmgr::backend
