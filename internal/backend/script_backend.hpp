#pragma once

#include "internal/backend/backend.hpp"
#include "internal/backend/script_runner.hpp"

namespace projmgr::backend {

/*
  Projects driven entirely by their own scripts (start.sh, stop.sh, ...).
  There is no way to observe the running state, so Status is always Unknown.
*/
class ScriptBackend final : public Backend {
 public:
  explicit ScriptBackend(std::shared_ptr<ScriptRunner> scripts);

  model::ProjectType Type() const override {
    return model::ProjectType::kScripts;
  }

  bool ConfirmsState() const override {
    return false;
  }

  model::OpResult     Install(const model::ProjectContext& ctx) override;
  model::OpResult     Start(const model::ProjectContext& ctx) override;
  model::OpResult     Stop(const model::ProjectContext& ctx) override;
  model::OpResult     Restart(const model::ProjectContext& ctx) override;
  model::RunningState Status(const model::ProjectContext& ctx) override;
  model::OpResult     Uninstall(const model::ProjectContext& ctx) override;
  model::OpResult     Logs(const model::ProjectContext& ctx, const model::LogRequest& request) override;
  model::OpResult     ShowDetails(const model::ProjectContext& ctx) override;

 private:
  std::shared_ptr<ScriptRunner> scripts_;
};

} // namespace projmgr::backend
