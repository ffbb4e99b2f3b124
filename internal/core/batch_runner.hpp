#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "internal/model/op_result.hpp"
#include "internal/model/project_context.hpp"
#include "internal/store/project_store.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::core {

struct Selection {
  std::vector<std::string> ids;       // listing order
  bool                     all      = false;
  bool                     multiple = false;
};

struct BatchReport {
  std::vector<std::string> succeeded;
  std::vector<std::string> failed;

  bool Ok() const {
    return failed.empty();
  }
};

/*
  Turns the name argument into targets and runs one command over them.

  Targets run strictly one after another in listing order. A failing target
  (non-success result or exception) is recorded and the next one still runs.
*/
class BatchRunner {
 public:
  using Action = std::function<model::OpResult(const std::string& id, bool single)>;

  BatchRunner(std::shared_ptr<store::ProjectStore> store, ui::PrompterPtr prompter, std::ostream& out);

  /*
    ""          every project, NotFound when there is none
    "a+"        matching projects; one match behaves like a literal
    "alpha"     must exist

    Throws util::NotFound, util::ValidationError (all projects for a
    single-target command) or util::AmbiguousSelection.
  */
  Selection Resolve(const std::string& argument, bool can_multiple) const;

  // false when the operator declined. Single targets and an empty verb never ask.
  bool Confirm(const Selection& selection, const std::string& verb, const model::RunOptions& options);

  // `heading` empty prints no per-target header.
  BatchReport Run(const Selection& selection, const std::string& heading, const Action& action);

 private:
  std::shared_ptr<store::ProjectStore> store_;
  ui::PrompterPtr                      prompter_;
  std::ostream&                        out_;
};

// Logs the result at a level matching its outcome.
void Report(const model::OpResult& result);

} // namespace projmgr::core
