#include "batch_runner.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::core {

using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& ids) {
  std::string joined;
  for (const auto& id : ids) {
    joined += (joined.empty() ? "" : " ") + id;
  }
  return joined;
}

std::string Upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

} // namespace

void Report(const model::OpResult& result) {
  if (result.message.empty()) {
    return;
  }
  switch (result.outcome) {
    case model::Outcome::kSuccess:
      PROJMGR_LOG_INFO(result.message);
      break;
    case model::Outcome::kRecoverable:
      PROJMGR_LOG_WARN(result.message);
      break;
    case model::Outcome::kFatal:
      PROJMGR_LOG_ERROR(result.message);
      break;
  }
}

BatchRunner::BatchRunner(std::shared_ptr<store::ProjectStore> store, ui::PrompterPtr prompter, std::ostream& out)
    : store_(std::move(store)), prompter_(std::move(prompter)), out_(out) {
}

Selection BatchRunner::Resolve(const std::string& argument, bool can_multiple) const {
  const auto selector = store::ProjectSelector::Parse(argument);
  Selection  selection;

  switch (selector.kind()) {
    case store::ProjectSelector::Kind::kAll:
      selection.ids = store_->List(selector);
      if (selection.ids.empty()) {
        throw util::NotFound("No projects found in " + store_->root().string() + ".");
      }
      if (!can_multiple) {
        throw util::ValidationError("Please specify a project name!");
      }
      selection.all      = true;
      selection.multiple = true;
      return selection;

    case store::ProjectSelector::Kind::kWildcard:
      selection.ids = store_->List(selector);
      if (selection.ids.empty()) {
        throw util::NotFound("No projects match pattern '" + argument + "'!");
      }
      if (selection.ids.size() > 1 && !can_multiple) {
        throw util::AmbiguousSelection("Pattern '" + argument + "' is ambiguous. Multiple matching projects: " + Join(selection.ids));
      }
      selection.multiple = selection.ids.size() > 1;
      return selection;

    case store::ProjectSelector::Kind::kExact:
      if (!store_->Exists(argument)) {
        throw util::NotFound("Project " + argument + " not found.");
      }
      selection.ids = {argument};
      return selection;
  }
  return selection;
}

bool BatchRunner::Confirm(const Selection& selection, const std::string& verb, const model::RunOptions& options) {
  if (!selection.multiple || verb.empty() || !options.Interactive() || options.force) {
    return true;
  }
  const auto count = std::to_string(selection.ids.size());
  out_ << "Found " << count << (selection.all ? " projects: " : " matching projects: ") << Join(selection.ids) << '\n';
  const auto question = selection.all ? "Are you sure you want to " + verb + " ALL " + count + " projects?"
                                      : "Are you sure you want to " + verb + " these " + count + " projects?";
  return prompter_->Confirm(question);
}

BatchReport BatchRunner::Run(const Selection& selection, const std::string& heading, const Action& action) {
  BatchReport report;
  const bool  single = !selection.multiple;

  bool first = true;
  for (const auto& id : selection.ids) {
    if (!heading.empty()) {
      if (!first) {
        out_ << "----------------------------------------\n";
      }
      out_ << "###   " << Upper(heading) << " for project:  " << id << "   ###\n";
    }
    first = false;

    bool ok = false;
    try {
      const auto result = action(id, single);
      Report(result);
      ok = static_cast<bool>(result);
    } catch (const std::exception& e) {
      PROJMGR_LOG_ERROR(e.what(), {StringField("project", id)});
    }
    (ok ? report.succeeded : report.failed).push_back(id);
  }
  return report;
}

} // namespace projmgr::core
