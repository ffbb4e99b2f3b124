#include "project_record.hpp"

namespace projmgr::model {

std::string_view ToTag(ProjectType type) {
  switch (type) {
    case ProjectType::kContainer:
      return "docker";
    case ProjectType::kService:
      return "service";
    case ProjectType::kScripts:
      return "scripts";
    case ProjectType::kUnknown:
      return "unknown";
  }
  return "unknown";
}

ProjectType ParseProjectType(std::string_view tag) {
  if (tag == "docker") {
    return ProjectType::kContainer;
  }
  if (tag == "service") {
    return ProjectType::kService;
  }
  if (tag == "scripts") {
    return ProjectType::kScripts;
  }
  return ProjectType::kUnknown;
}

std::string_view ToString(AuthMode mode) {
  switch (mode) {
    case AuthMode::kNone:
      return "Public repository or globally configured";
    case AuthMode::kGlobalCredential:
      return "Using global PAT";
    case AuthMode::kLocalCredential:
      return "Using project-specific PAT";
  }
  return "unknown";
}

bool IsValidProjectId(std::string_view id) {
  if (id.empty()) {
    return false;
  }
  const char first = id.front();
  if (!((first >= 'a' && first <= 'z') || first == '_')) {
    return false;
  }
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace projmgr::model
