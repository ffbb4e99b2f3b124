#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace projmgr::model {

enum class ProjectType : std::uint8_t {
  kContainer = 0,
  kService   = 1,
  kScripts   = 2,
  // Unrecognized tag. Every lifecycle operation except removal refuses it.
  kUnknown   = 3,
};

enum class AuthMode : std::uint8_t {
  kNone             = 0,
  kGlobalCredential = 1,
  kLocalCredential  = 2,
};

/*
  Persistent project record.

  IMPORTANT:
  - id is immutable once created and is the record's file name.
  - enabled is the only lifecycle state that is persisted.
  - local_token is a secret; the record file is kept at mode 0600.
*/
struct ProjectRecord {
  std::string id;
  bool        enabled = false;

  ProjectType type = ProjectType::kUnknown;
  std::string type_tag;  // raw tag as stored, kept for messages about unknown types

  std::string                repo_url;
  std::optional<std::string> sub_path;

  AuthMode    auth = AuthMode::kNone;
  std::string local_token;  // only meaningful for kLocalCredential

  std::filesystem::path path;
};

// "docker" / "service" / "scripts".
std::string_view ToTag(ProjectType type);
ProjectType      ParseProjectType(std::string_view tag);

std::string_view ToString(AuthMode mode);

// ^[a-z_][a-z0-9_]*$
bool IsValidProjectId(std::string_view id);

} // namespace projmgr::model
