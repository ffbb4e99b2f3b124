#include "project_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/env_file.hpp"
#include "internal/store/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::store {

namespace {

constexpr char kEnabled[]      = "ENABLED";
constexpr char kRepoUrl[]      = "REPO_URL";
constexpr char kSubDir[]       = "SUBDIR";
constexpr char kUseGlobalPat[] = "USE_GLOBAL_PAT";
constexpr char kLocalPat[]     = "LOCAL_PAT";
constexpr char kPath[]         = "PATH";
constexpr char kType[]         = "TYPE";

// Anything but a literal "true" is false.
bool ParseBool(const std::optional<std::string>& value) {
  return value && *value == "true";
}

} // namespace

ProjectStore::ProjectStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

bool ProjectStore::Exists(const std::string& id) const {
  return model::IsValidProjectId(id) && std::filesystem::is_regular_file(RecordPath(root_, id));
}

model::ProjectRecord ProjectStore::FromEnv(const std::string& id, const EnvFile& env) {
  model::ProjectRecord record;
  record.id       = id;
  record.enabled  = ParseBool(env.Get(kEnabled));
  record.type_tag = env.GetOr(kType, "");
  record.type     = model::ParseProjectType(record.type_tag);
  record.repo_url = env.GetOr(kRepoUrl, "");

  auto sub_path = env.GetOr(kSubDir, "");
  if (!sub_path.empty()) {
    record.sub_path = std::move(sub_path);
  }

  record.local_token = env.GetOr(kLocalPat, "");
  if (ParseBool(env.Get(kUseGlobalPat))) {
    record.auth = model::AuthMode::kGlobalCredential;
  } else if (!record.local_token.empty()) {
    record.auth = model::AuthMode::kLocalCredential;
  } else {
    record.auth = model::AuthMode::kNone;
  }

  record.path = env.GetOr(kPath, "");
  return record;
}

void ProjectStore::ToEnv(const model::ProjectRecord& record, EnvFile* env) {
  env->Set(kEnabled, record.enabled ? "true" : "false");
  env->Set(kRepoUrl, record.repo_url);
  if (record.sub_path) {
    env->Set(kSubDir, *record.sub_path);
  } else {
    env->Erase(kSubDir);
  }
  env->Set(kUseGlobalPat, record.auth == model::AuthMode::kGlobalCredential ? "true" : "false");
  env->Set(kLocalPat, record.auth == model::AuthMode::kLocalCredential ? record.local_token : "");
  env->Set(kPath, record.path.string());
  // Unknown tags are written back as found.
  env->Set(kType, record.type == model::ProjectType::kUnknown ? record.type_tag : std::string(model::ToTag(record.type)));
}

std::optional<model::ProjectRecord> ProjectStore::Find(const std::string& id) const {
  if (!Exists(id)) {
    return std::nullopt;
  }
  return FromEnv(id, EnvFile::Load(RecordPath(root_, id)));
}

model::ProjectRecord ProjectStore::Load(const std::string& id) const {
  auto record = Find(id);
  if (!record) {
    throw util::NotFound("Project " + id + " not found.");
  }
  return *record;
}

void ProjectStore::Save(const model::ProjectRecord& record) {
  const auto path = RecordPath(root_, record.id);
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound("Project " + record.id + " not found.");
  }
  auto env = EnvFile::Load(path);
  ToEnv(record, &env);
  env.Save(path);
}

void ProjectStore::SetEnabled(const std::string& id, bool enabled) {
  const auto path = RecordPath(root_, id);
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound("Project " + id + " not found.");
  }
  auto env = EnvFile::Load(path);
  env.Set(kEnabled, enabled ? "true" : "false");
  env.Save(path);
}

std::vector<std::string> ProjectStore::List(const ProjectSelector& selector) const {
  std::vector<std::string> ids;
  if (!std::filesystem::is_directory(root_)) {
    return ids;
  }
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (!entry.is_regular_file() || entry.path().extension() != kRecordSuffix) {
      continue;
    }
    auto id = entry.path().stem().string();
    if (!model::IsValidProjectId(id)) {
      PROJMGR_LOG_DEBUG("ignoring record with invalid name", {observability::StringField("file", entry.path().string())});
      continue;
    }
    if (selector.Matches(id)) {
      ids.push_back(std::move(id));
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

model::ProjectRecord ProjectStore::Create(model::ProjectRecord record) {
  ValidateProjectId(record.id);
  if (record.type == model::ProjectType::kUnknown) {
    throw util::ValidationError("Invalid type '" + record.type_tag + "' (docker/service/scripts)");
  }
  const auto path = RecordPath(root_, record.id);
  if (std::filesystem::exists(path)) {
    throw util::AlreadyExists("Project " + record.id + " already exists.");
  }

  record.enabled = false;
  auto env       = EnvFile::Empty();
  ToEnv(record, &env);
  env.Save(path);
  return record;
}

void ProjectStore::Delete(const std::string& id) {
  auto record = Load(id);
  if (record.enabled) {
    throw util::InvalidState("Project " + id + " is enabled, please disable it first.");
  }

  // The record goes last so a failed removal leaves it pointing at what remains.
  const auto compose = ComposeArtifactPath(root_, id);
  for (const auto& path : {compose, BackupPath(compose, 1), BackupPath(compose, 2), ServiceArtifactPath(root_, id), RecordPath(root_, id)}) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      throw std::runtime_error("failed to remove " + path.string() + ": " + ec.message());
    }
  }
}

} // namespace projmgr::store
