#include "artifact_selector.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/path_utils.hpp"

namespace projmgr::backend {

using observability::StringField;

namespace {

bool IsSymlink(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec));
}

void RemoveIfPresent(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw std::runtime_error("failed to remove " + path.string() + ": " + ec.message());
  }
}

} // namespace

bool ArtifactSelector::IsRegularNonLink(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(std::filesystem::symlink_status(path, ec));
}

bool ArtifactSelector::Resolves(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

bool ArtifactSelector::SameFile(const std::filesystem::path& a, const std::filesystem::path& b) {
  std::error_code ec;
  const bool      same = std::filesystem::equivalent(a, b, ec);
  return !ec && same;
}

std::optional<std::string> ArtifactSelector::ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

bool ArtifactSelector::EnsureSymlink(const std::filesystem::path& link, const std::filesystem::path& target) {
  if (IsSymlink(link)) {
    std::error_code ec;
    const auto      current = std::filesystem::read_symlink(link, ec);
    if (!ec && current == target) {
      return false;
    }
  }
  if (std::filesystem::exists(std::filesystem::symlink_status(link)) && !IsSymlink(link)) {
    throw std::runtime_error("refusing to replace regular file " + link.string() + " with a link");
  }
  RemoveIfPresent(link);
  std::filesystem::create_directories(link.parent_path());
  std::filesystem::create_symlink(target, link);
  return true;
}

std::optional<ArtifactSelection> ArtifactSelector::SelectExisting(const ArtifactCandidates& candidates) {
  // 1. A regular file placed in the managed dir wins and is never touched.
  if (IsRegularNonLink(candidates.managed)) {
    PROJMGR_LOG_INFO("Using artifact", {StringField("file", candidates.managed.string())});
    return ArtifactSelection{candidates.managed, ArtifactSource::kManagedFile, false};
  }

  // 2./3. Project-provided files, linked into the managed dir.
  const std::pair<std::filesystem::path, ArtifactSource> project_files[] = {
      {candidates.conventional, ArtifactSource::kConventional},
      {candidates.fallback, ArtifactSource::kFallback},
  };
  for (const auto& [file, source] : project_files) {
    if (file.empty() || !Resolves(file)) {
      continue;
    }
    const auto target  = std::filesystem::absolute(file);
    const bool changed = EnsureSymlink(candidates.managed, target);
    PROJMGR_LOG_INFO(changed ? "Linking artifact" : "Keeping linked artifact", {StringField("file", target.string())});
    return ArtifactSelection{candidates.managed, source, changed};
  }

  // 4. A link left from an earlier install that still points somewhere valid.
  if (IsSymlink(candidates.managed) && Resolves(candidates.managed)) {
    PROJMGR_LOG_INFO("Keeping linked artifact",
                     {StringField("file", std::filesystem::canonical(candidates.managed).string())});
    return ArtifactSelection{candidates.managed, ArtifactSource::kExistingLink, false};
  }

  return std::nullopt;
}

void ArtifactSelector::WriteRegularFile(const std::filesystem::path& path, const std::string& content) {
  if (IsSymlink(path)) {
    RemoveIfPresent(path);
  }
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot write " + path.string());
  }
  out << content;
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing " + path.string());
  }
}

RetireOutcome ArtifactSelector::Retire(const std::filesystem::path& artifact, const std::string& regenerated) {
  if (!std::filesystem::exists(std::filesystem::symlink_status(artifact))) {
    return RetireOutcome::kAbsent;
  }

  const auto current = ReadFile(artifact);
  if (current && *current == regenerated) {
    RemoveIfPresent(artifact);
    return RetireOutcome::kDeleted;
  }

  const auto bak  = store::BackupPath(artifact, 1);
  const auto bak2 = store::BackupPath(artifact, 2);
  if (std::filesystem::exists(std::filesystem::symlink_status(bak))) {
    RemoveIfPresent(bak2);
    std::filesystem::rename(bak, bak2);
  }
  std::filesystem::rename(artifact, bak);
  PROJMGR_LOG_INFO("Created backup of artifact", {StringField("backup", bak.string())});
  return RetireOutcome::kBackedUp;
}

} // namespace projmgr::backend
