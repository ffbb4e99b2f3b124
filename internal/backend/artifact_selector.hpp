#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace projmgr::backend {

/*
  Where a compose file or unit file may come from, in priority order.
*/
struct ArtifactCandidates {
  std::filesystem::path managed;       // <managed>/<id>.<ext>, regular file or symlink
  std::filesystem::path conventional;  // conventional name inside the project path
  std::filesystem::path fallback;      // default-named file inside the project path
};

enum class ArtifactSource {
  kManagedFile,   // authoritative regular file, never overwritten
  kConventional,  // linked from the project path
  kFallback,      // linked from the project path
  kExistingLink,  // managed symlink that still resolves
  kSynthesized,   // written by us from project sources
  kGenerated,     // written by us from interactive answers
};

struct ArtifactSelection {
  std::filesystem::path path;
  ArtifactSource        source;
  bool                  changed = false;  // a link was created or repaired
};

enum class RetireOutcome {
  kAbsent,
  kDeleted,   // content matched the regeneration byte for byte
  kBackedUp,  // rotated into .bak, previous .bak moved to .bak2
};

class ArtifactSelector {
 public:
  /*
    Steps 1-4 of the selection order. Links the managed path to a project file
    when one is found; a link already pointing there is left alone.
    nullopt when the caller must synthesize or generate.
  */
  static std::optional<ArtifactSelection> SelectExisting(const ArtifactCandidates& candidates);

  // Returns true when the link had to be created or repaired.
  static bool EnsureSymlink(const std::filesystem::path& link, const std::filesystem::path& target);

  // Replaces whatever is at `path` (typically a dangling link) with a regular file.
  static void WriteRegularFile(const std::filesystem::path& path, const std::string& content);

  /*
    Removes a generated artifact. Identical content is deleted outright;
    anything else is kept as .bak, with the old .bak moved to .bak2 and the
    old .bak2 discarded.
  */
  static RetireOutcome Retire(const std::filesystem::path& artifact, const std::string& regenerated);

  static bool IsRegularNonLink(const std::filesystem::path& path);

  // Exists and, following links, is a regular file.
  static bool Resolves(const std::filesystem::path& path);

  static std::optional<std::string> ReadFile(const std::filesystem::path& path);

  // Both resolve to the same file.
  static bool SameFile(const std::filesystem::path& a, const std::filesystem::path& b);
};

} // namespace projmgr::backend
