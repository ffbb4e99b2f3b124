#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/ui/prompter.hpp"

namespace projmgr::backend {

// First line of every compose file we author. Its presence allows image removal on uninstall.
inline constexpr std::string_view kComposeGenerationMarker = "# Auto-generated by projmgr, will remove images on uninstall";
inline constexpr std::string_view kUnitGenerationMarker    = "# Auto-generated by projmgr";

struct DockerfileDeclarations {
  std::vector<std::string> ports;        // "8700" or "8700:8700"
  std::vector<std::string> environment;  // "KEY=value"
};

// EXPOSE and ENV instructions of a Dockerfile.
DockerfileDeclarations ParseDockerfile(std::string_view dockerfile);

// Deterministic: same inputs, same bytes. Uninstall relies on that.
std::string SynthesizeCompose(const std::string& project_id, const std::filesystem::path& project_path, std::string_view dockerfile);

bool HasGenerationMarker(const std::filesystem::path& artifact, std::string_view marker);

/*
  Interactive authoring of missing artifacts. Each returns nullopt when the
  operator declines.
*/
class ArtifactWizard {
 public:
  explicit ArtifactWizard(ui::PrompterPtr prompter);

  std::optional<std::string> Dockerfile(const std::filesystem::path& project_path, const std::string& base_image);

  std::optional<std::string> UnitFile(const std::string& project_id, const std::filesystem::path& project_path);

 private:
  std::vector<std::string> AskEnvironment();

  ui::PrompterPtr prompter_;
};

} // namespace projmgr::backend
