#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/git/git_url.hpp"
#include "internal/model/project_context.hpp"
#include "internal/ui/prompter.hpp"

namespace projmgr::git {

/*
  The single process-wide token, kept in one file with mode 0600.

  Read per operation and never cached. A missing file is created from an
  interactive prompt; wrong permissions are warned about and, after
  confirmation, corrected.
*/
class GlobalCredentialStore {
 public:
  GlobalCredentialStore(std::filesystem::path file, ui::PrompterPtr prompter);

  const std::filesystem::path& file() const {
    return file_;
  }

  /*
    Throws util::InvalidState when the file is missing under quiet mode and
    util::ValidationError when the stored token is empty.
  */
  std::string Read(const model::RunOptions& options);

 private:
  void CheckPermissions(const model::RunOptions& options);
  void Create(const std::string& token);

  std::filesystem::path file_;
  ui::PrompterPtr       prompter_;
};

// Builds the URL git should use for a project, embedding its credential when it has one.
class CredentialResolver {
 public:
  CredentialResolver(std::shared_ptr<GlobalCredentialStore> global, std::vector<std::string> trusted_hosts);

  // Fails closed: throws util::UntrustedHost before any credential is read.
  GitUrl Resolve(const model::ProjectRecord& record, const model::RunOptions& options);

 private:
  std::shared_ptr<GlobalCredentialStore> global_;
  std::vector<std::string>               trusted_hosts_;
};

} // namespace projmgr::git
