#include "credential_store.hpp"

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projmgr::git {

namespace fs = std::filesystem;

using observability::StringField;

namespace {

constexpr fs::perms kOwnerOnly = fs::perms::owner_read | fs::perms::owner_write;

std::string OctalMode(fs::perms perms) {
  std::ostringstream out;
  out << std::oct << (static_cast<unsigned>(perms) & 0777u);
  return out.str();
}

std::string TrimToken(std::string token) {
  while (!token.empty() && (token.back() == '\n' || token.back() == '\r' || token.back() == ' ')) {
    token.pop_back();
  }
  return token;
}

} // namespace

GlobalCredentialStore::GlobalCredentialStore(fs::path file, ui::PrompterPtr prompter)
    : file_(std::move(file)), prompter_(std::move(prompter)) {
}

void GlobalCredentialStore::Create(const std::string& token) {
  if (file_.has_parent_path()) {
    fs::create_directories(file_.parent_path());
  }
  // Restrict before the secret is written.
  { std::ofstream touch(file_, std::ios::app); }
  fs::permissions(file_, kOwnerOnly, fs::perm_options::replace);
  std::ofstream out(file_, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot write credential file " + file_.string());
  }
  out << token << '\n';
}

void GlobalCredentialStore::CheckPermissions(const model::RunOptions& options) {
  const auto mode = fs::status(file_).permissions() & fs::perms::mask;
  if (mode == kOwnerOnly) {
    return;
  }
  PROJMGR_LOG_WARN("Global credential file has incorrect permissions",
                   {StringField("file", file_.string()), StringField("mode", OctalMode(mode)), StringField("expected", "600")});
  if (options.Interactive() && prompter_->Confirm("Credential file permissions are " + OctalMode(mode) + " instead of 600. Fix now?")) {
    fs::permissions(file_, kOwnerOnly, fs::perm_options::replace);
  }
}

std::string GlobalCredentialStore::Read(const model::RunOptions& options) {
  std::error_code ec;
  const bool      missing = !fs::exists(file_, ec) || fs::file_size(file_, ec) == 0;
  if (missing) {
    if (!options.Interactive()) {
      throw util::InvalidState("No global credential stored. Please run once without -q to provide a global GitHub PAT.");
    }
    Create(TrimToken(prompter_->Ask("Enter your global GitHub PAT:")));
  } else {
    CheckPermissions(options);
  }

  std::ifstream in(file_);
  if (!in) {
    throw util::NotFound("cannot read credential file " + file_.string());
  }
  std::ostringstream content;
  content << in.rdbuf();
  auto token = TrimToken(content.str());
  if (token.empty()) {
    throw util::ValidationError("Please provide a global GitHub PAT or reconfigure the project to use a different authentication method!");
  }
  return token;
}

CredentialResolver::CredentialResolver(std::shared_ptr<GlobalCredentialStore> global, std::vector<std::string> trusted_hosts)
    : global_(std::move(global)), trusted_hosts_(std::move(trusted_hosts)) {
}

GitUrl CredentialResolver::Resolve(const model::ProjectRecord& record, const model::RunOptions& options) {
  auto url = GitUrl::Parse(record.repo_url);
  switch (record.auth) {
    case model::AuthMode::kNone:
      return url;
    case model::AuthMode::kGlobalCredential:
      if (!url.HostIn(trusted_hosts_)) {
        throw util::UntrustedHost("Credential authentication is configured, but '" + url.host() + "' is not a trusted host");
      }
      return GitUrl::WithCredential(url, global_->Read(options), trusted_hosts_);
    case model::AuthMode::kLocalCredential:
      return GitUrl::WithCredential(url, record.local_token, trusted_hosts_);
  }
  return url;
}

} // namespace projmgr::git
