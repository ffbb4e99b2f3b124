#pragma once

#include <string>
#include <vector>

namespace projmgr::git {

/*
  Remote repository location.

  Accepts scheme URLs (https://host/owner/repo.git), scp-like remotes
  (git@host:owner/repo.git) and local paths. A token can only be embedded
  through WithCredential, which checks the host against an allow-list first.
*/
class GitUrl {
 public:
  // Throws util::ValidationError on an empty string.
  static GitUrl Parse(const std::string& url);

  /*
    https://TOKEN@host/... for a trusted http(s) host.
    Throws util::UntrustedHost otherwise.
  */
  static GitUrl WithCredential(const GitUrl& url, const std::string& token, const std::vector<std::string>& trusted_hosts);

  const std::string& scheme() const {
    return scheme_;
  }

  const std::string& host() const {
    return host_;
  }

  bool HasCredential() const {
    return !credential_.empty();
  }

  // Case-insensitive host comparison.
  bool HostIn(const std::vector<std::string>& trusted_hosts) const;

  // Full URL as handed to git, including any credential.
  std::string ToString() const;

  // Same as ToString with the credential masked; safe for logs.
  std::string Redacted() const;

 private:
  GitUrl() = default;

  std::string Render(const std::string& credential) const;

  std::string scheme_;      // "https", "ssh", ... empty for scp-like and local
  std::string credential_;  // userinfo without the trailing '@'
  std::string host_;        // may carry ":port" for scheme URLs
  std::string rest_;        // "/owner/repo.git", or ":owner/repo.git" for scp-like, or the local path
  bool        scp_like_ = false;
};

} // namespace projmgr::git
