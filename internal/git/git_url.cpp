#include "git_url.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace projmgr::git {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Host without ":port".
std::string HostName(const std::string& host) {
  const auto colon = host.find(':');
  return colon == std::string::npos ? host : host.substr(0, colon);
}

} // namespace

GitUrl GitUrl::Parse(const std::string& url) {
  if (url.empty()) {
    throw util::ValidationError("Repository URL is empty");
  }

  GitUrl parsed;
  const auto scheme_end = url.find("://");
  if (scheme_end != std::string::npos) {
    parsed.scheme_        = Lower(url.substr(0, scheme_end));
    const auto authority  = scheme_end + 3;
    const auto path_start = url.find('/', authority);
    auto       host_part  = url.substr(authority, path_start == std::string::npos ? std::string::npos : path_start - authority);
    parsed.rest_          = path_start == std::string::npos ? std::string() : url.substr(path_start);

    const auto at = host_part.rfind('@');
    if (at != std::string::npos) {
      parsed.credential_ = host_part.substr(0, at);
      host_part          = host_part.substr(at + 1);
    }
    parsed.host_ = host_part;
    return parsed;
  }

  // user@host:path, but not a local path that happens to contain ':' after a '/'.
  const auto colon = url.find(':');
  const auto slash = url.find('/');
  if (colon != std::string::npos && colon > 0 && (slash == std::string::npos || colon < slash)) {
    parsed.scp_like_ = true;
    auto       host_part = url.substr(0, colon);
    const auto at        = host_part.rfind('@');
    if (at != std::string::npos) {
      parsed.credential_ = host_part.substr(0, at);
      host_part          = host_part.substr(at + 1);
    }
    parsed.host_ = host_part;
    parsed.rest_ = url.substr(colon);
    return parsed;
  }

  parsed.rest_ = url;
  return parsed;
}

bool GitUrl::HostIn(const std::vector<std::string>& trusted_hosts) const {
  if (host_.empty()) {
    return false;
  }
  const auto name = Lower(HostName(host_));
  return std::any_of(trusted_hosts.begin(), trusted_hosts.end(), [&](const std::string& trusted) { return Lower(trusted) == name; });
}

GitUrl GitUrl::WithCredential(const GitUrl& url, const std::string& token, const std::vector<std::string>& trusted_hosts) {
  if (url.scheme_ != "https" && url.scheme_ != "http") {
    throw util::UntrustedHost("Credentials can only be used with http(s) repository URLs, got '" + url.Redacted() + "'");
  }
  if (!url.HostIn(trusted_hosts)) {
    throw util::UntrustedHost("Credential authentication is configured, but '" + url.host_ + "' is not a trusted host");
  }
  if (token.empty()) {
    throw util::ValidationError("Credential for " + url.host_ + " is empty");
  }
  GitUrl credentialed      = url;
  credentialed.credential_ = token;
  return credentialed;
}

std::string GitUrl::Render(const std::string& credential) const {
  if (scheme_.empty() && !scp_like_) {
    return rest_;
  }
  std::string out;
  if (!scheme_.empty()) {
    out = scheme_ + "://";
  }
  if (!credential.empty()) {
    out += credential + "@";
  }
  return out + host_ + rest_;
}

std::string GitUrl::ToString() const {
  return Render(credential_);
}

std::string GitUrl::Redacted() const {
  // scp-like user names ("git@") are not secrets.
  if (scp_like_) {
    return ToString();
  }
  return Render(credential_.empty() ? std::string() : "***");
}

} // namespace projmgr::git
