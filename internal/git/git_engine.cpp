#include "git_engine.hpp"

#include <charconv>

#include "internal/observability/logging.hpp"

namespace projmgr::git {

using model::OpResult;
using observability::StringField;

namespace {

std::string FirstLine(const std::string& output) {
  auto line = output.substr(0, output.find('\n'));
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
    line.pop_back();
  }
  return line;
}

// "origin/main" -> {"origin", "main"}
std::pair<std::string, std::string> SplitUpstream(const std::string& upstream) {
  const auto slash = upstream.find('/');
  if (slash == std::string::npos) {
    return {upstream, {}};
  }
  return {upstream.substr(0, slash), upstream.substr(slash + 1)};
}

std::optional<std::uint32_t> ParseCount(const std::string& text) {
  std::uint32_t value = 0;
  const auto*   end   = text.data() + text.size();
  auto [ptr, ec]      = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

bool IsEmptyDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec) && std::filesystem::is_empty(path, ec);
}

} // namespace

GitEngine::GitEngine(process::CommandRunnerPtr runner) : runner_(std::move(runner)) {
}

process::CommandResult GitEngine::Git(const std::filesystem::path& gitpath, std::initializer_list<std::string> args) {
  process::Command command{{"git", "-C", gitpath.string()}, {}};
  command.argv.insert(command.argv.end(), args.begin(), args.end());
  return runner_->Capture(command);
}

bool GitEngine::IsWorkingCopy(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return false;
  }
  return Git(path, {"rev-parse", "--is-inside-work-tree"}).Succeeded();
}

OpResult GitEngine::CloneOrVerify(const std::filesystem::path& gitpath, const GitUrl& url) {
  std::error_code ec;
  if (!std::filesystem::exists(gitpath, ec) || IsEmptyDirectory(gitpath)) {
    PROJMGR_LOG_INFO("Cloning repository", {StringField("url", url.Redacted()), StringField("into", gitpath.string())});
    if (gitpath.has_parent_path()) {
      std::filesystem::create_directories(gitpath.parent_path());
    }
    const int exit_code = runner_->Passthrough(process::Command{{"git", "clone", url.ToString(), gitpath.string()}, {}});
    if (exit_code != 0) {
      return OpResult::Fatal("Clone failed. Check credentials and repository access.");
    }
    return OpResult::Ok();
  }
  if (!IsWorkingCopy(gitpath)) {
    return OpResult::Fatal("Directory " + gitpath.string() + " exists but is not a git repository.");
  }
  return OpResult::Ok();
}

UpstreamComparison GitEngine::CompareUpstream(const std::filesystem::path& gitpath) {
  const auto upstream = Git(gitpath, {"rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"});
  if (!upstream.Succeeded()) {
    return {UpstreamStatus::kNoUpstream, std::nullopt, "No upstream configured"};
  }
  const auto [remote, branch] = SplitUpstream(FirstLine(upstream.output));

  const auto remote_head = Git(gitpath, {"ls-remote", "--refs", "-q", remote, "refs/heads/" + branch});
  if (!remote_head.Succeeded()) {
    return {UpstreamStatus::kError, std::nullopt, "Failed to get upstream commit"};
  }
  const auto line          = FirstLine(remote_head.output);
  const auto remote_commit = line.substr(0, line.find_first_of(" \t"));
  if (remote_commit.empty()) {
    return {UpstreamStatus::kError, std::nullopt, "No upstream commit found"};
  }

  const auto local = Git(gitpath, {"rev-parse", "HEAD"});
  if (!local.Succeeded()) {
    return {UpstreamStatus::kError, std::nullopt, "Failed to resolve HEAD"};
  }
  if (FirstLine(local.output) == remote_commit) {
    return {UpstreamStatus::kUpToDate, 0, {}};
  }

  // Without fetching, the count is only available when the commit is already here.
  const auto count = Git(gitpath, {"rev-list", "--count", "HEAD.." + remote_commit});
  return {UpstreamStatus::kBehind, count.Succeeded() ? ParseCount(FirstLine(count.output)) : std::nullopt, {}};
}

PullResult GitEngine::Pull(const std::filesystem::path& gitpath, const std::optional<GitUrl>& url) {
  PullResult result;

  const auto fetch = Git(gitpath, {"fetch", "--quiet"});
  if (!fetch.Succeeded()) {
    result.detail = "Failed to fetch upstream: " + fetch.output;
    return result;
  }

  result.old_hash    = FirstLine(Git(gitpath, {"rev-parse", "--short", "HEAD"}).output);
  const auto branch  = FirstLine(Git(gitpath, {"rev-parse", "--abbrev-ref", "HEAD"}).output);
  const auto tracked = Git(gitpath, {"rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"});
  if (!tracked.Succeeded()) {
    result.detail = "No upstream configured";
    return result;
  }
  const auto upstream = FirstLine(tracked.output);

  const auto count = Git(gitpath, {"rev-list", "--count", branch + ".." + upstream});
  if (!count.Succeeded()) {
    result.detail = "Failed to get commit count";
    return result;
  }
  const auto behind = ParseCount(FirstLine(count.output));
  if (!behind) {
    result.detail = "Invalid commit count returned by git (" + FirstLine(count.output) + ")";
    return result;
  }
  result.behind = *behind;

  if (*behind == 0) {
    result.status   = PullStatus::kUpToDate;
    result.new_hash = result.old_hash;
    return result;
  }

  process::Command pull{{"git", "-C", gitpath.string(), "pull"}, {}};
  if (url) {
    pull.argv.push_back(url->ToString());
    pull.argv.push_back(SplitUpstream(upstream).second);
  }
  const auto pulled = runner_->Capture(pull);
  if (!pulled.Succeeded()) {
    result.detail = "Update failed with exit code " + std::to_string(pulled.exit_code) + ": " + pulled.output;
    return result;
  }

  result.new_hash = FirstLine(Git(gitpath, {"rev-parse", "--short", "HEAD"}).output);
  result.status   = PullStatus::kUpdated;
  return result;
}

} // namespace projmgr::git
