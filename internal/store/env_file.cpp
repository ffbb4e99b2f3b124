#include "env_file.hpp"

#include <fstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace projmgr::store {

namespace {

std::string TrimRight(std::string value) {
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
    value.pop_back();
  }
  return value;
}

} // namespace

EnvFile EnvFile::Load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("cannot read " + path.string());
  }
  EnvFile     file;
  std::string line;
  while (std::getline(in, line)) {
    file.lines_.push_back(line);
  }
  return file;
}

EnvFile EnvFile::Empty() {
  return {};
}

std::optional<std::string> EnvFile::KeyOf(const std::string& line) {
  const auto eq = line.find('=');
  if (eq == std::string::npos || eq == 0 || line[0] == '#') {
    return std::nullopt;
  }
  return line.substr(0, eq);
}

std::optional<std::string> EnvFile::Get(const std::string& key) const {
  for (const auto& line : lines_) {
    auto line_key = KeyOf(line);
    if (!line_key || *line_key != key) {
      continue;
    }
    auto value         = line.substr(key.size() + 1);
    const auto comment = value.find('#');
    if (comment != std::string::npos) {
      value.erase(comment);
    }
    return TrimRight(std::move(value));
  }
  return std::nullopt;
}

std::string EnvFile::GetOr(const std::string& key, const std::string& fallback) const {
  auto value = Get(key);
  return value ? *value : fallback;
}

void EnvFile::Set(const std::string& key, const std::string& value) {
  if (value.find('\n') != std::string::npos || value.find('#') != std::string::npos) {
    throw util::ValidationError("value for " + key + " must not contain '#' or newlines");
  }
  for (auto& line : lines_) {
    auto line_key = KeyOf(line);
    if (line_key && *line_key == key) {
      line = key + "=" + value;
      return;
    }
  }
  lines_.push_back(key + "=" + value);
}

void EnvFile::Erase(const std::string& key) {
  std::vector<std::string> kept;
  kept.reserve(lines_.size());
  for (auto& line : lines_) {
    auto line_key = KeyOf(line);
    if (line_key && *line_key == key) {
      continue;
    }
    kept.push_back(std::move(line));
  }
  lines_ = std::move(kept);
}

void EnvFile::Save(const std::filesystem::path& path) const {
  const auto tmp_path = std::filesystem::path(path.string() + ".tmp");
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write " + tmp_path.string());
    }
    // Tighten before any content lands.
    std::filesystem::permissions(tmp_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace);
    for (const auto& line : lines_) {
      out << line << '\n';
    }
    out.flush();
    if (!out) {
      throw std::runtime_error("failed writing " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, path);
  std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace);
}

} // namespace projmgr::store
