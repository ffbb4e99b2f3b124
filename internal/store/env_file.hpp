#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace projmgr::store {

/*
  KEY=VALUE file that round-trips untouched lines.

  Text after '#' is a comment. Set() rewrites the first line carrying the key
  or appends one; every other line (unknown keys, comments, blanks) is written
  back verbatim.
*/
class EnvFile {
 public:
  static EnvFile Load(const std::filesystem::path& path);
  static EnvFile Empty();

  std::optional<std::string> Get(const std::string& key) const;
  std::string                GetOr(const std::string& key, const std::string& fallback) const;

  void Set(const std::string& key, const std::string& value);
  void Erase(const std::string& key);

  // Atomic replace (tmp + rename), then chmod 0600.
  void Save(const std::filesystem::path& path) const;

  const std::vector<std::string>& lines() const {
    return lines_;
  }

 private:
  static std::optional<std::string> KeyOf(const std::string& line);

  std::vector<std::string> lines_;
};

} // namespace projmgr::store
