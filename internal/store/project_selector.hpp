#pragma once

#include <string>
#include <string_view>

namespace projmgr::store {

inline constexpr char kWildcardMarker = '+';

/*
  Which records a name argument refers to.

    ""          -> every project
    "alpha+"    -> wildcard, '+' matches any sequence (including empty)
    "alpha"     -> exactly that id

  There is no escape for a literal '+'; ids cannot contain one.
*/
class ProjectSelector {
 public:
  enum class Kind {
    kAll,
    kExact,
    kWildcard,
  };

  static ProjectSelector All();
  static ProjectSelector Exact(std::string id);
  static ProjectSelector Parse(std::string_view argument);

  Kind kind() const {
    return kind_;
  }

  const std::string& text() const {
    return text_;
  }

  bool Matches(std::string_view id) const;

 private:
  ProjectSelector(Kind kind, std::string text);

  Kind        kind_;
  std::string text_;
};

// Anchored match of `pattern` against `text`, '+' standing for any sequence.
bool WildcardMatch(std::string_view pattern, std::string_view text);

} // namespace projmgr::store
