#include "project_selector.hpp"

#include <utility>

namespace projmgr::store {

ProjectSelector::ProjectSelector(Kind kind, std::string text) : kind_(kind), text_(std::move(text)) {
}

ProjectSelector ProjectSelector::All() {
  return ProjectSelector(Kind::kAll, {});
}

ProjectSelector ProjectSelector::Exact(std::string id) {
  return ProjectSelector(Kind::kExact, std::move(id));
}

ProjectSelector ProjectSelector::Parse(std::string_view argument) {
  if (argument.empty()) {
    return All();
  }
  if (argument.find(kWildcardMarker) != std::string_view::npos) {
    return ProjectSelector(Kind::kWildcard, std::string(argument));
  }
  return Exact(std::string(argument));
}

bool ProjectSelector::Matches(std::string_view id) const {
  switch (kind_) {
    case Kind::kAll:
      return true;
    case Kind::kExact:
      return id == text_;
    case Kind::kWildcard:
      return WildcardMatch(text_, id);
  }
  return false;
}

bool WildcardMatch(std::string_view pattern, std::string_view text) {
  // Greedy matcher with backtracking to the most recent marker.
  size_t p = 0;
  size_t t = 0;
  size_t star_p = std::string_view::npos;
  size_t star_t = 0;

  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == kWildcardMarker) {
      star_p = p++;
      star_t = t;
    } else if (p < pattern.size() && pattern[p] == text[t]) {
      ++p;
      ++t;
    } else if (star_p != std::string_view::npos) {
      p = star_p + 1;
      t = ++star_t;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == kWildcardMarker) {
    ++p;
  }
  return p == pattern.size();
}

} // namespace projmgr::store
