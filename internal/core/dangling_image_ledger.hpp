#pragma once

#include <string>
#include <vector>

#include "internal/backend/container_backend.hpp"

namespace projmgr::core {

/*
  Images left dangling by per-image pulls during one invocation, grouped by
  project. Cleanup is offered once, after every target has been updated.
*/
class DanglingImageLedger {
 public:
  struct Entry {
    std::string                         project;
    std::vector<backend::DanglingImage> images;
  };

  void Record(const std::string& project, std::vector<backend::DanglingImage> images) {
    if (images.empty()) {
      return;
    }
    for (auto& entry : entries_) {
      if (entry.project == project) {
        entry.images.insert(entry.images.end(), images.begin(), images.end());
        return;
      }
    }
    entries_.push_back({project, std::move(images)});
  }

  bool Empty() const {
    return entries_.empty();
  }

  const std::vector<Entry>& entries() const {
    return entries_;
  }

  // Every recorded image id, first occurrence order.
  std::vector<std::string> Ids() const {
    std::vector<std::string> ids;
    for (const auto& entry : entries_) {
      for (const auto& image : entry.images) {
        bool seen = false;
        for (const auto& id : ids) {
          seen = seen || id == image.id;
        }
        if (!seen) {
          ids.push_back(image.id);
        }
      }
    }
    return ids;
  }

 private:
  std::vector<Entry> entries_;
};

} // namespace projmgr::core
