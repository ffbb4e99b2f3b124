#pragma once

#include <cstdint>
#include <filesystem>

#include "internal/model/project_record.hpp"

namespace projmgr::model {

// How many log lines to show, or follow the stream.
struct LogRequest {
  bool     follow = true;
  uint32_t lines  = 10;
};

/*
  Per-invocation switches from the command line.
*/
struct RunOptions {
  bool quiet        = false;  // never prompt; treat every question as declined
  bool force        = false;  // skip confirmations, proceed
  bool status_check = true;   // confirm start/stop by polling
  bool internal_recursive = false;

  LogRequest logs;

  bool Interactive() const {
    return !quiet;
  }
};

/*
  Everything a driver needs to act on one project. Built once per target by the
  orchestrator and passed explicitly; drivers keep no per-project state.
*/
struct ProjectContext {
  ProjectRecord         record;
  std::filesystem::path managed_dir;
  // Equals record.path unless a sub-path selects a private full clone.
  std::filesystem::path gitpath;
  RunOptions            options;

  const std::string& id() const {
    return record.id;
  }

  const std::filesystem::path& path() const {
    return record.path;
  }
};

} // namespace projmgr::model
