#pragma once

#include <string>
#include <utility>

namespace projmgr::model {

/*
  Outcome of a driver or orchestrator operation.

  Recoverable failures are reported and a batch moves on; Fatal ones abort the
  current target. Neither escapes as an exception.
*/

enum class Outcome {
  kSuccess = 0,
  kRecoverable,
  kFatal,
};

struct OpResult {
  Outcome     outcome = Outcome::kSuccess;
  std::string message;

  static OpResult Ok(std::string msg = {}) {
    return {Outcome::kSuccess, std::move(msg)};
  }

  static OpResult Recoverable(std::string msg) {
    return {Outcome::kRecoverable, std::move(msg)};
  }

  static OpResult Fatal(std::string msg) {
    return {Outcome::kFatal, std::move(msg)};
  }

  bool IsFatal() const {
    return outcome == Outcome::kFatal;
  }

  explicit operator bool() const {
    return outcome == Outcome::kSuccess;
  }
};

} // namespace projmgr::model
